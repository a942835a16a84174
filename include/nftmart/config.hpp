#ifndef NFTMART_CONFIG_HPP
#define NFTMART_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace nftmart {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class LogLevel : uint8_t {
    Quiet = 0,
    Info = 1,
    Debug = 2
};

const char* log_level_name(LogLevel level);
LogLevel log_level_from_name(std::string_view name);

// =============================================================================
// MarketConfig - deployment parameters of a Marketplace
// =============================================================================

struct MarketConfig {
    Address owner{};                            // also the fee recipient
    uint32_t fee_rate = fees::DEFAULT_FEE_RATE;
    uint32_t buyer_whitelist_max_batch = 300;
    std::vector<Currency> allowed_currencies;
    std::vector<Address> whitelisted_collections;
    LogLevel log_level = LogLevel::Info;
    bool paused = false;

    // Throws ConfigError naming the offending field
    static MarketConfig from_file(std::string_view path);
    static MarketConfig from_json(std::string_view text);
    static MarketConfig from_json(const nlohmann::json& doc);

    // Range checks shared by every loader
    void validate() const;
};

} // namespace nftmart

#endif // NFTMART_CONFIG_HPP
