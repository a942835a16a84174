// =============================================================================
// config.cpp - JSON marketplace configuration
// =============================================================================

#include "nftmart/config.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace nftmart {

namespace {

using json = nlohmann::json;

Address parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        throw ConfigError("Config field '" + field + "' must be a hex address string");
    }
    try {
        return address_from_hex(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Config field '" + field + "': " + e.what());
    }
}

uint32_t parse_u32(const json& value, const std::string& field) {
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<int64_t>() >= 0)) {
        throw ConfigError("Config field '" + field + "' must be a non-negative integer");
    }
    uint64_t v = value.get<uint64_t>();
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("Config field '" + field + "' is out of range");
    }
    return static_cast<uint32_t>(v);
}

const json& require_array(const json& doc, const char* field) {
    const json& value = doc.at(field);
    if (!value.is_array()) {
        throw ConfigError(std::string("Config field '") + field + "' must be an array");
    }
    return value;
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Quiet: return "quiet";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "info";
}

LogLevel log_level_from_name(std::string_view name) {
    if (name == "quiet") return LogLevel::Quiet;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    throw ConfigError("Unknown log level: " + std::string(name));
}

MarketConfig MarketConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();
    return from_json(std::string_view{text});
}

MarketConfig MarketConfig::from_json(std::string_view text) {
    json doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("Config is not valid JSON");
    }
    return from_json(doc);
}

MarketConfig MarketConfig::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }
    if (!doc.contains("owner")) {
        throw ConfigError("Config field 'owner' is required");
    }

    MarketConfig config;
    config.owner = parse_address(doc.at("owner"), "owner");

    if (doc.contains("fee_rate")) {
        config.fee_rate = parse_u32(doc.at("fee_rate"), "fee_rate");
    }
    if (doc.contains("buyer_whitelist_max_batch")) {
        config.buyer_whitelist_max_batch =
            parse_u32(doc.at("buyer_whitelist_max_batch"), "buyer_whitelist_max_batch");
    }

    if (doc.contains("allowed_currencies")) {
        for (const auto& item : require_array(doc, "allowed_currencies")) {
            if (item.is_string() && item.get<std::string>() == "native") {
                config.allowed_currencies.push_back(NATIVE);
            } else {
                config.allowed_currencies.emplace_back(parse_address(item, "allowed_currencies"));
            }
        }
    }

    if (doc.contains("whitelisted_collections")) {
        for (const auto& item : require_array(doc, "whitelisted_collections")) {
            config.whitelisted_collections.push_back(
                parse_address(item, "whitelisted_collections"));
        }
    }

    if (doc.contains("log_level")) {
        const json& level = doc.at("log_level");
        if (!level.is_string()) {
            throw ConfigError("Config field 'log_level' must be a string");
        }
        config.log_level = log_level_from_name(level.get<std::string>());
    }

    if (doc.contains("paused")) {
        const json& paused = doc.at("paused");
        if (!paused.is_boolean()) {
            throw ConfigError("Config field 'paused' must be a boolean");
        }
        config.paused = paused.get<bool>();
    }

    config.validate();
    return config;
}

void MarketConfig::validate() const {
    if (is_zero(owner)) {
        throw ConfigError("Config field 'owner' must not be the zero address");
    }
    if (fee_rate > fees::FEE_DENOMINATOR) {
        throw ConfigError("Config field 'fee_rate' exceeds " +
                          std::to_string(fees::FEE_DENOMINATOR));
    }
    if (buyer_whitelist_max_batch == 0) {
        throw ConfigError("Config field 'buyer_whitelist_max_batch' must be positive");
    }
    for (size_t i = 0; i < allowed_currencies.size(); ++i) {
        for (size_t j = i + 1; j < allowed_currencies.size(); ++j) {
            if (allowed_currencies[i] == allowed_currencies[j]) {
                throw ConfigError("Config field 'allowed_currencies' lists " +
                                  to_hex(allowed_currencies[i].addr) + " twice");
            }
        }
    }
    for (size_t i = 0; i < whitelisted_collections.size(); ++i) {
        if (is_zero(whitelisted_collections[i])) {
            throw ConfigError("Config field 'whitelisted_collections' contains the zero address");
        }
        for (size_t j = i + 1; j < whitelisted_collections.size(); ++j) {
            if (whitelisted_collections[i] == whitelisted_collections[j]) {
                throw ConfigError("Config field 'whitelisted_collections' lists " +
                                  to_hex(whitelisted_collections[i]) + " twice");
            }
        }
    }
}

} // namespace nftmart
