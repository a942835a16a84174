#ifndef NFTMART_TYPES_HPP
#define NFTMART_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace nftmart {

// =============================================================================
// Account Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

constexpr Address ZERO_ADDRESS{};

inline bool is_zero(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

// Deterministic address from a small integer (big-endian in the low bytes)
constexpr Address address_from_u64(uint64_t value) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; throws std::invalid_argument on bad input
Address address_from_hex(std::string_view hex);

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        size_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return h;
    }
};

// =============================================================================
// Amounts
// =============================================================================

using Amount = unsigned __int128;
using TokenId = uint64_t;

constexpr Amount AMOUNT_MAX = ~static_cast<Amount>(0);

std::string amount_to_string(Amount value);

// Decimal digits only; throws std::invalid_argument / std::out_of_range
Amount amount_from_string(std::string_view text);

// =============================================================================
// Currency Type (Token Address, zero = native)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

inline const Currency NATIVE{};

// =============================================================================
// Fee Rates (fraction of FEE_DENOMINATOR)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_DENOMINATOR = 100000;
constexpr uint32_t FEE_1_PERCENT = 1000;
constexpr uint32_t DEFAULT_FEE_RATE = FEE_1_PERCENT;
}

// ERC-2981 reference royalties are expressed in basis points
constexpr uint32_t ROYALTY_DENOMINATOR = 10000;

} // namespace nftmart

namespace std {
template<>
struct hash<nftmart::Currency> {
    size_t operator()(const nftmart::Currency& c) const noexcept {
        return nftmart::AddressHash{}(c.addr);
    }
};
} // namespace std

#endif // NFTMART_TYPES_HPP
