// =============================================================================
// types.cpp - Address and Amount conversions
// =============================================================================

#include "nftmart/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace nftmart {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string amount_to_string(Amount value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Amount amount_from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }

    Amount value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (AMOUNT_MAX - digit) / 10) {
            throw std::out_of_range("amount overflows 128 bits: " + std::string(text));
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace nftmart
