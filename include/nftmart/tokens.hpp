#ifndef NFTMART_TOKENS_HPP
#define NFTMART_TOKENS_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// ERC-165 Interface Identifiers
// =============================================================================

namespace interfaces {
constexpr uint32_t ERC165  = 0x01ffc9a7;
constexpr uint32_t ERC721  = 0x80ac58cd;
constexpr uint32_t ERC1155 = 0xd9b67a26;
constexpr uint32_t ERC2981 = 0x2a55205a;
}

// Revert raised by a token contract
class TokenError : public std::runtime_error {
public:
    explicit TokenError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Capability Interfaces
// =============================================================================
//
// Mutating calls take the calling address first (msg.sender inside the token).

class IERC20 {
public:
    virtual ~IERC20() = default;

    virtual Amount balance_of(const Address& owner) const = 0;
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

    // true/false as returned by the token; nullopt when it returns no data
    virtual std::optional<bool> transfer_from(const Address& caller, const Address& from,
                                              const Address& to, Amount amount) = 0;
};

class IERC721 {
public:
    virtual ~IERC721() = default;

    // Reverts for tokens that do not exist
    virtual Address owner_of(TokenId token_id) const = 0;
    virtual Address get_approved(TokenId token_id) const = 0;
    virtual bool is_approved_for_all(const Address& owner, const Address& op) const = 0;

    virtual void safe_transfer_from(const Address& caller, const Address& from,
                                    const Address& to, TokenId token_id) = 0;
};

class IERC1155 {
public:
    virtual ~IERC1155() = default;

    virtual Amount balance_of(const Address& owner, TokenId token_id) const = 0;
    virtual bool is_approved_for_all(const Address& owner, const Address& op) const = 0;

    virtual void safe_transfer_from(const Address& caller, const Address& from,
                                    const Address& to, TokenId token_id, Amount amount) = 0;
};

struct RoyaltyQuote {
    Address receiver;
    Amount amount = 0;
};

class IERC2981 {
public:
    virtual ~IERC2981() = default;

    virtual RoyaltyQuote royalty_info(TokenId token_id, Amount sale_price) const = 0;
};

} // namespace nftmart

#endif // NFTMART_TOKENS_HPP
