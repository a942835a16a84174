#ifndef NFTMART_LISTING_HPP
#define NFTMART_LISTING_HPP

#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// Listed Asset Kind
// =============================================================================

enum class TokenStandard : uint8_t {
    ERC721 = 0,
    ERC1155 = 1
};

// Tagged quantity. On the call surface a quantity of 0 means "ERC-721".
struct AssetAmount {
    TokenStandard standard = TokenStandard::ERC721;
    Amount quantity = 0;

    static AssetAmount erc721() { return {TokenStandard::ERC721, 0}; }
    static AssetAmount erc1155(Amount quantity) { return {TokenStandard::ERC1155, quantity}; }
    static AssetAmount from_wire(Amount quantity) {
        return quantity == 0 ? erc721() : erc1155(quantity);
    }

    bool is_erc721() const { return standard == TokenStandard::ERC721; }
    bool is_erc1155() const { return standard == TokenStandard::ERC1155; }
    Amount wire_quantity() const { return is_erc1155() ? quantity : 0; }

    bool operator==(const AssetAmount& other) const {
        return standard == other.standard && quantity == other.quantity;
    }
};

// Asset the buyer must hand over; unset token means a plain currency sale
struct SwapTarget {
    Address token{};
    TokenId token_id = 0;
    Amount erc1155_quantity = 0;

    bool active() const { return !is_zero(token); }

    bool operator==(const SwapTarget& other) const {
        return token == other.token && token_id == other.token_id &&
               erc1155_quantity == other.erc1155_quantity;
    }
    bool operator!=(const SwapTarget& other) const { return !(*this == other); }
};

// =============================================================================
// Listing
// =============================================================================

struct Listing {
    uint64_t id = 0;
    uint32_t fee_rate = 0;              // snapshot, out of FEE_DENOMINATOR
    bool buyer_whitelist_enabled = false;
    bool partial_buy_enabled = false;
    Address token_address{};
    TokenId token_id = 0;
    AssetAmount asset;
    Amount price = 0;                   // for the whole remaining quantity
    Address seller{};                   // zero = deleted
    Currency currency;
    SwapTarget desired;

    bool active() const { return !is_zero(seller); }
};

// =============================================================================
// Call Parameters
// =============================================================================

struct CreateListingParams {
    Address token_address{};
    TokenId token_id = 0;
    Address erc1155_holder{};           // required when an operator lists ERC-1155
    Amount price = 0;
    Currency currency;
    SwapTarget desired;
    Amount erc1155_quantity = 0;        // 0 = ERC-721
    bool buyer_whitelist_enabled = false;
    bool partial_buy_enabled = false;
    std::vector<Address> allowed_buyers;
};

struct UpdateListingParams {
    uint64_t listing_id = 0;
    Amount price = 0;
    Currency currency;
    SwapTarget desired;
    Amount erc1155_quantity = 0;
    bool buyer_whitelist_enabled = false;
    bool partial_buy_enabled = false;
    std::vector<Address> allowed_buyers;
};

// Terms the buyer observed; any difference from storage aborts the purchase
struct ExpectedTerms {
    Amount price = 0;
    Currency currency;
    Amount erc1155_quantity = 0;
    SwapTarget desired;

    static ExpectedTerms of(const Listing& listing) {
        ExpectedTerms terms;
        terms.price = listing.price;
        terms.currency = listing.currency;
        terms.erc1155_quantity = listing.asset.wire_quantity();
        terms.desired = listing.desired;
        return terms;
    }
};

struct PurchaseParams {
    uint64_t listing_id = 0;
    ExpectedTerms expected;
    Amount erc1155_purchase_quantity = 0;   // 0 for ERC-721
    Address desired_erc1155_holder{};       // holder of the swap asset
};

// JSON snapshot used in events; amounts are decimal strings
void to_json(nlohmann::json& j, const SwapTarget& target);
void to_json(nlohmann::json& j, const Listing& listing);

} // namespace nftmart

#endif // NFTMART_LISTING_HPP
