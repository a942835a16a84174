#ifndef NFTMART_EVENTS_HPP
#define NFTMART_EVENTS_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "listing.hpp"
#include "payment.hpp"

namespace nftmart {

// =============================================================================
// Event Names
// =============================================================================

namespace events {
constexpr const char* LISTING_CREATED = "ListingCreated";
constexpr const char* LISTING_UPDATED = "ListingUpdated";
constexpr const char* LISTING_PURCHASED = "ListingPurchased";
constexpr const char* LISTING_CANCELED = "ListingCanceled";
constexpr const char* FEE_RATE_UPDATED = "FeeRateUpdated";
constexpr const char* CURRENCY_ALLOWED = "CurrencyAllowed";
constexpr const char* CURRENCY_REMOVED = "CurrencyRemoved";
constexpr const char* COLLECTION_WHITELISTED = "CollectionWhitelisted";
constexpr const char* COLLECTION_REMOVED = "CollectionRemoved";
constexpr const char* BUYERS_ADDED = "BuyersAdded";
constexpr const char* BUYERS_REMOVED = "BuyersRemoved";
constexpr const char* PAUSED = "Paused";
constexpr const char* UNPAUSED = "Unpaused";
}

// Why a listing left the registry without a sale
enum class CancelReason : uint8_t {
    Canceled = 0,       // seller, operator or owner
    Invalid = 1,        // removed by clean_listing
    SwapSettled = 2     // listed ERC-721 was handed over in a swap
};

const char* cancel_reason_name(CancelReason reason);

// Settled terms of one purchase
struct PurchaseRecord {
    uint64_t listing_id = 0;
    Address token_address{};
    TokenId token_id = 0;
    Amount quantity = 0;            // 0 for ERC-721
    bool partial = false;
    PaymentSplit split;
    Address seller{};
    Address buyer{};
    Currency currency;
    SwapTarget desired;
};

// =============================================================================
// Payload Builders
// =============================================================================

nlohmann::json listing_event(const Listing& listing);
nlohmann::json purchase_event(const PurchaseRecord& record);
nlohmann::json cancel_event(const Listing& listing, const Address& triggered_by,
                            CancelReason reason);
nlohmann::json fee_rate_event(uint32_t previous, uint32_t current);
nlohmann::json currency_event(const Currency& currency);
nlohmann::json collection_event(const Address& collection);
nlohmann::json buyers_event(uint64_t listing_id, const std::vector<Address>& buyers);
nlohmann::json pause_event(const Address& account);

} // namespace nftmart

#endif // NFTMART_EVENTS_HPP
