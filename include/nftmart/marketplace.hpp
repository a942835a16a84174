#ifndef NFTMART_MARKETPLACE_HPP
#define NFTMART_MARKETPLACE_HPP

#include <functional>
#include <optional>
#include <vector>

#include "allowlist.hpp"
#include "buyer_whitelist.hpp"
#include "chain.hpp"
#include "config.hpp"
#include "events.hpp"
#include "listing.hpp"
#include "payment.hpp"
#include "reentrancy.hpp"
#include "registry.hpp"
#include "tokens.hpp"

namespace nftmart {

// =============================================================================
// Marketplace - non-custodial listing and settlement contract
// =============================================================================
//
// Every entry point takes the CallContext of the enclosing call and raises
// MarketError on failure; Chain::transact reverts all effects. Funds never
// rest on the marketplace: native value attached to a purchase is forwarded
// before the call returns, token payments are pulled from the buyer.

class Marketplace : public Contract {
public:
    Marketplace(Chain& chain, const Address& address, const MarketConfig& config);

    // =========================================================================
    // Listing Lifecycle
    // =========================================================================

    // Returns the new listing id
    uint64_t create_listing(const CallContext& ctx, const CreateListingParams& params);

    // Fee, royalty and seller are paid in that order after the asset moves
    PurchaseRecord purchase_listing(const CallContext& ctx, const PurchaseParams& params);

    void update_listing(const CallContext& ctx, const UpdateListingParams& params);

    // Seller, approved operator or contract owner
    void cancel_listing(const CallContext& ctx, uint64_t listing_id);

    // Permissionless; fails ListingStillValid unless the listing became stale
    void clean_listing(const CallContext& ctx, uint64_t listing_id);

    // =========================================================================
    // Buyer Whitelist (seller or operator)
    // =========================================================================

    void add_buyers(const CallContext& ctx, uint64_t listing_id,
                    const std::vector<Address>& buyers);
    void remove_buyers(const CallContext& ctx, uint64_t listing_id,
                       const std::vector<Address>& buyers);

    // =========================================================================
    // Administration (owner only)
    // =========================================================================

    void set_fee_rate(const CallContext& ctx, uint32_t fee_rate);
    void set_buyer_whitelist_max_batch(const CallContext& ctx, uint32_t max_batch);

    void add_currency(const CallContext& ctx, const Currency& currency);
    void remove_currency(const CallContext& ctx, const Currency& currency);

    void whitelist_collection(const CallContext& ctx, const Address& collection);
    void remove_collection(const CallContext& ctx, const Address& collection);
    void whitelist_collections(const CallContext& ctx, const std::vector<Address>& collections);
    void remove_collections(const CallContext& ctx, const std::vector<Address>& collections);

    void pause(const CallContext& ctx);
    void unpause(const CallContext& ctx);

    // =========================================================================
    // Queries
    // =========================================================================

    // Throws NotListed
    Listing get_listing(uint64_t listing_id) const;
    std::optional<Listing> find_listing(uint64_t listing_id) const;

    // Ascending ids; at most one for an ERC-721
    std::vector<uint64_t> listings_by_nft(const Address& collection, TokenId token_id) const;
    size_t listing_count() const { return state_.registry.size(); }

    uint32_t fee_rate() const { return state_.fee_rate; }
    uint64_t next_listing_id() const { return state_.registry.next_id(); }
    const Address& owner() const { return state_.owner; }
    bool paused() const { return state_.paused; }

    bool is_currency_allowed(const Currency& currency) const;
    std::vector<Currency> allowed_currencies() const;

    bool is_collection_whitelisted(const Address& collection) const;
    std::vector<Address> whitelisted_collections() const;

    bool is_buyer_whitelisted(uint64_t listing_id, const Address& buyer) const;
    uint32_t buyer_whitelist_max_batch() const { return state_.buyers.max_batch(); }

    bool reentrancy_locked() const { return guard_.locked(); }

    // =========================================================================
    // Contract
    // =========================================================================

    // Plain native transfers are rejected
    void receive(const CallContext& ctx) override;

    Rollback checkpoint() override;

private:
    struct State {
        Address owner;
        uint32_t fee_rate;
        bool paused;
        CurrencyAllowlist currencies;
        CollectionWhitelist collections;
        BuyerWhitelist buyers;
        ListingRegistry registry;
    };

    // Validated listing terms shared by create and update
    struct Terms {
        Amount price = 0;
        Currency currency;
        SwapTarget desired;
        AssetAmount asset;
        bool buyer_whitelist_enabled = false;
        bool partial_buy_enabled = false;
    };

    State state_;
    ReentrancyGuard guard_;
    PaymentDistributor payments_;

    void require_owner(const CallContext& ctx) const;
    void require_not_paused() const;
    const Listing& require_listing(uint64_t listing_id) const;

    // Token capability lookups; nullptr when the standard is not advertised
    IERC721* erc721_at(const Address& token) const;
    IERC1155* erc1155_at(const Address& token) const;

    // Standard of token_address for a call-surface quantity (0 = ERC-721)
    AssetAmount resolve_asset(const Address& token, Amount erc1155_quantity) const;

    // Read-only token queries; a reverting token answers "no"
    bool query(const std::function<bool()>& fn) const;
    std::optional<Address> query_owner(IERC721* token, TokenId token_id) const;

    // Holder of the listed asset on whose behalf ctx acts
    Address resolve_seller(const CallContext& ctx, const Address& token, TokenId token_id,
                           const AssetAmount& asset, const Address& erc1155_holder) const;

    bool is_operator(const Address& caller, const Address& holder, const Address& token,
                     TokenId token_id, const AssetAmount& asset) const;
    bool marketplace_approved(const Address& holder, const Address& token,
                              TokenId token_id, const AssetAmount& asset) const;
    bool seller_holds(const Listing& listing, Amount quantity) const;

    void validate_terms(const Address& token, TokenId token_id, const Terms& terms) const;
    void apply_buyer_list(uint64_t listing_id, bool enabled,
                          const std::vector<Address>& allowed_buyers);

    // Holder of the swap asset after authorization checks
    Address check_swap_asset(const CallContext& ctx, const Listing& listing,
                             const Address& holder_hint) const;
    void settle_swap(const CallContext& ctx, const Listing& listing, const Address& holder);

    void remove_listing(const Listing& listing, const Address& triggered_by,
                        CancelReason reason);
};

} // namespace nftmart

#endif // NFTMART_MARKETPLACE_HPP
