// =============================================================================
// marketplace.cpp - Listing lifecycle and settlement
// =============================================================================

#include "nftmart/marketplace.hpp"
#include "nftmart/errors.hpp"

#include <string>

namespace nftmart {

Marketplace::Marketplace(Chain& chain, const Address& address, const MarketConfig& config)
    : Contract(chain, address),
      state_{config.owner, config.fee_rate, config.paused,
             CurrencyAllowlist{}, CollectionWhitelist{},
             BuyerWhitelist(config.buyer_whitelist_max_batch), ListingRegistry{}},
      payments_(chain, address) {
    config.validate();

    for (const auto& currency : config.allowed_currencies) {
        state_.currencies.add(currency);
    }
    for (const auto& collection : config.whitelisted_collections) {
        state_.collections.add(collection);
    }
}

// =============================================================================
// Create
// =============================================================================

uint64_t Marketplace::create_listing(const CallContext& ctx, const CreateListingParams& params) {
    ReentrancyGuard::Scope lock(guard_);
    require_not_paused();

    if (!state_.collections.is_whitelisted(params.token_address)) {
        throw MarketError(ErrorCode::CollectionNotWhitelisted, to_hex(params.token_address));
    }

    AssetAmount asset = resolve_asset(params.token_address, params.erc1155_quantity);
    Address seller = resolve_seller(ctx, params.token_address, params.token_id, asset,
                                    params.erc1155_holder);

    if (!marketplace_approved(seller, params.token_address, params.token_id, asset)) {
        throw MarketError(ErrorCode::NotApprovedForMarketplace);
    }

    if (asset.is_erc721()) {
        if (auto existing = state_.registry.active_erc721(params.token_address, params.token_id)) {
            throw MarketError(ErrorCode::AlreadyListed, "listing " + std::to_string(*existing));
        }
    }

    Terms terms;
    terms.price = params.price;
    terms.currency = params.currency;
    terms.desired = params.desired;
    terms.asset = asset;
    terms.buyer_whitelist_enabled = params.buyer_whitelist_enabled;
    terms.partial_buy_enabled = params.partial_buy_enabled;
    validate_terms(params.token_address, params.token_id, terms);

    if (!params.buyer_whitelist_enabled && !params.allowed_buyers.empty()) {
        throw MarketError(ErrorCode::BuyerWhitelistDisabled);
    }

    Listing listing;
    listing.id = state_.registry.allocate_id();
    listing.fee_rate = state_.fee_rate;
    listing.buyer_whitelist_enabled = params.buyer_whitelist_enabled;
    listing.partial_buy_enabled = params.partial_buy_enabled;
    listing.token_address = params.token_address;
    listing.token_id = params.token_id;
    listing.asset = asset;
    listing.price = params.price;
    listing.seller = seller;
    listing.currency = params.currency;
    listing.desired = params.desired;

    state_.registry.put(listing);
    if (asset.is_erc721()) {
        state_.registry.set_unique_erc721(listing.token_address, listing.token_id, listing.id);
    }

    chain().emit(address(), events::LISTING_CREATED, listing_event(listing));
    apply_buyer_list(listing.id, params.buyer_whitelist_enabled, params.allowed_buyers);
    return listing.id;
}

// =============================================================================
// Purchase
// =============================================================================

PurchaseRecord Marketplace::purchase_listing(const CallContext& ctx, const PurchaseParams& params) {
    ReentrancyGuard::Scope lock(guard_);
    require_not_paused();

    Listing listing = require_listing(params.listing_id);

    // Front-run protection: the buyer must have seen the current terms
    const ExpectedTerms& expected = params.expected;
    if (expected.price != listing.price ||
        expected.currency != listing.currency ||
        expected.erc1155_quantity != listing.asset.wire_quantity() ||
        expected.desired != listing.desired) {
        throw MarketError(ErrorCode::ListingTermsChanged,
                          "listing " + std::to_string(listing.id));
    }

    Amount quantity = params.erc1155_purchase_quantity;
    Amount purchase_price = listing.price;
    bool partial = false;

    if (listing.asset.is_erc721()) {
        if (quantity != 0) {
            throw MarketError(ErrorCode::InvalidPurchaseQuantity, "ERC-721 is bought whole");
        }
    } else {
        if (quantity == 0 || quantity > listing.asset.quantity) {
            throw MarketError(ErrorCode::InvalidPurchaseQuantity, amount_to_string(quantity));
        }
        if (quantity < listing.asset.quantity) {
            if (!listing.partial_buy_enabled) {
                throw MarketError(ErrorCode::PartialBuyNotPossible);
            }
            partial = true;
            // Divide first: the unit price is exact for partial listings
            purchase_price = checked_mul(listing.price / listing.asset.quantity, quantity);
        }
    }

    if (listing.buyer_whitelist_enabled &&
        !state_.buyers.is_whitelisted(listing.id, ctx.sender)) {
        throw MarketError(ErrorCode::BuyerNotWhitelisted, to_hex(ctx.sender));
    }

    if (listing.currency.is_native()) {
        if (ctx.value != purchase_price) {
            throw MarketError(ErrorCode::PriceNotMet,
                              amount_to_string(ctx.value) + " != " +
                              amount_to_string(purchase_price));
        }
    } else if (ctx.value != 0) {
        throw MarketError(ErrorCode::WrongPaymentCurrency, "native value sent to a token listing");
    }

    if (ctx.sender == listing.seller) {
        throw MarketError(ErrorCode::SameBuyerAsSeller);
    }

    if (!seller_holds(listing, quantity)) {
        throw MarketError(listing.asset.is_erc721() ? ErrorCode::SellerNotTokenOwner
                                                    : ErrorCode::SellerInsufficientTokenBalance);
    }
    if (!marketplace_approved(listing.seller, listing.token_address, listing.token_id,
                              listing.asset)) {
        throw MarketError(ErrorCode::NotApprovedForMarketplace);
    }

    Address swap_holder{};
    if (listing.desired.active()) {
        swap_holder = check_swap_asset(ctx, listing, params.desired_erc1155_holder);
    } else if (!is_zero(params.desired_erc1155_holder)) {
        throw MarketError(ErrorCode::WrongErc1155HolderParameter, "listing has no swap");
    }

    std::optional<RoyaltyQuote> royalty =
        payments_.query_royalty(listing.token_address, listing.token_id, purchase_price);
    PaymentSplit split = compute_split(purchase_price, listing.fee_rate, royalty);

    // Effects
    if (partial) {
        Listing remaining = listing;
        remaining.asset.quantity -= quantity;
        remaining.price -= purchase_price;
        state_.registry.put(remaining);
    } else {
        state_.registry.erase(listing.id);
        if (listing.asset.is_erc721()) {
            state_.registry.clear_unique_erc721(listing.token_address, listing.token_id);
        }
        state_.buyers.erase_listing(listing.id);
    }

    // Interactions
    if (listing.desired.active()) {
        settle_swap(ctx, listing, swap_holder);
    }

    if (listing.asset.is_erc721()) {
        erc721_at(listing.token_address)->safe_transfer_from(
            address(), listing.seller, ctx.sender, listing.token_id);
    } else {
        erc1155_at(listing.token_address)->safe_transfer_from(
            address(), listing.seller, ctx.sender, listing.token_id, quantity);
    }

    payments_.distribute(listing.currency, ctx.sender, state_.owner, listing.seller, split);

    PurchaseRecord record;
    record.listing_id = listing.id;
    record.token_address = listing.token_address;
    record.token_id = listing.token_id;
    record.quantity = quantity;
    record.partial = partial;
    record.split = split;
    record.seller = listing.seller;
    record.buyer = ctx.sender;
    record.currency = listing.currency;
    record.desired = listing.desired;

    chain().emit(address(), events::LISTING_PURCHASED, purchase_event(record));
    return record;
}

// =============================================================================
// Update
// =============================================================================

void Marketplace::update_listing(const CallContext& ctx, const UpdateListingParams& params) {
    ReentrancyGuard::Scope lock(guard_);
    require_not_paused();

    Listing listing = require_listing(params.listing_id);

    if (ctx.sender != listing.seller &&
        !is_operator(ctx.sender, listing.seller, listing.token_address, listing.token_id,
                     listing.asset)) {
        throw MarketError(ErrorCode::NotAuthorizedOperator);
    }

    if (!state_.collections.is_whitelisted(listing.token_address)) {
        throw MarketError(ErrorCode::CollectionNotWhitelisted, to_hex(listing.token_address));
    }

    // The standard of a listing never changes
    AssetAmount asset;
    if (listing.asset.is_erc721()) {
        if (params.erc1155_quantity != 0) {
            throw MarketError(ErrorCode::WrongQuantityParameter, "ERC-721 listing takes no quantity");
        }
        asset = AssetAmount::erc721();
    } else {
        if (params.erc1155_quantity == 0) {
            throw MarketError(ErrorCode::WrongQuantityParameter, "ERC-1155 listing needs a quantity");
        }
        asset = AssetAmount::erc1155(params.erc1155_quantity);
    }

    Listing updated = listing;
    updated.asset = asset;

    if (!seller_holds(updated, asset.quantity)) {
        throw MarketError(asset.is_erc721() ? ErrorCode::SellerNotTokenOwner
                                            : ErrorCode::SellerInsufficientTokenBalance);
    }
    if (!marketplace_approved(listing.seller, listing.token_address, listing.token_id, asset)) {
        throw MarketError(ErrorCode::NotApprovedForMarketplace);
    }

    Terms terms;
    terms.price = params.price;
    terms.currency = params.currency;
    terms.desired = params.desired;
    terms.asset = asset;
    terms.buyer_whitelist_enabled = params.buyer_whitelist_enabled;
    terms.partial_buy_enabled = params.partial_buy_enabled;
    validate_terms(listing.token_address, listing.token_id, terms);

    if (!params.buyer_whitelist_enabled && !params.allowed_buyers.empty()) {
        throw MarketError(ErrorCode::BuyerWhitelistDisabled);
    }

    updated.fee_rate = state_.fee_rate;
    updated.price = params.price;
    updated.currency = params.currency;
    updated.desired = params.desired;
    updated.buyer_whitelist_enabled = params.buyer_whitelist_enabled;
    updated.partial_buy_enabled = params.partial_buy_enabled;

    state_.registry.put(updated);

    chain().emit(address(), events::LISTING_UPDATED, listing_event(updated));
    apply_buyer_list(updated.id, params.buyer_whitelist_enabled, params.allowed_buyers);
}

// =============================================================================
// Cancel / Clean
// =============================================================================

void Marketplace::cancel_listing(const CallContext& ctx, uint64_t listing_id) {
    ReentrancyGuard::Scope lock(guard_);

    Listing listing = require_listing(listing_id);

    bool allowed = ctx.sender == listing.seller || ctx.sender == state_.owner ||
                   is_operator(ctx.sender, listing.seller, listing.token_address,
                               listing.token_id, listing.asset);
    if (!allowed) {
        throw MarketError(ErrorCode::NotAuthorizedOperator);
    }

    remove_listing(listing, ctx.sender, CancelReason::Canceled);
}

void Marketplace::clean_listing(const CallContext& ctx, uint64_t listing_id) {
    ReentrancyGuard::Scope lock(guard_);

    Listing listing = require_listing(listing_id);

    bool valid = state_.collections.is_whitelisted(listing.token_address) &&
                 seller_holds(listing, listing.asset.quantity) &&
                 marketplace_approved(listing.seller, listing.token_address,
                                      listing.token_id, listing.asset);
    if (valid) {
        throw MarketError(ErrorCode::ListingStillValid, "listing " + std::to_string(listing_id));
    }

    remove_listing(listing, ctx.sender, CancelReason::Invalid);
}

// =============================================================================
// Buyer Whitelist
// =============================================================================

void Marketplace::add_buyers(const CallContext& ctx, uint64_t listing_id,
                             const std::vector<Address>& buyers) {
    ReentrancyGuard::Scope lock(guard_);

    const Listing& listing = require_listing(listing_id);
    if (ctx.sender != listing.seller &&
        !is_operator(ctx.sender, listing.seller, listing.token_address, listing.token_id,
                     listing.asset)) {
        throw MarketError(ErrorCode::NotAuthorizedOperator);
    }

    state_.buyers.add_many(listing_id, buyers);
    chain().emit(address(), events::BUYERS_ADDED, buyers_event(listing_id, buyers));
}

void Marketplace::remove_buyers(const CallContext& ctx, uint64_t listing_id,
                                const std::vector<Address>& buyers) {
    ReentrancyGuard::Scope lock(guard_);

    const Listing& listing = require_listing(listing_id);
    if (ctx.sender != listing.seller &&
        !is_operator(ctx.sender, listing.seller, listing.token_address, listing.token_id,
                     listing.asset)) {
        throw MarketError(ErrorCode::NotAuthorizedOperator);
    }

    state_.buyers.remove_many(listing_id, buyers);
    chain().emit(address(), events::BUYERS_REMOVED, buyers_event(listing_id, buyers));
}

// =============================================================================
// Administration
// =============================================================================

void Marketplace::set_fee_rate(const CallContext& ctx, uint32_t fee_rate) {
    require_owner(ctx);
    if (fee_rate > fees::FEE_DENOMINATOR) {
        throw MarketError(ErrorCode::InvalidFeeRate, std::to_string(fee_rate));
    }
    uint32_t previous = state_.fee_rate;
    state_.fee_rate = fee_rate;
    chain().emit(address(), events::FEE_RATE_UPDATED, fee_rate_event(previous, fee_rate));
}

void Marketplace::set_buyer_whitelist_max_batch(const CallContext& ctx, uint32_t max_batch) {
    require_owner(ctx);
    state_.buyers.set_max_batch(max_batch);
}

void Marketplace::add_currency(const CallContext& ctx, const Currency& currency) {
    require_owner(ctx);
    state_.currencies.add(currency);
    chain().emit(address(), events::CURRENCY_ALLOWED, currency_event(currency));
}

void Marketplace::remove_currency(const CallContext& ctx, const Currency& currency) {
    require_owner(ctx);
    state_.currencies.remove(currency);
    chain().emit(address(), events::CURRENCY_REMOVED, currency_event(currency));
}

void Marketplace::whitelist_collection(const CallContext& ctx, const Address& collection) {
    require_owner(ctx);
    state_.collections.add(collection);
    chain().emit(address(), events::COLLECTION_WHITELISTED, collection_event(collection));
}

void Marketplace::remove_collection(const CallContext& ctx, const Address& collection) {
    require_owner(ctx);
    state_.collections.remove(collection);
    chain().emit(address(), events::COLLECTION_REMOVED, collection_event(collection));
}

void Marketplace::whitelist_collections(const CallContext& ctx,
                                        const std::vector<Address>& collections) {
    if (collections.empty()) {
        throw MarketError(ErrorCode::EmptyBatch);
    }
    for (const auto& collection : collections) {
        whitelist_collection(ctx, collection);
    }
}

void Marketplace::remove_collections(const CallContext& ctx,
                                     const std::vector<Address>& collections) {
    if (collections.empty()) {
        throw MarketError(ErrorCode::EmptyBatch);
    }
    for (const auto& collection : collections) {
        remove_collection(ctx, collection);
    }
}

void Marketplace::pause(const CallContext& ctx) {
    require_owner(ctx);
    if (state_.paused) return;
    state_.paused = true;
    chain().emit(address(), events::PAUSED, pause_event(ctx.sender));
}

void Marketplace::unpause(const CallContext& ctx) {
    require_owner(ctx);
    if (!state_.paused) return;
    state_.paused = false;
    chain().emit(address(), events::UNPAUSED, pause_event(ctx.sender));
}

// =============================================================================
// Queries
// =============================================================================

Listing Marketplace::get_listing(uint64_t listing_id) const {
    return require_listing(listing_id);
}

std::optional<Listing> Marketplace::find_listing(uint64_t listing_id) const {
    return state_.registry.get(listing_id);
}

std::vector<uint64_t> Marketplace::listings_by_nft(const Address& collection,
                                                   TokenId token_id) const {
    return state_.registry.ids_for(collection, token_id);
}

bool Marketplace::is_currency_allowed(const Currency& currency) const {
    return state_.currencies.is_allowed(currency);
}

std::vector<Currency> Marketplace::allowed_currencies() const {
    return state_.currencies.list_all();
}

bool Marketplace::is_collection_whitelisted(const Address& collection) const {
    return state_.collections.is_whitelisted(collection);
}

std::vector<Address> Marketplace::whitelisted_collections() const {
    return state_.collections.list_all();
}

bool Marketplace::is_buyer_whitelisted(uint64_t listing_id, const Address& buyer) const {
    return state_.buyers.is_whitelisted(listing_id, buyer);
}

// =============================================================================
// Contract
// =============================================================================

void Marketplace::receive(const CallContext& ctx) {
    throw ExecutionError("Marketplace: plain native transfer from " + to_hex(ctx.sender) +
                         " rejected");
}

Contract::Rollback Marketplace::checkpoint() {
    return [this, saved = state_]() { state_ = saved; };
}

// =============================================================================
// Internal
// =============================================================================

void Marketplace::require_owner(const CallContext& ctx) const {
    if (ctx.sender != state_.owner) {
        throw MarketError(ErrorCode::NotOwner, to_hex(ctx.sender));
    }
}

void Marketplace::require_not_paused() const {
    if (state_.paused) {
        throw MarketError(ErrorCode::Paused);
    }
}

const Listing& Marketplace::require_listing(uint64_t listing_id) const {
    const Listing* listing = state_.registry.find(listing_id);
    if (!listing || !listing->active()) {
        throw MarketError(ErrorCode::NotListed, "listing " + std::to_string(listing_id));
    }
    return *listing;
}

IERC721* Marketplace::erc721_at(const Address& token) const {
    return chain().interface_at<IERC721>(token, interfaces::ERC721);
}

IERC1155* Marketplace::erc1155_at(const Address& token) const {
    return chain().interface_at<IERC1155>(token, interfaces::ERC1155);
}

AssetAmount Marketplace::resolve_asset(const Address& token, Amount erc1155_quantity) const {
    bool is_erc721 = erc721_at(token) != nullptr;
    bool is_erc1155 = erc1155_at(token) != nullptr;

    if (!is_erc721 && !is_erc1155) {
        throw MarketError(ErrorCode::NotSupportedTokenStandard, to_hex(token));
    }
    if (erc1155_quantity == 0) {
        if (!is_erc721) {
            throw MarketError(ErrorCode::WrongQuantityParameter, "ERC-1155 needs a quantity");
        }
        return AssetAmount::erc721();
    }
    if (!is_erc1155) {
        throw MarketError(ErrorCode::WrongQuantityParameter, "ERC-721 takes no quantity");
    }
    return AssetAmount::erc1155(erc1155_quantity);
}

bool Marketplace::query(const std::function<bool()>& fn) const {
    bool answer = false;
    std::exception_ptr failure = chain().static_call([&] { answer = fn(); });
    return !failure && answer;
}

std::optional<Address> Marketplace::query_owner(IERC721* token, TokenId token_id) const {
    if (!token) return std::nullopt;

    Address owner{};
    std::exception_ptr failure = chain().static_call([&] { owner = token->owner_of(token_id); });
    if (failure) return std::nullopt;
    return owner;
}

Address Marketplace::resolve_seller(const CallContext& ctx, const Address& token,
                                    TokenId token_id, const AssetAmount& asset,
                                    const Address& erc1155_holder) const {
    if (asset.is_erc721()) {
        if (!is_zero(erc1155_holder)) {
            throw MarketError(ErrorCode::WrongErc1155HolderParameter, "holder is for ERC-1155 only");
        }
        std::optional<Address> owner = query_owner(erc721_at(token), token_id);
        if (!owner) {
            throw MarketError(ErrorCode::NotAuthorizedOperator, "token has no owner");
        }
        if (ctx.sender != *owner && !is_operator(ctx.sender, *owner, token, token_id, asset)) {
            throw MarketError(ErrorCode::NotAuthorizedOperator);
        }
        return *owner;
    }

    // An operator cannot be mapped back to its holders, so it names one
    Address holder = is_zero(erc1155_holder) ? ctx.sender : erc1155_holder;
    if (holder != ctx.sender && !is_operator(ctx.sender, holder, token, token_id, asset)) {
        throw MarketError(ErrorCode::NotAuthorizedOperator);
    }

    IERC1155* erc1155 = erc1155_at(token);
    bool enough = query([&] { return erc1155->balance_of(holder, token_id) >= asset.quantity; });
    if (!enough) {
        throw MarketError(ErrorCode::SellerInsufficientTokenBalance, to_hex(holder));
    }
    return holder;
}

bool Marketplace::is_operator(const Address& caller, const Address& holder, const Address& token,
                              TokenId token_id, const AssetAmount& asset) const {
    if (asset.is_erc721()) {
        IERC721* erc721 = erc721_at(token);
        if (!erc721) return false;
        return query([&] {
            return erc721->get_approved(token_id) == caller ||
                   erc721->is_approved_for_all(holder, caller);
        });
    }

    IERC1155* erc1155 = erc1155_at(token);
    if (!erc1155) return false;
    return query([&] { return erc1155->is_approved_for_all(holder, caller); });
}

bool Marketplace::marketplace_approved(const Address& holder, const Address& token,
                                       TokenId token_id, const AssetAmount& asset) const {
    return is_operator(address(), holder, token, token_id, asset);
}

bool Marketplace::seller_holds(const Listing& listing, Amount quantity) const {
    if (listing.asset.is_erc721()) {
        std::optional<Address> owner = query_owner(erc721_at(listing.token_address),
                                                   listing.token_id);
        return owner && *owner == listing.seller;
    }

    IERC1155* erc1155 = erc1155_at(listing.token_address);
    if (!erc1155) return false;
    return query([&] {
        return erc1155->balance_of(listing.seller, listing.token_id) >= quantity;
    });
}

void Marketplace::validate_terms(const Address& token, TokenId token_id,
                                 const Terms& terms) const {
    if (!state_.currencies.is_allowed(terms.currency)) {
        throw MarketError(ErrorCode::CurrencyNotAllowed, to_hex(terms.currency.addr));
    }

    if (!terms.desired.active()) {
        if (terms.desired.token_id != 0 || terms.desired.erc1155_quantity != 0) {
            throw MarketError(ErrorCode::InvalidNoSwapParameters);
        }
        if (terms.price == 0) {
            throw MarketError(ErrorCode::FreeListingsNotSupported);
        }
    } else {
        if (terms.desired.token == token && terms.desired.token_id == token_id) {
            throw MarketError(ErrorCode::NoSwapForSameToken);
        }
        resolve_asset(terms.desired.token, terms.desired.erc1155_quantity);
        if (terms.partial_buy_enabled) {
            throw MarketError(ErrorCode::PartialBuyNotPossible, "swap listings are sold whole");
        }
    }

    if (terms.partial_buy_enabled) {
        if (!terms.asset.is_erc1155() || terms.asset.quantity <= 1) {
            throw MarketError(ErrorCode::PartialBuyNotPossible,
                              "needs an ERC-1155 quantity above one");
        }
        if (terms.price % terms.asset.quantity != 0) {
            throw MarketError(ErrorCode::InvalidUnitPrice,
                              amount_to_string(terms.price) + " % " +
                              amount_to_string(terms.asset.quantity));
        }
    }
}

void Marketplace::apply_buyer_list(uint64_t listing_id, bool enabled,
                                   const std::vector<Address>& allowed_buyers) {
    if (!enabled || allowed_buyers.empty()) return;

    state_.buyers.add_many(listing_id, allowed_buyers);
    chain().emit(address(), events::BUYERS_ADDED, buyers_event(listing_id, allowed_buyers));
}

Address Marketplace::check_swap_asset(const CallContext& ctx, const Listing& listing,
                                      const Address& holder_hint) const {
    const SwapTarget& desired = listing.desired;
    AssetAmount asset = resolve_asset(desired.token, desired.erc1155_quantity);

    Address holder{};
    if (asset.is_erc721()) {
        if (!is_zero(holder_hint)) {
            throw MarketError(ErrorCode::WrongErc1155HolderParameter, "swap asset is ERC-721");
        }
        std::optional<Address> owner = query_owner(erc721_at(desired.token), desired.token_id);
        if (!owner) {
            throw MarketError(ErrorCode::NotAuthorizedOperator, "swap token has no owner");
        }
        holder = *owner;
    } else {
        if (is_zero(holder_hint)) {
            throw MarketError(ErrorCode::WrongErc1155HolderParameter, "swap holder required");
        }
        holder = holder_hint;
        IERC1155* erc1155 = erc1155_at(desired.token);
        bool enough = query([&] {
            return erc1155->balance_of(holder, desired.token_id) >= desired.erc1155_quantity;
        });
        if (!enough) {
            throw MarketError(ErrorCode::WrongErc1155HolderParameter,
                              to_hex(holder) + " lacks the swap quantity");
        }
    }

    if (holder != ctx.sender &&
        !is_operator(ctx.sender, holder, desired.token, desired.token_id, asset)) {
        throw MarketError(ErrorCode::NotAuthorizedOperator, "buyer cannot move the swap asset");
    }
    if (!marketplace_approved(holder, desired.token, desired.token_id, asset)) {
        throw MarketError(ErrorCode::NotApprovedForMarketplace, "swap asset");
    }
    return holder;
}

void Marketplace::settle_swap(const CallContext& ctx, const Listing& listing,
                              const Address& holder) {
    const SwapTarget& desired = listing.desired;

    if (desired.erc1155_quantity > 0) {
        erc1155_at(desired.token)->safe_transfer_from(
            address(), holder, listing.seller, desired.token_id, desired.erc1155_quantity);
        return;
    }

    erc721_at(desired.token)->safe_transfer_from(address(), holder, listing.seller,
                                                 desired.token_id);

    // A listing of the handed-over token by its previous owner is now stale
    if (auto stale_id = state_.registry.active_erc721(desired.token, desired.token_id)) {
        Listing stale = *state_.registry.find(*stale_id);
        if (stale.seller != listing.seller) {
            remove_listing(stale, ctx.sender, CancelReason::SwapSettled);
        }
    }
}

void Marketplace::remove_listing(const Listing& listing, const Address& triggered_by,
                                 CancelReason reason) {
    state_.registry.erase(listing.id);
    if (listing.asset.is_erc721()) {
        auto indexed = state_.registry.active_erc721(listing.token_address, listing.token_id);
        if (indexed && *indexed == listing.id) {
            state_.registry.clear_unique_erc721(listing.token_address, listing.token_id);
        }
    }
    state_.buyers.erase_listing(listing.id);

    chain().emit(address(), events::LISTING_CANCELED, cancel_event(listing, triggered_by, reason));
}

} // namespace nftmart
