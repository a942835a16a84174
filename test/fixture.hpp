#ifndef NFTMART_TEST_FIXTURE_HPP
#define NFTMART_TEST_FIXTURE_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>

#include <nftmart/nftmart.hpp>

#include <string>

namespace Catch {
template<>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) {
        return nftmart::amount_to_string(value);
    }
};
} // namespace Catch

namespace nftmart::test {

// REQUIRE_THROWS_MATCHES(expr, MarketError, HasCode(ErrorCode::NotListed))
class ErrorCodeMatcher : public Catch::Matchers::MatcherBase<MarketError> {
public:
    explicit ErrorCodeMatcher(ErrorCode code) : code_(code) {}

    bool match(const MarketError& error) const override { return error.code() == code_; }

    std::string describe() const override {
        return "has error code " + std::string(error_name(code_));
    }

private:
    ErrorCode code_;
};

inline ErrorCodeMatcher HasCode(ErrorCode code) { return ErrorCodeMatcher(code); }

constexpr Address OWNER = address_from_u64(0xA11CE);
constexpr Address SELLER = address_from_u64(0x5E11E7);
constexpr Address BUYER = address_from_u64(0xB0B);
constexpr Address BUYER2 = address_from_u64(0xCA7);
constexpr Address OPERATOR = address_from_u64(0x0BE7);
constexpr Address ARTIST = address_from_u64(0xA7715);
constexpr Address STRANGER = address_from_u64(0x5742);

// =============================================================================
// MarketFixture - chain, marketplace, one token of each standard
// =============================================================================
//
// usdc, punks (ERC-721), art (ERC-721 with ERC-2981) and items (ERC-1155) are
// deployed; native and usdc are allowed, every collection is whitelisted.

struct MarketFixture {
    Chain chain;
    Erc20Token usdc;
    Erc721Collection punks;
    Erc721Collection art;
    Erc1155Collection items;
    Marketplace market;

    MarketFixture()
        : usdc(chain, chain.allocate_address(), "USDC")
        , punks(chain, chain.allocate_address(), "Punks")
        , art(chain, chain.allocate_address(), "Art", true)
        , items(chain, chain.allocate_address(), "Items")
        , market(chain, chain.allocate_address(), config())
    {
        chain.mint_native(BUYER, 10'000);
        chain.mint_native(BUYER2, 10'000);
    }

    MarketConfig config() const {
        MarketConfig cfg;
        cfg.owner = OWNER;
        cfg.fee_rate = fees::FEE_1_PERCENT;
        cfg.allowed_currencies = {NATIVE, Currency{usdc.address()}};
        cfg.whitelisted_collections = {punks.address(), art.address(), items.address()};
        return cfg;
    }

    Currency usdc_currency() const { return Currency{usdc.address()}; }

    // =========================================================================
    // Setup helpers (direct token calls, outside any transaction)
    // =========================================================================

    void mint_erc721(Erc721Collection& collection, const Address& to, TokenId id) {
        collection.mint(to, id);
        collection.set_approval_for_all(to, market.address(), true);
    }

    void mint_erc1155(const Address& to, TokenId id, Amount amount) {
        items.mint(to, id, amount);
        items.set_approval_for_all(to, market.address(), true);
    }

    void fund_usdc(const Address& buyer, Amount amount) {
        usdc.mint(buyer, amount);
        usdc.approve(buyer, market.address(), amount);
    }

    static CreateListingParams erc721_listing(const Address& token, TokenId id, Amount price,
                                              const Currency& currency = NATIVE) {
        CreateListingParams params;
        params.token_address = token;
        params.token_id = id;
        params.price = price;
        params.currency = currency;
        return params;
    }

    CreateListingParams erc1155_listing(TokenId id, Amount quantity, Amount price,
                                        const Currency& currency = NATIVE,
                                        bool partial = false) const {
        CreateListingParams params;
        params.token_address = items.address();
        params.token_id = id;
        params.erc1155_quantity = quantity;
        params.price = price;
        params.currency = currency;
        params.partial_buy_enabled = partial;
        return params;
    }

    // =========================================================================
    // Transactions
    // =========================================================================

    uint64_t create(const Address& from, const CreateListingParams& params) {
        return chain.transact(from, market.address(), 0, [&](const CallContext& ctx) {
            return market.create_listing(ctx, params);
        });
    }

    // Minted, approved and listed ERC-721
    uint64_t list_erc721(Erc721Collection& collection, TokenId id, Amount price,
                         const Currency& currency = NATIVE) {
        mint_erc721(collection, SELLER, id);
        return create(SELLER, erc721_listing(collection.address(), id, price, currency));
    }

    PurchaseParams purchase_params(uint64_t listing_id, Amount quantity = 0) const {
        PurchaseParams params;
        params.listing_id = listing_id;
        params.expected = ExpectedTerms::of(market.get_listing(listing_id));
        params.erc1155_purchase_quantity = quantity;
        return params;
    }

    PurchaseRecord purchase(const Address& from, const PurchaseParams& params, Amount value) {
        return chain.transact(from, market.address(), value, [&](const CallContext& ctx) {
            return market.purchase_listing(ctx, params);
        });
    }

    // Buys at the stored terms
    PurchaseRecord buy(const Address& from, uint64_t listing_id, Amount value,
                       Amount quantity = 0) {
        return purchase(from, purchase_params(listing_id, quantity), value);
    }

    UpdateListingParams update_params(uint64_t listing_id) const {
        Listing listing = market.get_listing(listing_id);
        UpdateListingParams params;
        params.listing_id = listing_id;
        params.price = listing.price;
        params.currency = listing.currency;
        params.desired = listing.desired;
        params.erc1155_quantity = listing.asset.wire_quantity();
        params.buyer_whitelist_enabled = listing.buyer_whitelist_enabled;
        params.partial_buy_enabled = listing.partial_buy_enabled;
        return params;
    }

    void update(const Address& from, const UpdateListingParams& params) {
        chain.transact(from, market.address(), 0, [&](const CallContext& ctx) {
            market.update_listing(ctx, params);
        });
    }

    void cancel(const Address& from, uint64_t listing_id) {
        chain.transact(from, market.address(), 0, [&](const CallContext& ctx) {
            market.cancel_listing(ctx, listing_id);
        });
    }

    void clean(const Address& from, uint64_t listing_id) {
        chain.transact(from, market.address(), 0, [&](const CallContext& ctx) {
            market.clean_listing(ctx, listing_id);
        });
    }

    template<typename Fn>
    void as_owner(Fn&& fn) {
        chain.transact(OWNER, market.address(), 0, std::forward<Fn>(fn));
    }

    // Committed events with the given name
    std::vector<LogEntry> events_named(const std::string& name) const {
        std::vector<LogEntry> result;
        for (const auto& entry : chain.logs()) {
            if (entry.event == name) result.push_back(entry);
        }
        return result;
    }
};

} // namespace nftmart::test

#endif // NFTMART_TEST_FIXTURE_HPP
