// update_listing, cancel_listing and clean_listing

#include "fixture.hpp"

using namespace nftmart;
using namespace nftmart::test;

TEST_CASE("Update listing terms", "[update]") {
    MarketFixture f;
    uint64_t id = f.list_erc721(f.punks, 1, 100);

    SECTION("Seller changes price and currency") {
        auto params = f.update_params(id);
        params.price = 250;
        params.currency = f.usdc_currency();
        f.update(SELLER, params);

        Listing listing = f.market.get_listing(id);
        REQUIRE(listing.price == 250);
        REQUIRE(listing.currency == f.usdc_currency());
        REQUIRE(listing.seller == SELLER);

        auto updated = f.events_named(events::LISTING_UPDATED);
        REQUIRE(updated.size() == 1);
        REQUIRE(updated[0].data["price"] == "250");
        REQUIRE(updated[0].data["currency"] == to_hex(f.usdc.address()));
    }

    SECTION("Operator updates for the seller") {
        f.punks.set_approval_for_all(SELLER, OPERATOR, true);
        auto params = f.update_params(id);
        params.price = 300;
        f.update(OPERATOR, params);
        REQUIRE(f.market.get_listing(id).price == 300);
        REQUIRE(f.market.get_listing(id).seller == SELLER);
    }

    SECTION("Stranger") {
        REQUIRE_THROWS_MATCHES(f.update(STRANGER, f.update_params(id)), MarketError,
                               HasCode(ErrorCode::NotAuthorizedOperator));
    }

    SECTION("Unknown listing") {
        auto params = f.update_params(id);
        params.listing_id = 99;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::NotListed));
    }

    SECTION("Quantity on an ERC-721") {
        auto params = f.update_params(id);
        params.erc1155_quantity = 2;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::WrongQuantityParameter));
    }

    SECTION("Currency no longer allowed") {
        auto params = f.update_params(id);
        params.currency = Currency{address_from_u64(0xDA1)};
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::CurrencyNotAllowed));
        REQUIRE(f.market.get_listing(id).currency == NATIVE);
    }

    SECTION("Zero price without a swap") {
        auto params = f.update_params(id);
        params.price = 0;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::FreeListingsNotSupported));
    }

    SECTION("Token moved away") {
        f.punks.transfer_from(SELLER, SELLER, STRANGER, 1);
        REQUIRE_THROWS_MATCHES(f.update(SELLER, f.update_params(id)), MarketError,
                               HasCode(ErrorCode::SellerNotTokenOwner));
    }

    SECTION("Buyer list needs the whitelist") {
        auto params = f.update_params(id);
        params.allowed_buyers = {BUYER};
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::BuyerWhitelistDisabled));

        params.buyer_whitelist_enabled = true;
        f.update(SELLER, params);
        REQUIRE(f.market.is_buyer_whitelisted(id, BUYER));
        REQUIRE(f.events_named(events::BUYERS_ADDED).size() == 1);
    }

    SECTION("Paused") {
        f.as_owner([&](const CallContext& ctx) { f.market.pause(ctx); });
        REQUIRE_THROWS_MATCHES(f.update(SELLER, f.update_params(id)), MarketError,
                               HasCode(ErrorCode::Paused));
    }
}

TEST_CASE("Update ERC-1155 quantity", "[update]") {
    MarketFixture f;
    f.mint_erc1155(SELLER, 5, 10);
    uint64_t id = f.create(SELLER, f.erc1155_listing(5, 4, 400, NATIVE, true));

    SECTION("Within balance") {
        auto params = f.update_params(id);
        params.erc1155_quantity = 10;
        params.price = 1000;
        f.update(SELLER, params);
        REQUIRE(f.market.get_listing(id).asset == AssetAmount::erc1155(10));
    }

    SECTION("Above balance") {
        auto params = f.update_params(id);
        params.erc1155_quantity = 11;
        params.price = 1100;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::SellerInsufficientTokenBalance));
    }

    SECTION("Standard cannot change") {
        auto params = f.update_params(id);
        params.erc1155_quantity = 0;
        params.partial_buy_enabled = false;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::WrongQuantityParameter));
    }

    SECTION("Unit price must stay exact") {
        auto params = f.update_params(id);
        params.price = 401;
        REQUIRE_THROWS_MATCHES(f.update(SELLER, params), MarketError,
                               HasCode(ErrorCode::InvalidUnitPrice));
    }
}

TEST_CASE("Cancel listing", "[cancel]") {
    MarketFixture f;
    uint64_t id = f.list_erc721(f.punks, 1, 100);

    SECTION("By the seller") {
        f.cancel(SELLER, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());
        REQUIRE(f.market.listings_by_nft(f.punks.address(), 1).empty());

        auto canceled = f.events_named(events::LISTING_CANCELED);
        REQUIRE(canceled.size() == 1);
        REQUIRE(canceled[0].data["triggered_by"] == to_hex(SELLER));
        REQUIRE(canceled[0].data["reason"] == "canceled");

        // The uniqueness slot is free again
        uint64_t again = f.create(SELLER, MarketFixture::erc721_listing(f.punks.address(), 1, 120));
        REQUIRE(again == id + 1);
    }

    SECTION("By an operator") {
        f.punks.set_approval_for_all(SELLER, OPERATOR, true);
        f.cancel(OPERATOR, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());
    }

    SECTION("By the contract owner") {
        f.cancel(OWNER, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());
    }

    SECTION("By a stranger") {
        REQUIRE_THROWS_MATCHES(f.cancel(STRANGER, id), MarketError,
                               HasCode(ErrorCode::NotAuthorizedOperator));
        REQUIRE(f.market.find_listing(id).has_value());
    }

    SECTION("Twice") {
        f.cancel(SELLER, id);
        REQUIRE_THROWS_MATCHES(f.cancel(SELLER, id), MarketError,
                               HasCode(ErrorCode::NotListed));
    }

    SECTION("Allowed while paused") {
        f.as_owner([&](const CallContext& ctx) { f.market.pause(ctx); });
        REQUIRE_NOTHROW(f.cancel(SELLER, id));
    }

    SECTION("Buyer list is dropped with the listing") {
        f.chain.transact(SELLER, f.market.address(), 0, [&](const CallContext& ctx) {
            f.market.add_buyers(ctx, id, {BUYER});
        });
        f.cancel(SELLER, id);
        REQUIRE_FALSE(f.market.is_buyer_whitelisted(id, BUYER));
    }
}

TEST_CASE("Clean stale listings", "[clean]") {
    MarketFixture f;
    uint64_t id = f.list_erc721(f.punks, 1, 100);

    SECTION("Valid listing stays") {
        REQUIRE_THROWS_MATCHES(f.clean(STRANGER, id), MarketError,
                               HasCode(ErrorCode::ListingStillValid));
        REQUIRE(f.market.find_listing(id).has_value());
    }

    SECTION("Seller no longer owns the token") {
        f.punks.transfer_from(SELLER, SELLER, BUYER, 1);
        f.clean(STRANGER, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());

        auto canceled = f.events_named(events::LISTING_CANCELED);
        REQUIRE(canceled.size() == 1);
        REQUIRE(canceled[0].data["triggered_by"] == to_hex(STRANGER));
        REQUIRE(canceled[0].data["reason"] == "invalid");
    }

    SECTION("Marketplace approval revoked") {
        f.punks.set_approval_for_all(SELLER, f.market.address(), false);
        f.clean(STRANGER, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());
    }

    SECTION("Collection removed from the whitelist") {
        f.as_owner([&](const CallContext& ctx) {
            f.market.remove_collection(ctx, f.punks.address());
        });
        f.clean(STRANGER, id);
        REQUIRE_FALSE(f.market.find_listing(id).has_value());
    }

    SECTION("Burned token") {
        f.punks.burn(SELLER, 1);
        f.clean(BUYER, id);
        REQUIRE(f.market.listings_by_nft(f.punks.address(), 1).empty());
    }

    SECTION("Unknown listing") {
        REQUIRE_THROWS_MATCHES(f.clean(STRANGER, 77), MarketError,
                               HasCode(ErrorCode::NotListed));
    }
}

TEST_CASE("Clean ERC-1155 listing after a balance drop", "[clean]") {
    MarketFixture f;
    f.mint_erc1155(SELLER, 5, 10);
    uint64_t kept = f.create(SELLER, f.erc1155_listing(5, 3, 300));
    uint64_t stale = f.create(SELLER, f.erc1155_listing(5, 8, 800));

    f.items.safe_transfer_from(SELLER, SELLER, STRANGER, 5, 6);

    f.clean(STRANGER, stale);
    REQUIRE_FALSE(f.market.find_listing(stale).has_value());
    REQUIRE_THROWS_MATCHES(f.clean(STRANGER, kept), MarketError,
                           HasCode(ErrorCode::ListingStillValid));
    REQUIRE(f.market.listings_by_nft(f.items.address(), 5) == std::vector<uint64_t>{kept});
}
