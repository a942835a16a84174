// Listing storage and its secondary indices

#include "fixture.hpp"

using namespace nftmart;
using namespace nftmart::test;

namespace {

Listing make_listing(uint64_t id, const Address& token, TokenId token_id, AssetAmount asset) {
    Listing listing;
    listing.id = id;
    listing.token_address = token;
    listing.token_id = token_id;
    listing.asset = asset;
    listing.price = 100;
    listing.seller = SELLER;
    return listing;
}

} // namespace

TEST_CASE("ListingRegistry ids and lookups", "[registry]") {
    ListingRegistry registry;
    Address token = address_from_u64(0x721);

    REQUIRE(registry.next_id() == 1);
    uint64_t first = registry.allocate_id();
    uint64_t second = registry.allocate_id();
    REQUIRE(first == 1);
    REQUIRE(second == 2);
    REQUIRE(registry.next_id() == 3);

    registry.put(make_listing(first, token, 5, AssetAmount::erc721()));
    REQUIRE(registry.find(first) != nullptr);
    REQUIRE(registry.get(first)->token_id == 5);
    REQUIRE_FALSE(registry.get(second).has_value());

    registry.erase(first);
    REQUIRE(registry.find(first) == nullptr);
    REQUIRE(registry.size() == 0);

    // Ids are never reused
    REQUIRE(registry.allocate_id() == 3);
}

TEST_CASE("ListingRegistry indexes listings per NFT", "[registry]") {
    ListingRegistry registry;
    Address token = address_from_u64(0x1155);

    registry.put(make_listing(4, token, 9, AssetAmount::erc1155(5)));
    registry.put(make_listing(2, token, 9, AssetAmount::erc1155(3)));
    registry.put(make_listing(3, token, 10, AssetAmount::erc1155(1)));

    REQUIRE(registry.ids_for(token, 9) == std::vector<uint64_t>{2, 4});
    REQUIRE(registry.ids_for(token, 10) == std::vector<uint64_t>{3});
    REQUIRE(registry.ids_for(token, 11).empty());

    // Overwriting keeps a single entry
    Listing changed = *registry.find(4);
    changed.price = 500;
    registry.put(changed);
    REQUIRE(registry.ids_for(token, 9) == std::vector<uint64_t>{2, 4});

    registry.erase(2);
    REQUIRE(registry.ids_for(token, 9) == std::vector<uint64_t>{4});
    registry.erase(4);
    REQUIRE(registry.ids_for(token, 9).empty());
}

TEST_CASE("ListingRegistry ERC-721 uniqueness index", "[registry]") {
    ListingRegistry registry;
    Address token = address_from_u64(0x721);

    REQUIRE_FALSE(registry.active_erc721(token, 1).has_value());

    registry.set_unique_erc721(token, 1, 7);
    REQUIRE(registry.active_erc721(token, 1) == std::optional<uint64_t>{7});
    REQUIRE_FALSE(registry.active_erc721(token, 2).has_value());

    registry.clear_unique_erc721(token, 1);
    REQUIRE_FALSE(registry.active_erc721(token, 1).has_value());
}

TEST_CASE("AssetAmount maps the zero quantity to ERC-721", "[registry][listing]") {
    REQUIRE(AssetAmount::from_wire(0).is_erc721());
    REQUIRE(AssetAmount::from_wire(0).wire_quantity() == 0);

    AssetAmount units = AssetAmount::from_wire(12);
    REQUIRE(units.is_erc1155());
    REQUIRE(units.quantity == 12);
    REQUIRE(units.wire_quantity() == 12);
}

TEST_CASE("Marketplace query facet", "[registry][getters]") {
    MarketFixture f;

    REQUIRE(f.market.owner() == OWNER);
    REQUIRE(f.market.fee_rate() == fees::FEE_1_PERCENT);
    REQUIRE(f.market.next_listing_id() == 1);
    REQUIRE(f.market.buyer_whitelist_max_batch() == 300);
    REQUIRE_FALSE(f.market.paused());
    REQUIRE(f.market.whitelisted_collections().size() == 3);

    REQUIRE_THROWS_MATCHES(f.market.get_listing(1), MarketError, HasCode(ErrorCode::NotListed));
    REQUIRE_FALSE(f.market.find_listing(1).has_value());

    f.mint_erc1155(SELLER, 3, 10);
    uint64_t a = f.create(SELLER, f.erc1155_listing(3, 4, 400));
    uint64_t b = f.create(SELLER, f.erc1155_listing(3, 6, 600));
    uint64_t c = f.list_erc721(f.punks, 1, 100);

    REQUIRE(f.market.listings_by_nft(f.items.address(), 3) == std::vector<uint64_t>{a, b});
    REQUIRE(f.market.listings_by_nft(f.punks.address(), 1) == std::vector<uint64_t>{c});
    REQUIRE(f.market.next_listing_id() == 4);
    REQUIRE(f.market.listing_count() == 3);

    Listing listing = f.market.get_listing(b);
    REQUIRE(listing.seller == SELLER);
    REQUIRE(listing.asset == AssetAmount::erc1155(6));
    REQUIRE(listing.price == 600);
    REQUIRE(listing.fee_rate == fees::FEE_1_PERCENT);
}
