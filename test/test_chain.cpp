// Chain execution semantics and the bundled token contracts

#include "fixture.hpp"

using namespace nftmart;
using namespace nftmart::test;

namespace {

class Counter : public Contract {
public:
    using Contract::Contract;

    int value = 0;
    int checkpoints = 0;

    void bump(int by) {
        value += by;
        chain().emit(address(), "Bumped", {{"value", value}});
    }

    Rollback checkpoint() override {
        ++checkpoints;
        return [this, saved = value]() { value = saved; };
    }
};

struct Recorder : LogListener {
    std::vector<std::string> seen;
    void on_log(const LogEntry& entry) override { seen.push_back(entry.event); }
};

} // namespace

TEST_CASE("Transactions commit or revert as a whole", "[chain]") {
    Chain chain;
    Counter counter(chain, chain.allocate_address());
    chain.mint_native(BUYER, 100);

    SECTION("Commit") {
        chain.transact(BUYER, counter.address(), 40, [&](const CallContext& ctx) {
            REQUIRE(ctx.sender == BUYER);
            REQUIRE(ctx.value == 40);
            counter.bump(1);
        });
        REQUIRE(counter.value == 1);
        REQUIRE(chain.balance_of(counter.address()) == 40);
        REQUIRE(chain.logs().size() == 1);
        REQUIRE(chain.logs()[0].index == 0);
        REQUIRE(chain.logs()[0].emitter == counter.address());
    }

    SECTION("Revert") {
        REQUIRE_THROWS_AS(
            chain.transact(BUYER, counter.address(), 40, [&](const CallContext&) {
                counter.bump(5);
                chain.send_native(counter.address(), SELLER, 10);
                throw MarketError(ErrorCode::Paused);
            }),
            MarketError);
        REQUIRE(counter.value == 0);
        REQUIRE(chain.balance_of(BUYER) == 100);
        REQUIRE(chain.balance_of(SELLER) == 0);
        REQUIRE(chain.logs().empty());
        REQUIRE_FALSE(chain.in_transaction());
    }

    SECTION("Insufficient value") {
        REQUIRE_THROWS_AS(
            chain.transact(BUYER, counter.address(), 101, [](const CallContext&) {}),
            ExecutionError);
    }

    SECTION("Nested transact is refused") {
        REQUIRE_THROWS_AS(
            chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) {
                chain.transact(BUYER, counter.address(), 0, [](const CallContext&) {});
            }),
            ExecutionError);
        REQUIRE_FALSE(chain.in_transaction());
    }

    SECTION("Return value") {
        int result = chain.transact(BUYER, counter.address(), 0, [](const CallContext&) {
            return 7;
        });
        REQUIRE(result == 7);
    }
}

TEST_CASE("try_call contains a failing inner call", "[chain]") {
    Chain chain;
    Counter counter(chain, chain.allocate_address());

    chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) {
        counter.bump(1);
        std::exception_ptr failure = chain.try_call([&] {
            counter.bump(10);
            throw TokenError("inner");
        });
        REQUIRE(failure);
        REQUIRE(counter.value == 1);

        REQUIRE_FALSE(chain.try_call([&] { counter.bump(2); }));
    });

    REQUIRE(counter.value == 3);
    REQUIRE(chain.logs().size() == 2);
}

TEST_CASE("static_call reports failure without capturing state", "[chain]") {
    Chain chain;
    Counter counter(chain, chain.allocate_address());

    chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) {
        int before = counter.checkpoints;

        int seen = -1;
        REQUIRE_FALSE(chain.static_call([&] { seen = counter.value; }));
        REQUIRE(seen == 0);

        std::exception_ptr failure = chain.static_call([] { throw TokenError("view"); });
        REQUIRE(failure);
        REQUIRE_THROWS_AS(std::rethrow_exception(failure), TokenError);
        REQUIRE(counter.checkpoints == before);

        REQUIRE_FALSE(chain.try_call([] {}));
        REQUIRE(counter.checkpoints == before + 1);
    });
}

TEST_CASE("Ownership queries leave contract state alone", "[chain][tokens]") {
    MarketFixture f;
    uint64_t id = f.list_erc721(f.punks, 1, 100);

    Counter counter(f.chain, f.chain.allocate_address());
    int before = counter.checkpoints;

    // Clean runs ownership and approval queries on a valid listing
    REQUIRE_THROWS_MATCHES(f.clean(STRANGER, id), MarketError,
                           HasCode(ErrorCode::ListingStillValid));
    // Only the transaction itself captured state
    REQUIRE(counter.checkpoints == before + 1);
}

TEST_CASE("Listeners see committed entries only", "[chain]") {
    Chain chain;
    Counter counter(chain, chain.allocate_address());
    Recorder recorder;
    chain.add_listener(&recorder);
    chain.add_listener(&recorder);

    chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) { counter.bump(1); });
    REQUIRE_THROWS(chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) {
        counter.bump(1);
        throw ExecutionError("revert");
    }));
    REQUIRE(recorder.seen == std::vector<std::string>{"Bumped"});

    chain.remove_listener(&recorder);
    chain.transact(BUYER, counter.address(), 0, [&](const CallContext&) { counter.bump(1); });
    REQUIRE(recorder.seen.size() == 1);
    REQUIRE(chain.logs().size() == 2);
}

TEST_CASE("Contract registration", "[chain]") {
    Chain chain;
    Address addr = chain.allocate_address();
    REQUIRE(addr != chain.allocate_address());

    {
        Counter counter(chain, addr);
        REQUIRE(chain.is_contract(addr));
        REQUIRE_THROWS_AS(Counter(chain, addr), ExecutionError);
    }
    REQUIRE_FALSE(chain.is_contract(addr));
    REQUIRE_THROWS_AS(Counter(chain, ZERO_ADDRESS), ExecutionError);
}

TEST_CASE("Marketplace rejects plain value transfers", "[chain]") {
    MarketFixture f;
    REQUIRE_THROWS_AS(
        f.chain.transact(BUYER, BUYER, 0, [&](const CallContext&) {
            f.chain.send_native(BUYER, f.market.address(), 5);
        }),
        ExecutionError);
    REQUIRE(f.chain.balance_of(f.market.address()) == 0);
    REQUIRE(f.chain.balance_of(BUYER) == 10'000);
}

TEST_CASE("ERC-721 collection rules", "[chain][tokens]") {
    Chain chain;
    Erc721Collection punks(chain, chain.allocate_address(), "Punks");
    punks.mint(SELLER, 1);

    REQUIRE(punks.owner_of(1) == SELLER);
    REQUIRE(punks.balance_of(SELLER) == 1);
    REQUIRE_THROWS_AS(punks.owner_of(2), TokenError);
    REQUIRE_THROWS_AS(punks.mint(BUYER, 1), TokenError);
    REQUIRE_THROWS_AS(punks.transfer_from(STRANGER, SELLER, BUYER, 1), TokenError);

    punks.approve(SELLER, OPERATOR, 1);
    REQUIRE(punks.get_approved(1) == OPERATOR);
    punks.transfer_from(OPERATOR, SELLER, BUYER, 1);
    REQUIRE(punks.owner_of(1) == BUYER);
    // Approval is cleared by the transfer
    REQUIRE(punks.get_approved(1) == ZERO_ADDRESS);

    REQUIRE(punks.supports_interface(interfaces::ERC721));
    REQUIRE_FALSE(punks.supports_interface(interfaces::ERC2981));
    REQUIRE_FALSE(punks.supports_interface(interfaces::ERC1155));
}

TEST_CASE("ERC-1155 collection rules", "[chain][tokens]") {
    Chain chain;
    Erc1155Collection items(chain, chain.allocate_address(), "Items");
    items.mint(SELLER, 4, 10);

    REQUIRE(items.balance_of(SELLER, 4) == 10);
    REQUIRE_THROWS_AS(items.safe_transfer_from(SELLER, SELLER, BUYER, 4, 11), TokenError);
    REQUIRE_THROWS_AS(items.safe_transfer_from(OPERATOR, SELLER, BUYER, 4, 1), TokenError);

    items.set_approval_for_all(SELLER, OPERATOR, true);
    items.safe_transfer_from(OPERATOR, SELLER, BUYER, 4, 3);
    REQUIRE(items.balance_of(SELLER, 4) == 7);
    REQUIRE(items.balance_of(BUYER, 4) == 3);
    REQUIRE(items.supports_interface(interfaces::ERC1155));
}

TEST_CASE("ERC-20 return conventions", "[chain][tokens]") {
    Chain chain;

    Erc20Token standard(chain, chain.allocate_address(), "STD", ReturnConvention::Standard);
    standard.mint(BUYER, 10);
    REQUIRE(standard.transfer(BUYER, SELLER, 4) == std::optional<bool>{true});
    REQUIRE_THROWS_AS(standard.transfer(BUYER, SELLER, 7), TokenError);

    Erc20Token silent(chain, chain.allocate_address(), "NRD", ReturnConvention::NoReturnData);
    silent.mint(BUYER, 10);
    REQUIRE_FALSE(silent.transfer(BUYER, SELLER, 4).has_value());
    REQUIRE_THROWS_AS(silent.transfer(BUYER, SELLER, 7), TokenError);

    Erc20Token lax(chain, chain.allocate_address(), "BAD", ReturnConvention::FalseOnFailure);
    lax.mint(BUYER, 10);
    REQUIRE(lax.transfer(BUYER, SELLER, 11) == std::optional<bool>{false});
    REQUIRE(lax.balance_of(BUYER) == 10);
    REQUIRE(lax.transfer_from(SELLER, BUYER, SELLER, 1) == std::optional<bool>{false});
}
