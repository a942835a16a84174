#ifndef NFTMART_ERC20_HPP
#define NFTMART_ERC20_HPP

#include <string>
#include <unordered_map>

#include "chain.hpp"
#include "tokens.hpp"

namespace nftmart {

// How a token reports the outcome of transfer/transfer_from
enum class ReturnConvention : uint8_t {
    Standard = 0,        // returns true, reverts on failure
    NoReturnData = 1,    // returns nothing, reverts on failure
    FalseOnFailure = 2   // returns false instead of reverting
};

// =============================================================================
// Erc20Token - fungible payment token
// =============================================================================

class Erc20Token : public Contract, public IERC20 {
public:
    Erc20Token(Chain& chain, const Address& address, std::string symbol,
               ReturnConvention convention = ReturnConvention::Standard);

    const std::string& symbol() const { return symbol_; }
    ReturnConvention convention() const { return convention_; }
    Amount total_supply() const { return state_.total_supply; }

    void mint(const Address& to, Amount amount);
    bool approve(const Address& caller, const Address& spender, Amount amount);
    std::optional<bool> transfer(const Address& caller, const Address& to, Amount amount);

    // IERC20
    Amount balance_of(const Address& owner) const override;
    Amount allowance(const Address& owner, const Address& spender) const override;
    std::optional<bool> transfer_from(const Address& caller, const Address& from,
                                      const Address& to, Amount amount) override;

    Rollback checkpoint() override;

private:
    using AllowanceMap = std::unordered_map<Address, Amount, AddressHash>;

    struct State {
        std::unordered_map<Address, Amount, AddressHash> balances;
        std::unordered_map<Address, AllowanceMap, AddressHash> allowances;
        Amount total_supply = 0;
    };

    std::string symbol_;
    ReturnConvention convention_;
    State state_;

    // Applies the convention to a failed transfer: false or revert
    std::optional<bool> fail(const std::string& reason) const;
    std::optional<bool> succeed() const;
    bool move_balance(const Address& from, const Address& to, Amount amount);
};

} // namespace nftmart

#endif // NFTMART_ERC20_HPP
