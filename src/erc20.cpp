#include "nftmart/erc20.hpp"

namespace nftmart {

Erc20Token::Erc20Token(Chain& chain, const Address& address, std::string symbol,
                       ReturnConvention convention)
    : Contract(chain, address), symbol_(std::move(symbol)), convention_(convention) {}

void Erc20Token::mint(const Address& to, Amount amount) {
    if (is_zero(to)) {
        throw TokenError(symbol_ + ": mint to the zero address");
    }
    if (state_.total_supply > AMOUNT_MAX - amount) {
        throw TokenError(symbol_ + ": supply overflow");
    }
    state_.total_supply += amount;
    state_.balances[to] += amount;
}

bool Erc20Token::approve(const Address& caller, const Address& spender, Amount amount) {
    if (is_zero(spender)) {
        throw TokenError(symbol_ + ": approve to the zero address");
    }
    state_.allowances[caller][spender] = amount;
    return true;
}

std::optional<bool> Erc20Token::transfer(const Address& caller, const Address& to, Amount amount) {
    if (is_zero(to)) return fail("transfer to the zero address");
    if (!move_balance(caller, to, amount)) return fail("transfer amount exceeds balance");
    return succeed();
}

Amount Erc20Token::balance_of(const Address& owner) const {
    auto it = state_.balances.find(owner);
    return it != state_.balances.end() ? it->second : 0;
}

Amount Erc20Token::allowance(const Address& owner, const Address& spender) const {
    auto owner_it = state_.allowances.find(owner);
    if (owner_it == state_.allowances.end()) return 0;
    auto it = owner_it->second.find(spender);
    return it != owner_it->second.end() ? it->second : 0;
}

std::optional<bool> Erc20Token::transfer_from(const Address& caller, const Address& from,
                                              const Address& to, Amount amount) {
    if (is_zero(to)) return fail("transfer to the zero address");

    Amount allowed = allowance(from, caller);
    if (allowed < amount) return fail("insufficient allowance");
    if (balance_of(from) < amount) return fail("transfer amount exceeds balance");

    // Unlimited approvals are not consumed
    if (allowed != AMOUNT_MAX) {
        state_.allowances[from][caller] = allowed - amount;
    }
    move_balance(from, to, amount);
    return succeed();
}

Contract::Rollback Erc20Token::checkpoint() {
    return [this, saved = state_]() { state_ = saved; };
}

std::optional<bool> Erc20Token::fail(const std::string& reason) const {
    if (convention_ == ReturnConvention::FalseOnFailure) {
        return false;
    }
    throw TokenError(symbol_ + ": " + reason);
}

std::optional<bool> Erc20Token::succeed() const {
    if (convention_ == ReturnConvention::NoReturnData) {
        return std::nullopt;
    }
    return true;
}

bool Erc20Token::move_balance(const Address& from, const Address& to, Amount amount) {
    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    state_.balances[to] += amount;
    return true;
}

} // namespace nftmart
