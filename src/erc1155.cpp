#include "nftmart/erc1155.hpp"

namespace nftmart {

Erc1155Collection::Erc1155Collection(Chain& chain, const Address& address, std::string name,
                                     bool royalties)
    : Contract(chain, address), name_(std::move(name)), royalties_(royalties) {}

void Erc1155Collection::mint(const Address& to, TokenId token_id, Amount amount) {
    if (is_zero(to)) {
        throw TokenError(name_ + ": mint to the zero address");
    }
    Amount& balance = state_.balances[token_id][to];
    if (balance > AMOUNT_MAX - amount) {
        throw TokenError(name_ + ": balance overflow");
    }
    balance += amount;
}

void Erc1155Collection::set_approval_for_all(const Address& caller, const Address& op,
                                             bool approved) {
    if (caller == op) {
        throw TokenError(name_ + ": setting approval status for self");
    }
    if (approved) {
        state_.operators[caller].insert(op);
    } else {
        auto it = state_.operators.find(caller);
        if (it != state_.operators.end()) it->second.erase(op);
    }
}

void Erc1155Collection::set_default_royalty(const Address& receiver, uint32_t basis_points) {
    state_.royalty.set(receiver, basis_points);
}

Amount Erc1155Collection::balance_of(const Address& owner, TokenId token_id) const {
    auto id_it = state_.balances.find(token_id);
    if (id_it == state_.balances.end()) return 0;
    auto it = id_it->second.find(owner);
    return it != id_it->second.end() ? it->second : 0;
}

bool Erc1155Collection::is_approved_for_all(const Address& owner, const Address& op) const {
    auto it = state_.operators.find(owner);
    return it != state_.operators.end() && it->second.count(op) > 0;
}

void Erc1155Collection::safe_transfer_from(const Address& caller, const Address& from,
                                           const Address& to, TokenId token_id, Amount amount) {
    if (caller != from && !is_approved_for_all(from, caller)) {
        throw TokenError(name_ + ": caller is not token owner or approved");
    }
    if (is_zero(to)) {
        throw TokenError(name_ + ": transfer to the zero address");
    }

    HolderBalances& holders = state_.balances[token_id];
    Amount& from_balance = holders[from];
    if (from_balance < amount) {
        throw TokenError(name_ + ": insufficient balance for transfer");
    }
    from_balance -= amount;
    holders[to] += amount;

    if (Contract* receiver = chain().contract_at(to)) {
        if (!receiver->on_erc1155_received(caller, from, token_id, amount)) {
            throw TokenError(name_ + ": ERC1155Receiver rejected tokens");
        }
    }
}

RoyaltyQuote Erc1155Collection::royalty_info(TokenId, Amount sale_price) const {
    return state_.royalty.quote(sale_price);
}

bool Erc1155Collection::supports_interface(uint32_t interface_id) const {
    if (interface_id == interfaces::ERC1155) return true;
    if (interface_id == interfaces::ERC2981) return royalties_;
    return Contract::supports_interface(interface_id);
}

Contract::Rollback Erc1155Collection::checkpoint() {
    return [this, saved = state_]() { state_ = saved; };
}

} // namespace nftmart
