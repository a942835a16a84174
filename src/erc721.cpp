#include "nftmart/erc721.hpp"

namespace nftmart {

Erc721Collection::Erc721Collection(Chain& chain, const Address& address, std::string name,
                                   bool royalties)
    : Contract(chain, address), name_(std::move(name)), royalties_(royalties) {}

void Erc721Collection::mint(const Address& to, TokenId token_id) {
    if (is_zero(to)) {
        throw TokenError(name_ + ": mint to the zero address");
    }
    if (exists(token_id)) {
        throw TokenError(name_ + ": token already minted");
    }
    state_.owners[token_id] = to;
}

void Erc721Collection::burn(const Address& caller, TokenId token_id) {
    if (!is_approved_or_owner(caller, token_id)) {
        throw TokenError(name_ + ": caller is not token owner or approved");
    }
    state_.owners.erase(token_id);
    state_.approvals.erase(token_id);
}

void Erc721Collection::approve(const Address& caller, const Address& to, TokenId token_id) {
    Address owner = owner_of(token_id);
    if (to == owner) {
        throw TokenError(name_ + ": approval to current owner");
    }
    if (caller != owner && !is_approved_for_all(owner, caller)) {
        throw TokenError(name_ + ": approve caller is not token owner or approved for all");
    }
    state_.approvals[token_id] = to;
}

void Erc721Collection::set_approval_for_all(const Address& caller, const Address& op,
                                            bool approved) {
    if (caller == op) {
        throw TokenError(name_ + ": approve to caller");
    }
    if (approved) {
        state_.operators[caller].insert(op);
    } else {
        auto it = state_.operators.find(caller);
        if (it != state_.operators.end()) it->second.erase(op);
    }
}

void Erc721Collection::transfer_from(const Address& caller, const Address& from,
                                     const Address& to, TokenId token_id) {
    if (!is_approved_or_owner(caller, token_id)) {
        throw TokenError(name_ + ": caller is not token owner or approved");
    }
    if (owner_of(token_id) != from) {
        throw TokenError(name_ + ": transfer from incorrect owner");
    }
    if (is_zero(to)) {
        throw TokenError(name_ + ": transfer to the zero address");
    }
    state_.approvals.erase(token_id);
    state_.owners[token_id] = to;
}

uint64_t Erc721Collection::balance_of(const Address& owner) const {
    uint64_t count = 0;
    for (const auto& [id, holder] : state_.owners) {
        if (holder == owner) ++count;
    }
    return count;
}

bool Erc721Collection::exists(TokenId token_id) const {
    return state_.owners.find(token_id) != state_.owners.end();
}

void Erc721Collection::set_default_royalty(const Address& receiver, uint32_t basis_points) {
    state_.royalty.set(receiver, basis_points);
}

Address Erc721Collection::owner_of(TokenId token_id) const {
    auto it = state_.owners.find(token_id);
    if (it == state_.owners.end()) {
        throw TokenError(name_ + ": invalid token ID");
    }
    return it->second;
}

Address Erc721Collection::get_approved(TokenId token_id) const {
    owner_of(token_id);
    auto it = state_.approvals.find(token_id);
    return it != state_.approvals.end() ? it->second : ZERO_ADDRESS;
}

bool Erc721Collection::is_approved_for_all(const Address& owner, const Address& op) const {
    auto it = state_.operators.find(owner);
    return it != state_.operators.end() && it->second.count(op) > 0;
}

void Erc721Collection::safe_transfer_from(const Address& caller, const Address& from,
                                          const Address& to, TokenId token_id) {
    transfer_from(caller, from, to, token_id);

    if (Contract* receiver = chain().contract_at(to)) {
        if (!receiver->on_erc721_received(caller, from, token_id)) {
            throw TokenError(name_ + ": transfer to non ERC721Receiver implementer");
        }
    }
}

RoyaltyQuote Erc721Collection::royalty_info(TokenId, Amount sale_price) const {
    return state_.royalty.quote(sale_price);
}

bool Erc721Collection::supports_interface(uint32_t interface_id) const {
    if (interface_id == interfaces::ERC721) return true;
    if (interface_id == interfaces::ERC2981) return royalties_;
    return Contract::supports_interface(interface_id);
}

Contract::Rollback Erc721Collection::checkpoint() {
    return [this, saved = state_]() { state_ = saved; };
}

bool Erc721Collection::is_approved_or_owner(const Address& caller, TokenId token_id) const {
    Address owner = owner_of(token_id);
    return caller == owner || get_approved(token_id) == caller || is_approved_for_all(owner, caller);
}

} // namespace nftmart
