// =============================================================================
// allowlist.cpp - Currency allowlist and collection whitelist
// =============================================================================

#include "nftmart/allowlist.hpp"
#include "nftmart/errors.hpp"

namespace nftmart {

// =============================================================================
// AddressSet
// =============================================================================

bool AddressSet::contains(const Address& addr) const {
    return index_.find(addr) != index_.end();
}

bool AddressSet::insert(const Address& addr) {
    if (!index_.emplace(addr, items_.size()).second) {
        return false;
    }
    items_.push_back(addr);
    return true;
}

bool AddressSet::erase(const Address& addr) {
    auto it = index_.find(addr);
    if (it == index_.end()) {
        return false;
    }

    size_t slot = it->second;
    size_t last = items_.size() - 1;
    if (slot != last) {
        items_[slot] = items_[last];
        index_[items_[slot]] = slot;
    }
    items_.pop_back();
    index_.erase(addr);
    return true;
}

// =============================================================================
// CurrencyAllowlist
// =============================================================================

void CurrencyAllowlist::add(const Currency& currency) {
    if (!set_.insert(currency.addr)) {
        throw MarketError(ErrorCode::CurrencyAlreadyAllowed, to_hex(currency.addr));
    }
}

void CurrencyAllowlist::remove(const Currency& currency) {
    if (!set_.erase(currency.addr)) {
        throw MarketError(ErrorCode::CurrencyNotAllowed, to_hex(currency.addr));
    }
}

std::vector<Currency> CurrencyAllowlist::list_all() const {
    std::vector<Currency> result;
    result.reserve(set_.size());
    for (const auto& addr : set_.items()) {
        result.emplace_back(addr);
    }
    return result;
}

// =============================================================================
// CollectionWhitelist
// =============================================================================

void CollectionWhitelist::add(const Address& collection) {
    if (is_zero(collection)) {
        throw MarketError(ErrorCode::NotSupportedTokenStandard, "zero collection address");
    }
    if (!set_.insert(collection)) {
        throw MarketError(ErrorCode::CollectionAlreadyWhitelisted, to_hex(collection));
    }
}

void CollectionWhitelist::remove(const Address& collection) {
    if (!set_.erase(collection)) {
        throw MarketError(ErrorCode::CollectionNotWhitelisted, to_hex(collection));
    }
}

} // namespace nftmart
