#ifndef NFTMART_ALLOWLIST_HPP
#define NFTMART_ALLOWLIST_HPP

#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// AddressSet - iterable membership with O(1) removal
// =============================================================================
//
// Removal moves the last element into the vacated slot, so iteration order is
// insertion order except for that one swapped slot.

class AddressSet {
public:
    bool contains(const Address& addr) const;

    // false if already present
    bool insert(const Address& addr);

    // false if absent
    bool erase(const Address& addr);

    const std::vector<Address>& items() const { return items_; }
    size_t size() const { return items_.size(); }

private:
    std::vector<Address> items_;
    std::unordered_map<Address, size_t, AddressHash> index_;
};

// =============================================================================
// Currency Allowlist (consulted at listing creation/update only)
// =============================================================================

class CurrencyAllowlist {
public:
    bool is_allowed(const Currency& currency) const { return set_.contains(currency.addr); }

    // Throws CurrencyAlreadyAllowed
    void add(const Currency& currency);

    // Throws CurrencyNotAllowed
    void remove(const Currency& currency);

    std::vector<Currency> list_all() const;

private:
    AddressSet set_;
};

// =============================================================================
// Collection Whitelist
// =============================================================================

class CollectionWhitelist {
public:
    bool is_whitelisted(const Address& collection) const { return set_.contains(collection); }

    // Throws CollectionAlreadyWhitelisted, or NotSupportedTokenStandard for zero
    void add(const Address& collection);

    // Throws CollectionNotWhitelisted
    void remove(const Address& collection);

    const std::vector<Address>& list_all() const { return set_.items(); }

private:
    AddressSet set_;
};

} // namespace nftmart

#endif // NFTMART_ALLOWLIST_HPP
