#ifndef NFTMART_BUYER_WHITELIST_HPP
#define NFTMART_BUYER_WHITELIST_HPP

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace nftmart {

// Per-listing set of buyers allowed to purchase
class BuyerWhitelist {
public:
    explicit BuyerWhitelist(uint32_t max_batch) : max_batch_(max_batch) {}

    bool is_whitelisted(uint64_t listing_id, const Address& buyer) const;

    // Throws EmptyBatch, BatchTooLarge or InvalidBuyerAddress; duplicates are no-ops
    void add_many(uint64_t listing_id, const std::vector<Address>& buyers);
    void remove_many(uint64_t listing_id, const std::vector<Address>& buyers);

    // Drops every entry of a listing that no longer exists
    void erase_listing(uint64_t listing_id) { entries_.erase(listing_id); }

    size_t count(uint64_t listing_id) const;

    uint32_t max_batch() const { return max_batch_; }

    // Throws InvalidBatchSize for zero
    void set_max_batch(uint32_t max_batch);

private:
    using BuyerSet = std::unordered_set<Address, AddressHash>;

    std::unordered_map<uint64_t, BuyerSet> entries_;
    uint32_t max_batch_;

    void check_batch(const std::vector<Address>& buyers) const;
};

} // namespace nftmart

#endif // NFTMART_BUYER_WHITELIST_HPP
