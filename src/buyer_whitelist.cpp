#include "nftmart/buyer_whitelist.hpp"
#include "nftmart/errors.hpp"

#include <string>

namespace nftmart {

bool BuyerWhitelist::is_whitelisted(uint64_t listing_id, const Address& buyer) const {
    auto it = entries_.find(listing_id);
    return it != entries_.end() && it->second.count(buyer) > 0;
}

void BuyerWhitelist::add_many(uint64_t listing_id, const std::vector<Address>& buyers) {
    check_batch(buyers);
    for (const auto& buyer : buyers) {
        if (is_zero(buyer)) {
            throw MarketError(ErrorCode::InvalidBuyerAddress);
        }
    }
    BuyerSet& set = entries_[listing_id];
    set.insert(buyers.begin(), buyers.end());
}

void BuyerWhitelist::remove_many(uint64_t listing_id, const std::vector<Address>& buyers) {
    check_batch(buyers);
    auto it = entries_.find(listing_id);
    if (it == entries_.end()) return;

    for (const auto& buyer : buyers) {
        it->second.erase(buyer);
    }
    if (it->second.empty()) {
        entries_.erase(it);
    }
}

size_t BuyerWhitelist::count(uint64_t listing_id) const {
    auto it = entries_.find(listing_id);
    return it != entries_.end() ? it->second.size() : 0;
}

void BuyerWhitelist::set_max_batch(uint32_t max_batch) {
    if (max_batch == 0) {
        throw MarketError(ErrorCode::InvalidBatchSize);
    }
    max_batch_ = max_batch;
}

void BuyerWhitelist::check_batch(const std::vector<Address>& buyers) const {
    if (buyers.empty()) {
        throw MarketError(ErrorCode::EmptyBatch);
    }
    if (buyers.size() > max_batch_) {
        throw MarketError(ErrorCode::BatchTooLarge,
                          std::to_string(buyers.size()) + " > " + std::to_string(max_batch_));
    }
}

} // namespace nftmart
