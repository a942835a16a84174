#include "nftmart/registry.hpp"

namespace nftmart {

const Listing* ListingRegistry::find(uint64_t listing_id) const {
    auto it = listings_.find(listing_id);
    return it != listings_.end() ? &it->second : nullptr;
}

std::optional<Listing> ListingRegistry::get(uint64_t listing_id) const {
    const Listing* listing = find(listing_id);
    return listing ? std::optional<Listing>{*listing} : std::nullopt;
}

void ListingRegistry::put(const Listing& listing) {
    listings_[listing.id] = listing;
    by_nft_[NftKey{listing.token_address, listing.token_id}].insert(listing.id);
}

void ListingRegistry::erase(uint64_t listing_id) {
    auto it = listings_.find(listing_id);
    if (it == listings_.end()) return;

    NftKey key{it->second.token_address, it->second.token_id};
    auto ids = by_nft_.find(key);
    if (ids != by_nft_.end()) {
        ids->second.erase(listing_id);
        if (ids->second.empty()) by_nft_.erase(ids);
    }
    listings_.erase(it);
}

void ListingRegistry::set_unique_erc721(const Address& token, TokenId token_id,
                                        uint64_t listing_id) {
    erc721_active_[NftKey{token, token_id}] = listing_id;
}

void ListingRegistry::clear_unique_erc721(const Address& token, TokenId token_id) {
    erc721_active_.erase(NftKey{token, token_id});
}

std::optional<uint64_t> ListingRegistry::active_erc721(const Address& token,
                                                       TokenId token_id) const {
    auto it = erc721_active_.find(NftKey{token, token_id});
    if (it == erc721_active_.end()) return std::nullopt;
    return it->second;
}

std::vector<uint64_t> ListingRegistry::ids_for(const Address& token, TokenId token_id) const {
    auto it = by_nft_.find(NftKey{token, token_id});
    if (it == by_nft_.end()) return {};
    return std::vector<uint64_t>(it->second.begin(), it->second.end());
}

} // namespace nftmart
