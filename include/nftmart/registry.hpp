#ifndef NFTMART_REGISTRY_HPP
#define NFTMART_REGISTRY_HPP

#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

#include "listing.hpp"

namespace nftmart {

// (collection, token id)
struct NftKey {
    Address token;
    TokenId token_id;

    bool operator==(const NftKey& other) const {
        return token == other.token && token_id == other.token_id;
    }
};

struct NftKeyHash {
    size_t operator()(const NftKey& key) const noexcept {
        return AddressHash{}(key.token) * 31 + std::hash<TokenId>{}(key.token_id);
    }
};

// =============================================================================
// ListingRegistry - storage only, no validation
// =============================================================================

class ListingRegistry {
public:
    // Ids start at 1
    uint64_t next_id() const { return next_id_; }
    uint64_t allocate_id() { return next_id_++; }

    const Listing* find(uint64_t listing_id) const;
    std::optional<Listing> get(uint64_t listing_id) const;

    // Insert or overwrite; token identity of an existing id must not change
    void put(const Listing& listing);
    void erase(uint64_t listing_id);

    size_t size() const { return listings_.size(); }

    // ERC-721 uniqueness index
    void set_unique_erc721(const Address& token, TokenId token_id, uint64_t listing_id);
    void clear_unique_erc721(const Address& token, TokenId token_id);
    std::optional<uint64_t> active_erc721(const Address& token, TokenId token_id) const;

    // All active listing ids of an NFT, ascending (several for ERC-1155)
    std::vector<uint64_t> ids_for(const Address& token, TokenId token_id) const;

private:
    std::map<uint64_t, Listing> listings_;
    std::unordered_map<NftKey, uint64_t, NftKeyHash> erc721_active_;
    std::unordered_map<NftKey, std::set<uint64_t>, NftKeyHash> by_nft_;
    uint64_t next_id_{1};
};

} // namespace nftmart

#endif // NFTMART_REGISTRY_HPP
