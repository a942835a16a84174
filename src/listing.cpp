#include "nftmart/listing.hpp"

namespace nftmart {

void to_json(nlohmann::json& j, const SwapTarget& target) {
    j = nlohmann::json{
        {"token", to_hex(target.token)},
        {"token_id", target.token_id},
        {"erc1155_quantity", amount_to_string(target.erc1155_quantity)}
    };
}

void to_json(nlohmann::json& j, const Listing& listing) {
    j = nlohmann::json{
        {"listing_id", listing.id},
        {"token_address", to_hex(listing.token_address)},
        {"token_id", listing.token_id},
        {"standard", listing.asset.is_erc1155() ? "erc1155" : "erc721"},
        {"erc1155_quantity", amount_to_string(listing.asset.wire_quantity())},
        {"price", amount_to_string(listing.price)},
        {"fee_rate", listing.fee_rate},
        {"seller", to_hex(listing.seller)},
        {"currency", to_hex(listing.currency.addr)},
        {"buyer_whitelist_enabled", listing.buyer_whitelist_enabled},
        {"partial_buy_enabled", listing.partial_buy_enabled},
        {"desired", listing.desired}
    };
}

} // namespace nftmart
