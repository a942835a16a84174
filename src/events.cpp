#include "nftmart/events.hpp"

namespace nftmart {

const char* cancel_reason_name(CancelReason reason) {
    switch (reason) {
        case CancelReason::Canceled: return "canceled";
        case CancelReason::Invalid: return "invalid";
        case CancelReason::SwapSettled: return "swap_settled";
    }
    return "unknown";
}

nlohmann::json listing_event(const Listing& listing) {
    return nlohmann::json(listing);
}

nlohmann::json purchase_event(const PurchaseRecord& record) {
    return nlohmann::json{
        {"listing_id", record.listing_id},
        {"token_address", to_hex(record.token_address)},
        {"token_id", record.token_id},
        {"quantity", amount_to_string(record.quantity)},
        {"partial", record.partial},
        {"price", amount_to_string(record.split.price)},
        {"fee", amount_to_string(record.split.fee)},
        {"royalty_receiver", to_hex(record.split.royalty_receiver)},
        {"royalty", amount_to_string(record.split.royalty)},
        {"seller_proceeds", amount_to_string(record.split.seller_proceeds)},
        {"seller", to_hex(record.seller)},
        {"buyer", to_hex(record.buyer)},
        {"currency", to_hex(record.currency.addr)},
        {"desired", record.desired}
    };
}

nlohmann::json cancel_event(const Listing& listing, const Address& triggered_by,
                            CancelReason reason) {
    return nlohmann::json{
        {"listing_id", listing.id},
        {"token_address", to_hex(listing.token_address)},
        {"token_id", listing.token_id},
        {"seller", to_hex(listing.seller)},
        {"triggered_by", to_hex(triggered_by)},
        {"reason", cancel_reason_name(reason)}
    };
}

nlohmann::json fee_rate_event(uint32_t previous, uint32_t current) {
    return nlohmann::json{{"previous", previous}, {"fee_rate", current}};
}

nlohmann::json currency_event(const Currency& currency) {
    return nlohmann::json{
        {"currency", to_hex(currency.addr)},
        {"native", currency.is_native()}
    };
}

nlohmann::json collection_event(const Address& collection) {
    return nlohmann::json{{"collection", to_hex(collection)}};
}

nlohmann::json buyers_event(uint64_t listing_id, const std::vector<Address>& buyers) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& buyer : buyers) {
        list.push_back(to_hex(buyer));
    }
    return nlohmann::json{{"listing_id", listing_id}, {"buyers", std::move(list)}};
}

nlohmann::json pause_event(const Address& account) {
    return nlohmann::json{{"account", to_hex(account)}};
}

} // namespace nftmart
