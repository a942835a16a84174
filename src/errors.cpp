#include "nftmart/errors.hpp"

#include <array>
#include <utility>

namespace nftmart {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 38> ERROR_NAMES = {{
    {ErrorCode::NotOwner, "not_owner"},
    {ErrorCode::NotAuthorizedOperator, "not_authorized_operator"},
    {ErrorCode::NotApprovedForMarketplace, "not_approved_for_marketplace"},
    {ErrorCode::NotListed, "not_listed"},
    {ErrorCode::CollectionNotWhitelisted, "collection_not_whitelisted"},
    {ErrorCode::CollectionAlreadyWhitelisted, "collection_already_whitelisted"},
    {ErrorCode::CurrencyNotAllowed, "currency_not_allowed"},
    {ErrorCode::CurrencyAlreadyAllowed, "currency_already_allowed"},
    {ErrorCode::BuyerNotWhitelisted, "buyer_not_whitelisted"},
    {ErrorCode::BuyerWhitelistDisabled, "buyer_whitelist_disabled"},
    {ErrorCode::InvalidBuyerAddress, "invalid_buyer_address"},
    {ErrorCode::BatchTooLarge, "batch_too_large"},
    {ErrorCode::EmptyBatch, "empty_batch"},
    {ErrorCode::WrongQuantityParameter, "wrong_quantity_parameter"},
    {ErrorCode::InvalidUnitPrice, "invalid_unit_price"},
    {ErrorCode::AlreadyListed, "already_listed"},
    {ErrorCode::FreeListingsNotSupported, "free_listings_not_supported"},
    {ErrorCode::InvalidNoSwapParameters, "invalid_no_swap_parameters"},
    {ErrorCode::NotSupportedTokenStandard, "not_supported_token_standard"},
    {ErrorCode::NoSwapForSameToken, "no_swap_for_same_token"},
    {ErrorCode::PartialBuyNotPossible, "partial_buy_not_possible"},
    {ErrorCode::InvalidPurchaseQuantity, "invalid_purchase_quantity"},
    {ErrorCode::SellerNotTokenOwner, "seller_not_token_owner"},
    {ErrorCode::SellerInsufficientTokenBalance, "seller_insufficient_token_balance"},
    {ErrorCode::ListingStillValid, "listing_still_valid"},
    {ErrorCode::Paused, "paused"},
    {ErrorCode::InvalidFeeRate, "invalid_fee_rate"},
    {ErrorCode::InvalidBatchSize, "invalid_batch_size"},
    {ErrorCode::ListingTermsChanged, "listing_terms_changed"},
    {ErrorCode::WrongPaymentCurrency, "wrong_payment_currency"},
    {ErrorCode::PriceNotMet, "price_not_met"},
    {ErrorCode::RoyaltyExceedsProceeds, "royalty_exceeds_proceeds"},
    {ErrorCode::TransferFailed, "transfer_failed"},
    {ErrorCode::EtherTransferFailed, "ether_transfer_failed"},
    {ErrorCode::ArithmeticOverflow, "arithmetic_overflow"},
    {ErrorCode::WrongErc1155HolderParameter, "wrong_erc1155_holder_parameter"},
    {ErrorCode::SameBuyerAsSeller, "same_buyer_as_seller"},
    {ErrorCode::Reentrancy, "reentrancy"},
}};

std::string format_message(ErrorCode code, const std::string& detail) {
    std::string msg(error_name(code));
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

} // namespace

std::string_view error_name(ErrorCode code) {
    for (const auto& [c, name] : ERROR_NAMES) {
        if (c == code) return name;
    }
    return "unknown_error";
}

ErrorCode error_from_name(std::string_view name) {
    for (const auto& [c, n] : ERROR_NAMES) {
        if (n == name) return c;
    }
    throw std::invalid_argument("unknown error name: " + std::string(name));
}

MarketError::MarketError(ErrorCode code)
    : std::runtime_error(format_message(code, {})), code_(code) {}

MarketError::MarketError(ErrorCode code, const std::string& detail)
    : std::runtime_error(format_message(code, detail)), code_(code) {}

} // namespace nftmart
