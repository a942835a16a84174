#ifndef NFTMART_ERRORS_HPP
#define NFTMART_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nftmart {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    // Authorization
    NotOwner = 1,
    NotAuthorizedOperator = 2,
    NotApprovedForMarketplace = 3,

    // Preconditions
    NotListed = 10,
    CollectionNotWhitelisted = 11,
    CollectionAlreadyWhitelisted = 12,
    CurrencyNotAllowed = 13,
    CurrencyAlreadyAllowed = 14,
    BuyerNotWhitelisted = 15,
    BuyerWhitelistDisabled = 16,
    InvalidBuyerAddress = 17,
    BatchTooLarge = 18,
    EmptyBatch = 19,
    WrongQuantityParameter = 20,
    InvalidUnitPrice = 21,
    AlreadyListed = 22,
    FreeListingsNotSupported = 23,
    InvalidNoSwapParameters = 24,
    NotSupportedTokenStandard = 25,
    NoSwapForSameToken = 26,
    PartialBuyNotPossible = 27,
    InvalidPurchaseQuantity = 28,
    SellerNotTokenOwner = 29,
    SellerInsufficientTokenBalance = 30,
    ListingStillValid = 31,
    Paused = 32,
    InvalidFeeRate = 33,
    InvalidBatchSize = 34,

    // Staleness
    ListingTermsChanged = 40,

    // Payment
    WrongPaymentCurrency = 50,
    PriceNotMet = 51,
    RoyaltyExceedsProceeds = 52,
    TransferFailed = 53,
    EtherTransferFailed = 54,
    ArithmeticOverflow = 55,

    // Swap
    WrongErc1155HolderParameter = 60,
    SameBuyerAsSeller = 61,

    Reentrancy = 70
};

// Stable snake_case name ("listing_terms_changed")
std::string_view error_name(ErrorCode code);

// Reverse of error_name; throws std::invalid_argument for unknown names
ErrorCode error_from_name(std::string_view name);

// Raised by every marketplace entry point; the enclosing transaction reverts
class MarketError : public std::runtime_error {
public:
    explicit MarketError(ErrorCode code);
    MarketError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace nftmart

#endif // NFTMART_ERRORS_HPP
