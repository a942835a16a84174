#ifndef NFTMART_PAYMENT_HPP
#define NFTMART_PAYMENT_HPP

#include <optional>

#include "chain.hpp"
#include "tokens.hpp"

namespace nftmart {

// =============================================================================
// Payment Split
// =============================================================================

// fee + royalty + seller_proceeds == price
struct PaymentSplit {
    Amount price = 0;
    Amount fee = 0;
    Address royalty_receiver{};     // zero when no royalty is paid
    Amount royalty = 0;
    Amount seller_proceeds = 0;
};

// floor(amount * rate / denominator) without an overflowing intermediate
Amount mul_div_floor(Amount amount, uint32_t rate, uint32_t denominator);

// Throws ArithmeticOverflow
Amount checked_mul(Amount a, Amount b);

// Throws RoyaltyExceedsProceeds when the royalty is larger than price - fee.
// A quote with a zero receiver or a zero amount means "no royalty".
PaymentSplit compute_split(Amount price, uint32_t fee_rate,
                           const std::optional<RoyaltyQuote>& royalty);

// =============================================================================
// PaymentDistributor - moves funds straight from buyer to recipients
// =============================================================================

class PaymentDistributor {
public:
    PaymentDistributor(Chain& chain, const Address& market);

    // ERC-2981 quote if the collection advertises it
    std::optional<RoyaltyQuote> query_royalty(const Address& collection, TokenId token_id,
                                              Amount sale_price) const;

    // Fee recipient first, then royalty receiver, seller last. Native payments
    // are forwarded from the attached value; token payments are pulled from the
    // buyer's allowance. Throws EtherTransferFailed / TransferFailed.
    void distribute(const Currency& currency, const Address& buyer,
                    const Address& fee_recipient, const Address& seller,
                    const PaymentSplit& split);

private:
    Chain& chain_;
    Address market_;

    void pay(const Currency& currency, const Address& buyer, const Address& to, Amount amount);
    void pay_native(const Address& to, Amount amount);
    void pay_token(const Address& token, const Address& buyer, const Address& to, Amount amount);
};

} // namespace nftmart

#endif // NFTMART_PAYMENT_HPP
