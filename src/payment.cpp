// =============================================================================
// payment.cpp - Fee/royalty split and non-custodial settlement
// =============================================================================

#include "nftmart/payment.hpp"
#include "nftmart/errors.hpp"

namespace nftmart {

Amount mul_div_floor(Amount amount, uint32_t rate, uint32_t denominator) {
    Amount whole = amount / denominator;
    Amount rest = amount % denominator;
    return whole * rate + rest * rate / denominator;
}

Amount checked_mul(Amount a, Amount b) {
    if (a != 0 && b > AMOUNT_MAX / a) {
        throw MarketError(ErrorCode::ArithmeticOverflow,
                          amount_to_string(a) + " * " + amount_to_string(b));
    }
    return a * b;
}

PaymentSplit compute_split(Amount price, uint32_t fee_rate,
                           const std::optional<RoyaltyQuote>& royalty) {
    if (fee_rate > fees::FEE_DENOMINATOR) {
        throw MarketError(ErrorCode::InvalidFeeRate);
    }

    PaymentSplit split;
    split.price = price;
    split.fee = mul_div_floor(price, fee_rate, fees::FEE_DENOMINATOR);

    Amount remaining = price - split.fee;

    if (royalty && !is_zero(royalty->receiver) && royalty->amount > 0) {
        if (royalty->amount > remaining) {
            throw MarketError(ErrorCode::RoyaltyExceedsProceeds,
                              amount_to_string(royalty->amount) + " > " +
                              amount_to_string(remaining));
        }
        split.royalty_receiver = royalty->receiver;
        split.royalty = royalty->amount;
        remaining -= royalty->amount;
    }

    split.seller_proceeds = remaining;
    return split;
}

// =============================================================================
// PaymentDistributor
// =============================================================================

PaymentDistributor::PaymentDistributor(Chain& chain, const Address& market)
    : chain_(chain), market_(market) {}

std::optional<RoyaltyQuote> PaymentDistributor::query_royalty(const Address& collection,
                                                              TokenId token_id,
                                                              Amount sale_price) const {
    auto* royalties = chain_.interface_at<IERC2981>(collection, interfaces::ERC2981);
    if (!royalties) return std::nullopt;
    return royalties->royalty_info(token_id, sale_price);
}

void PaymentDistributor::distribute(const Currency& currency, const Address& buyer,
                                    const Address& fee_recipient, const Address& seller,
                                    const PaymentSplit& split) {
    pay(currency, buyer, fee_recipient, split.fee);
    if (split.royalty > 0) {
        pay(currency, buyer, split.royalty_receiver, split.royalty);
    }
    pay(currency, buyer, seller, split.seller_proceeds);
}

void PaymentDistributor::pay(const Currency& currency, const Address& buyer,
                             const Address& to, Amount amount) {
    if (amount == 0) return;

    if (currency.is_native()) {
        pay_native(to, amount);
    } else {
        pay_token(currency.addr, buyer, to, amount);
    }
}

void PaymentDistributor::pay_native(const Address& to, Amount amount) {
    std::exception_ptr failure = chain_.try_call([&] {
        chain_.send_native(market_, to, amount);
    });
    if (failure) {
        throw MarketError(ErrorCode::EtherTransferFailed, to_hex(to));
    }
}

void PaymentDistributor::pay_token(const Address& token, const Address& buyer,
                                   const Address& to, Amount amount) {
    auto* erc20 = dynamic_cast<IERC20*>(chain_.contract_at(token));
    if (!erc20) {
        throw MarketError(ErrorCode::TransferFailed, "no token contract at " + to_hex(token));
    }

    // Reverts and an explicit false fail; no return data succeeds
    std::optional<bool> returned;
    std::exception_ptr failure = chain_.try_call([&] {
        returned = erc20->transfer_from(market_, buyer, to, amount);
    });
    if (failure || (returned.has_value() && !*returned)) {
        throw MarketError(ErrorCode::TransferFailed, to_hex(token) + " -> " + to_hex(to));
    }
}

} // namespace nftmart
