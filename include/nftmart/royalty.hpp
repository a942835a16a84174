#ifndef NFTMART_ROYALTY_HPP
#define NFTMART_ROYALTY_HPP

#include "tokens.hpp"

namespace nftmart {

// ERC-2981 default royalty: one receiver, a rate in basis points
class DefaultRoyalty {
public:
    void set(const Address& receiver, uint32_t basis_points) {
        if (basis_points > ROYALTY_DENOMINATOR) {
            throw TokenError("royalty rate exceeds sale price");
        }
        receiver_ = receiver;
        basis_points_ = basis_points;
    }

    void clear() {
        receiver_ = ZERO_ADDRESS;
        basis_points_ = 0;
    }

    const Address& receiver() const { return receiver_; }
    uint32_t basis_points() const { return basis_points_; }

    // floor(sale_price * bps / 10000) without the intermediate overflow
    RoyaltyQuote quote(Amount sale_price) const {
        Amount whole = sale_price / ROYALTY_DENOMINATOR;
        Amount rest = sale_price % ROYALTY_DENOMINATOR;
        return {receiver_, whole * basis_points_ + rest * basis_points_ / ROYALTY_DENOMINATOR};
    }

private:
    Address receiver_{};
    uint32_t basis_points_{0};
};

} // namespace nftmart

#endif // NFTMART_ROYALTY_HPP
