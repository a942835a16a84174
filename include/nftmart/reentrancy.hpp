#ifndef NFTMART_REENTRANCY_HPP
#define NFTMART_REENTRANCY_HPP

#include "errors.hpp"

namespace nftmart {

// Single lock flag owned by the contract
class ReentrancyGuard {
public:
    bool locked() const noexcept { return locked_; }

    // RAII lock; released on every exit path, including exceptions
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard) : guard_(guard) {
            if (guard_.locked_) {
                throw MarketError(ErrorCode::Reentrancy);
            }
            guard_.locked_ = true;
        }

        ~Scope() { guard_.locked_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

private:
    bool locked_ = false;
};

} // namespace nftmart

#endif // NFTMART_REENTRANCY_HPP
