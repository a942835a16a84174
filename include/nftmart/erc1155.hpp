#ifndef NFTMART_ERC1155_HPP
#define NFTMART_ERC1155_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "chain.hpp"
#include "royalty.hpp"
#include "tokens.hpp"

namespace nftmart {

// =============================================================================
// Erc1155Collection - semi-fungible tokens, optional ERC-2981 royalty
// =============================================================================

class Erc1155Collection : public Contract, public IERC1155, public IERC2981 {
public:
    Erc1155Collection(Chain& chain, const Address& address, std::string name,
                      bool royalties = false);

    const std::string& name() const { return name_; }

    void mint(const Address& to, TokenId token_id, Amount amount);
    void set_approval_for_all(const Address& caller, const Address& op, bool approved);
    void set_default_royalty(const Address& receiver, uint32_t basis_points);

    // IERC1155
    Amount balance_of(const Address& owner, TokenId token_id) const override;
    bool is_approved_for_all(const Address& owner, const Address& op) const override;
    void safe_transfer_from(const Address& caller, const Address& from,
                            const Address& to, TokenId token_id, Amount amount) override;

    // IERC2981
    RoyaltyQuote royalty_info(TokenId token_id, Amount sale_price) const override;

    bool supports_interface(uint32_t interface_id) const override;
    Rollback checkpoint() override;

private:
    using HolderBalances = std::unordered_map<Address, Amount, AddressHash>;
    using OperatorSet = std::unordered_set<Address, AddressHash>;

    struct State {
        std::unordered_map<TokenId, HolderBalances> balances;
        std::unordered_map<Address, OperatorSet, AddressHash> operators;
        DefaultRoyalty royalty;
    };

    std::string name_;
    bool royalties_;
    State state_;
};

} // namespace nftmart

#endif // NFTMART_ERC1155_HPP
