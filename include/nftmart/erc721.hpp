#ifndef NFTMART_ERC721_HPP
#define NFTMART_ERC721_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "chain.hpp"
#include "royalty.hpp"
#include "tokens.hpp"

namespace nftmart {

// =============================================================================
// Erc721Collection - unique tokens, optional ERC-2981 royalty
// =============================================================================

class Erc721Collection : public Contract, public IERC721, public IERC2981 {
public:
    // ERC-2981 is only advertised when royalties is true
    Erc721Collection(Chain& chain, const Address& address, std::string name,
                     bool royalties = false);

    const std::string& name() const { return name_; }

    void mint(const Address& to, TokenId token_id);
    void burn(const Address& caller, TokenId token_id);
    void approve(const Address& caller, const Address& to, TokenId token_id);
    void set_approval_for_all(const Address& caller, const Address& op, bool approved);
    void transfer_from(const Address& caller, const Address& from,
                       const Address& to, TokenId token_id);

    uint64_t balance_of(const Address& owner) const;
    bool exists(TokenId token_id) const;

    void set_default_royalty(const Address& receiver, uint32_t basis_points);

    // IERC721
    Address owner_of(TokenId token_id) const override;
    Address get_approved(TokenId token_id) const override;
    bool is_approved_for_all(const Address& owner, const Address& op) const override;
    void safe_transfer_from(const Address& caller, const Address& from,
                            const Address& to, TokenId token_id) override;

    // IERC2981
    RoyaltyQuote royalty_info(TokenId token_id, Amount sale_price) const override;

    bool supports_interface(uint32_t interface_id) const override;
    Rollback checkpoint() override;

private:
    using OperatorSet = std::unordered_set<Address, AddressHash>;

    struct State {
        std::unordered_map<TokenId, Address> owners;
        std::unordered_map<TokenId, Address> approvals;
        std::unordered_map<Address, OperatorSet, AddressHash> operators;
        DefaultRoyalty royalty;
    };

    std::string name_;
    bool royalties_;
    State state_;

    bool is_approved_or_owner(const Address& caller, TokenId token_id) const;
};

} // namespace nftmart

#endif // NFTMART_ERC721_HPP
