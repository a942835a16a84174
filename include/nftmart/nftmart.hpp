#ifndef NFTMART_NFTMART_HPP
#define NFTMART_NFTMART_HPP

// =============================================================================
// nftmart - non-custodial NFT marketplace engine
//
//   Marketplace      listing lifecycle, settlement, administration
//   Chain            serialized all-or-nothing execution environment
//   Erc20Token       payment token (configurable return convention)
//   Erc721Collection / Erc1155Collection   listed assets, ERC-2981 royalties
//
// =============================================================================

#include "types.hpp"
#include "errors.hpp"
#include "chain.hpp"
#include "tokens.hpp"
#include "erc20.hpp"
#include "erc721.hpp"
#include "erc1155.hpp"
#include "listing.hpp"
#include "registry.hpp"
#include "allowlist.hpp"
#include "buyer_whitelist.hpp"
#include "payment.hpp"
#include "events.hpp"
#include "config.hpp"
#include "marketplace.hpp"

namespace nftmart {

constexpr const char* version() { return "1.0.0"; }

} // namespace nftmart

#endif // NFTMART_NFTMART_HPP
