/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/scope.hpp"

#include <algorithm>

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fragchain::parachain::fragment, Scope::Error, e) {
  using E = decltype(e);
  switch (e) {
    case E::UNEXPECTED_ANCESTOR:
      return "Scope: unexpected ancestor";
  }
  return "Scope: unknown error";
}

namespace fragchain::parachain::fragment {

  outcome::result<Scope> Scope::with_ancestors(
      ParaId para,
      const RelayChainBlockInfo &relay_parent,
      const Constraints &base_constraints,
      const Vec<PendingAvailability> &pending_availability,
      size_t max_depth,
      const Vec<RelayChainBlockInfo> &ancestors) {
    return with_ancestors(para,
                          relay_parent,
                          base_constraints,
                          pending_availability,
                          max_depth,
                          ancestors,
                          nullptr);
  }

  outcome::result<Scope> Scope::with_ancestors(
      ParaId para,
      const RelayChainBlockInfo &relay_parent,
      const Constraints &base_constraints,
      const Vec<PendingAvailability> &pending_availability,
      size_t max_depth,
      const Vec<RelayChainBlockInfo> &ancestors,
      UnexpectedAncestor *details) {
    auto logger = log::createLogger("Scope", "scope");

    Map<BlockNumber, RelayChainBlockInfo> ancestors_map;
    HashMap<Hash, RelayChainBlockInfo> ancestors_by_hash;

    auto prev = relay_parent.number;
    for (auto it = ancestors.begin(); it != ancestors.end(); ++it) {
      const auto &ancestor = *it;
      if (prev == 0 || ancestor.number != prev - 1) {
        SL_DEBUG(logger,
                 "Unexpected ancestor. (para={}, relay parent={}, number={}, "
                 "prev={})",
                 para,
                 relay_parent.hash,
                 ancestor.number,
                 prev);
        if (details != nullptr) {
          *details = UnexpectedAncestor{.number = ancestor.number, .prev = prev};
        }
        return Error::UNEXPECTED_ANCESTOR;
      }
      if (prev == base_constraints.min_relay_parent_number) {
        SL_TRACE(logger,
                 "Ancestry truncated at min relay parent. (para={}, "
                 "min relay parent={}, ignored={})",
                 para,
                 base_constraints.min_relay_parent_number,
                 std::distance(it, ancestors.end()));
        break;
      }

      prev = ancestor.number;
      ancestors_by_hash.emplace(ancestor.hash, ancestor);
      ancestors_map.emplace(ancestor.number, ancestor);
    }

    return Scope{
        .para = para,
        .relay_parent = relay_parent,
        .ancestors = std::move(ancestors_map),
        .ancestors_by_hash = std::move(ancestors_by_hash),
        .pending_availability = pending_availability,
        .base_constraints = base_constraints,
        .max_depth = max_depth,
    };
  }

  outcome::result<Scope> scopeFromBackingParams(
      ParaId para,
      const RelayChainBlockInfo &relay_parent,
      const Constraints &base_constraints,
      const Vec<PendingAvailability> &pending_availability,
      const AsyncBackingParams &params,
      const Vec<RelayChainBlockInfo> &ancestors) {
    const auto allowed =
        std::min(ancestors.size(), size_t(params.allowed_ancestry_len));
    const Vec<RelayChainBlockInfo> allowed_ancestors(
        ancestors.begin(), ancestors.begin() + ptrdiff_t(allowed));
    return Scope::with_ancestors(para,
                                 relay_parent,
                                 base_constraints,
                                 pending_availability,
                                 params.max_candidate_depth,
                                 allowed_ancestors);
  }

}  // namespace fragchain::parachain::fragment
