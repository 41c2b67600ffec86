/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>

#include "outcome/outcome.hpp"
#include "parachain/validator/prospective_parachains/common.hpp"

namespace fragchain::parachain::fragment {

  struct PendingAvailability {
    /// The candidate hash.
    CandidateHash candidate_hash;
    /// The block info of the relay parent.
    RelayChainBlockInfo relay_parent;
  };

  /// Offending pair of block numbers of a rejected ancestry.
  struct UnexpectedAncestor {
    /// The block number of the rejected ancestor.
    BlockNumber number;
    /// The block number of the previously accepted block.
    BlockNumber prev;

    bool operator==(const UnexpectedAncestor &) const = default;
  };

  /// The relay-chain context a fragment chain is built in: the relay-parent,
  /// its allowed ancestors, candidates pending availability and the base
  /// constraints of the parachain.
  struct Scope {
    enum class Error {
      UNEXPECTED_ANCESTOR = 1,
    };

    ParaId para;
    RelayChainBlockInfo relay_parent;
    Map<BlockNumber, RelayChainBlockInfo> ancestors;
    HashMap<Hash, RelayChainBlockInfo> ancestors_by_hash;
    Vec<PendingAvailability> pending_availability;
    Constraints base_constraints;
    size_t max_depth;

    /**
     * Define a new scope.
     *
     * Ancestors must be in reverse order, starting with the parent of the
     * relay-parent and proceeding backwards in block number increments of 1.
     * Ancestors not following these conditions are rejected. Ancestors below
     * the minimum relay-parent number of the base constraints are ignored.
     */
    static outcome::result<Scope> with_ancestors(
        ParaId para,
        const RelayChainBlockInfo &relay_parent,
        const Constraints &base_constraints,
        const Vec<PendingAvailability> &pending_availability,
        size_t max_depth,
        const Vec<RelayChainBlockInfo> &ancestors);

    /// Same as above, reporting the offending block numbers on rejection.
    static outcome::result<Scope> with_ancestors(
        ParaId para,
        const RelayChainBlockInfo &relay_parent,
        const Constraints &base_constraints,
        const Vec<PendingAvailability> &pending_availability,
        size_t max_depth,
        const Vec<RelayChainBlockInfo> &ancestors,
        UnexpectedAncestor *details);

    /// Oldest accepted ancestor, or the relay-parent itself.
    const RelayChainBlockInfo &earliest_relay_parent() const {
      if (!ancestors.empty()) {
        return ancestors.begin()->second;
      }
      return relay_parent;
    }

    Option<std::reference_wrapper<const PendingAvailability>>
    get_pending_availability(const CandidateHash &candidate_hash) const {
      auto it = std::find_if(pending_availability.begin(),
                             pending_availability.end(),
                             [&](const PendingAvailability &c) {
                               return c.candidate_hash == candidate_hash;
                             });
      if (it != pending_availability.end()) {
        return {{*it}};
      }
      return std::nullopt;
    }

    Option<std::reference_wrapper<const RelayChainBlockInfo>> ancestor_by_hash(
        const Hash &hash) const {
      if (hash == relay_parent.hash) {
        return {{relay_parent}};
      }
      if (auto it = ancestors_by_hash.find(hash);
          it != ancestors_by_hash.end()) {
        return {{it->second}};
      }
      return std::nullopt;
    }
  };

  /// Build a scope from the async backing parameters of the relay-parent.
  /// At most `allowed_ancestry_len` ancestors are taken into account.
  outcome::result<Scope> scopeFromBackingParams(
      ParaId para,
      const RelayChainBlockInfo &relay_parent,
      const Constraints &base_constraints,
      const Vec<PendingAvailability> &pending_availability,
      const AsyncBackingParams &params,
      const Vec<RelayChainBlockInfo> &ancestors);

}  // namespace fragchain::parachain::fragment

OUTCOME_HPP_DECLARE_ERROR(fragchain::parachain::fragment, Scope::Error);
