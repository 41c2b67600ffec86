/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>
#include <utility>

#include <boost/variant.hpp>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "parachain/validator/prospective_parachains/candidate_storage.hpp"
#include "parachain/validator/prospective_parachains/common.hpp"
#include "parachain/validator/prospective_parachains/fragment_validator.hpp"
#include "parachain/validator/prospective_parachains/scope.hpp"

namespace fragchain::parachain::fragment {

  struct NodePointerRoot {
    bool operator==(const NodePointerRoot &) const = default;
  };
  using NodePointerStorage = size_t;
  using NodePointer = boost::variant<NodePointerRoot, NodePointerStorage>;

  /// Hashes of candidates already included or pending availability.
  using Ancestors = HashSet<CandidateHash>;

  struct FragmentNode {
    // A pointer to the parent node.
    NodePointer parent;
    Fragment fragment;
    CandidateHash candidate_hash;
    size_t depth;
    ConstraintModifications cumulative_modifications;
    Vec<std::pair<NodePointer, CandidateHash>> children;

    const Hash &relayParent() const {
      return fragment.relayParent().hash;
    }

    Option<NodePointer> candidateChild(
        const CandidateHash &candidate_hash) const {
      auto it =
          std::find_if(children.begin(),
                       children.end(),
                       [&](const std::pair<NodePointer, CandidateHash> &p) {
                         return p.second == candidate_hash;
                       });
      if (it != children.end()) {
        return it->first;
      }
      return std::nullopt;
    }
  };

  /// This is a chain of candidates based on some underlying storage of
  /// candidates and a scope.
  ///
  /// All nodes in the chain must be either pending availability or within the
  /// scope. Within the scope means it's built off of the relay-parent or an
  /// ancestor.
  ///
  /// The same candidate may appear at several depths when head-data of the
  /// parachain cycles. The depth is bounded by the scope's max depth.
  class FragmentChain {
   public:
    /// Create a new fragment chain with the given scope and populate it with
    /// the candidates from the storage.
    static FragmentChain populate(std::shared_ptr<crypto::Hasher> hasher,
                                  std::shared_ptr<FragmentValidator> validator,
                                  const Scope &scope,
                                  const CandidateStorage &storage);

    /// Add a candidate known to the storage and populate the chain from it.
    /// The candidate is tried on top of every node producing its parent
    /// head-data.
    void add_and_populate(const CandidateHash &hash,
                          const CandidateStorage &storage);

    /// Drop all nodes and populate the chain again with the same scope.
    void repopulate(const CandidateStorage &storage);

    const Scope &scope() const {
      return scope_;
    }

    /// Number of nodes in the chain.
    size_t size() const {
      return nodes_.size();
    }

    const Vec<FragmentNode> &nodes() const {
      return nodes_;
    }

    bool contains_candidate(const CandidateHash &candidate) const {
      return candidates_.contains(candidate);
    }

    Vec<CandidateHash> candidates() const;

    /// Depths at which the candidate is present in the chain.
    Option<Vec<size_t>> candidate(const CandidateHash &hash) const;

    /// Candidates of the first longest path from the root.
    Vec<CandidateHash> best_chain() const;

    /**
     * Find the depths at which the candidate could be added to the chain.
     * If the candidate is already known, its current depths are returned
     * unless `backed_in_path_only` is set. With `backed_in_path_only` only
     * depths whose path from the root consists of backed candidates are
     * reported.
     */
    Vec<size_t> hypothetical_depths(const CandidateHash &hash,
                                    const HypotheticalCandidate &candidate,
                                    const CandidateStorage &candidate_storage,
                                    bool backed_in_path_only) const;

    /**
     * @brief Select `count` candidates after the given `ancestors` which pass
     * the predicate and have not already been backed on chain.
     *
     * Does an exhaustive search into the chain after the node which the
     * `ancestors` lead to. If there are multiple possibilities of size
     * `count`, this will select the first one. If there is no chain of size
     * `count` that matches the criteria, this will return the largest chain
     * it could find with the criteria. If there are no candidates meeting
     * those criteria, returns an empty `Vec`.
     */
    template <typename Func>
    Vec<CandidateHash> find_backable_chain(Ancestors ancestors,
                                           uint32_t count,
                                           const Func &pred) const {
      if (count == 0) {
        return {};
      }

      auto base_node = find_ancestor_path(std::move(ancestors));
      if (!base_node) {
        return {};
      }

      Vec<CandidateHash> accum;
      return find_backable_chain_inner(*base_node, count, count, pred, accum);
    }

    /// Find the node the given ancestors lead to, starting from the root.
    /// Returns nothing if the ancestors describe a fork.
    Option<NodePointer> find_ancestor_path(Ancestors ancestors) const;

   private:
    FragmentChain(Scope scope,
                  std::shared_ptr<crypto::Hasher> hasher,
                  std::shared_ptr<FragmentValidator> validator);

    struct ParentInfo {
      ConstraintModifications modifications;
      size_t child_depth;
      RelayChainBlockInfo earliest_rp;
      // The parent is pending availability and its relay-parent is out of
      // scope. `earliest_rp` is then the relay-parent of the parent itself.
      bool out_of_scope_pending;
    };

    /// Cumulative modifications, depth of children and the relay-parent
    /// which children must not precede.
    Option<ParentInfo> parent_info(const NodePointer &parent_pointer) const;

    void populate_from_bases(const CandidateStorage &storage,
                             const Vec<NodePointer> &initial_bases);

    /// Returns the index the node was placed at.
    size_t insert_node(FragmentNode &&node);

    Option<NodePointer> node_candidate_child(
        const NodePointer &pointer, const CandidateHash &candidate_hash) const;

    bool node_has_candidate_child(const NodePointer &pointer,
                                  const CandidateHash &candidate_hash) const;

    bool path_contains_backed_only_candidates(
        NodePointer parent_pointer,
        const CandidateStorage &candidate_storage) const;

    /// Pick the child whose hash is in `ancestors`, consuming it. Fails if
    /// more than one child matches.
    bool find_valid_child(
        Ancestors &ancestors,
        const Vec<std::pair<NodePointer, CandidateHash>> &children,
        Option<NodePointer> &next) const;

    Vec<std::pair<NodePointer, CandidateHash>> children_of(
        const NodePointer &pointer) const;

    /**
     * @brief Try finding a candidate chain starting from `base_node` of
     * length `expected_count`. If not possible, return the longest one we
     * could find. Does a depth-first search, since we're optimistic that
     * there won't be more than one such chains (parachains shouldn't usually
     * have forks). So in the usual case, this will conclude in
     * `O(expected_count)`. Cycles are accepted, but this doesn't allow for
     * infinite execution time, because the maximum depth we'll reach is
     * `expected_count`. Worst case performance is
     * `O(num_forks ^ expected_count)`, both of which are bounded by
     * governance controlled parameters.
     */
    template <typename Func>
    Vec<CandidateHash> find_backable_chain_inner(
        const NodePointer &base_node,
        uint32_t expected_count,
        uint32_t remaining_count,
        const Func &pred,
        Vec<CandidateHash> &accumulator) const {
      if (remaining_count == 0) {
        return accumulator;
      }

      Vec<std::pair<NodePointer, CandidateHash>> children;
      for (auto &[ptr, hash] : children_of(base_node)) {
        if (scope_.get_pending_availability(hash)) {
          continue;
        }
        if (!pred(hash)) {
          continue;
        }
        children.emplace_back(ptr, hash);
      }

      auto best_result = accumulator;
      for (const auto &[child_ptr, child_hash] : children) {
        accumulator.emplace_back(child_hash);
        auto result = find_backable_chain_inner(
            child_ptr, expected_count, remaining_count - 1, pred, accumulator);
        accumulator.pop_back();

        if (result.size() == size_t(expected_count)) {
          return result;
        }
        if (best_result.size() < result.size()) {
          best_result = std::move(result);
        }
      }

      return best_result;
    }

    Scope scope_;

    // Invariant: a contiguous prefix of the 'nodes' storage will contain
    // the top-level children.
    Vec<FragmentNode> nodes_;

    // The candidates stored in this chain, mapped to a bitvec indicating the
    // depths where the candidate is stored.
    HashMap<CandidateHash, BitVec> candidates_;

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<FragmentValidator> validator_;
    log::Logger logger_;
  };

}  // namespace fragchain::parachain::fragment
