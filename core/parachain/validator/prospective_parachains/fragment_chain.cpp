/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/fragment_chain.hpp"

#include <boost/assert.hpp>

namespace fragchain::parachain::fragment {

  namespace {
    Vec<size_t> setBits(const BitVec &bv) {
      Vec<size_t> res;
      for (size_t ix = 0; ix < bv.bits.size(); ++ix) {
        if (bv.bits[ix]) {
          res.emplace_back(ix);
        }
      }
      return res;
    }

    void shiftPointer(NodePointer &pointer, size_t from) {
      if (auto ptr = boost::get<NodePointerStorage>(&pointer);
          ptr != nullptr && *ptr >= from) {
        ++*ptr;
      }
    }
  }  // namespace

  FragmentChain::FragmentChain(Scope scope,
                               std::shared_ptr<crypto::Hasher> hasher,
                               std::shared_ptr<FragmentValidator> validator)
      : scope_{std::move(scope)},
        hasher_{std::move(hasher)},
        validator_{std::move(validator)},
        logger_{log::createLogger("FragmentChain", "fragment_chain")} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(validator_);
  }

  FragmentChain FragmentChain::populate(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<FragmentValidator> validator,
      const Scope &scope,
      const CandidateStorage &storage) {
    FragmentChain chain{scope, std::move(hasher), std::move(validator)};
    SL_TRACE(chain.logger_,
             "Instantiating Fragment Chain. (relay parent={}, relay parent "
             "num={}, para id={}, ancestors={})",
             scope.relay_parent.hash,
             scope.relay_parent.number,
             scope.para,
             scope.ancestors.size());

    chain.populate_from_bases(storage, {NodePointer{NodePointerRoot{}}});
    return chain;
  }

  void FragmentChain::repopulate(const CandidateStorage &storage) {
    SL_TRACE(logger_,
             "Repopulating Fragment Chain. (relay parent={}, para id={}, "
             "nodes={})",
             scope_.relay_parent.hash,
             scope_.para,
             nodes_.size());
    nodes_.clear();
    candidates_.clear();
    populate_from_bases(storage, {NodePointer{NodePointerRoot{}}});
  }

  Vec<CandidateHash> FragmentChain::candidates() const {
    Vec<CandidateHash> res;
    res.reserve(candidates_.size());
    for (const auto &pair : candidates_) {
      res.push_back(pair.first);
    }
    return res;
  }

  Option<Vec<size_t>> FragmentChain::candidate(const CandidateHash &hash) const {
    if (auto it = candidates_.find(hash); it != candidates_.end()) {
      return setBits(it->second);
    }
    return std::nullopt;
  }

  Vec<CandidateHash> FragmentChain::best_chain() const {
    Option<size_t> leaf;
    for (size_t ix = 0; ix < nodes_.size(); ++ix) {
      if (!leaf || nodes_[ix].depth > nodes_[*leaf].depth) {
        leaf = ix;
      }
    }

    Vec<CandidateHash> chain;
    if (!leaf) {
      return chain;
    }

    NodePointer pointer{*leaf};
    while (auto ptr = if_type<NodePointerStorage>(pointer)) {
      const auto &node = nodes_[ptr->get()];
      chain.emplace_back(node.candidate_hash);
      pointer = node.parent;
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
  }

  Option<FragmentChain::ParentInfo> FragmentChain::parent_info(
      const NodePointer &parent_pointer) const {
    return visit_in_place(
        parent_pointer,
        [&](const NodePointerRoot &) -> Option<ParentInfo> {
          return ParentInfo{
              .modifications = ConstraintModifications::identity(),
              .child_depth = 0,
              .earliest_rp = scope_.earliest_relay_parent(),
              .out_of_scope_pending = false,
          };
        },
        [&](const NodePointerStorage &ptr) -> Option<ParentInfo> {
          const auto &node = nodes_[ptr];
          if (auto rp = scope_.ancestor_by_hash(node.relayParent())) {
            return ParentInfo{
                .modifications = node.cumulative_modifications,
                .child_depth = node.depth + 1,
                .earliest_rp = rp->get(),
                .out_of_scope_pending = false,
            };
          }
          if (auto pending =
                  scope_.get_pending_availability(node.candidate_hash)) {
            return ParentInfo{
                .modifications = node.cumulative_modifications,
                .child_depth = node.depth + 1,
                .earliest_rp = pending->get().relay_parent,
                .out_of_scope_pending = true,
            };
          }
          SL_WARN(logger_,
                  "Node relay parent is neither in scope nor pending "
                  "availability. (candidate hash={}, relay parent={})",
                  node.candidate_hash,
                  node.relayParent());
          return std::nullopt;
        });
  }

  void FragmentChain::populate_from_bases(
      const CandidateStorage &storage, const Vec<NodePointer> &initial_bases) {
    Vec<NodePointer> parents = initial_bases;
    while (!parents.empty()) {
      Vec<NodePointer> added;

      // `parents` may be shifted while iterating when a child of the root is
      // inserted in front of deeper nodes.
      for (size_t parent_ix = 0; parent_ix < parents.size(); ++parent_ix) {
        const NodePointer parent_pointer = parents[parent_ix];
        auto info = parent_info(parent_pointer);
        if (!info) {
          continue;
        }

        if (info->child_depth > scope_.max_depth) {
          continue;
        }

        auto child_constraints_res = validator_->applyModifications(
            scope_.base_constraints, info->modifications);
        if (child_constraints_res.has_error()) {
          SL_DEBUG(logger_,
                   "Failed to apply modifications. (error={})",
                   child_constraints_res.error().message());
          continue;
        }

        const auto &child_constraints = child_constraints_res.value();
        const auto required_head_hash =
            hasher_->blake2b_256(child_constraints.required_parent);

        storage.iter_para_children(
            required_head_hash, [&](const CandidateEntry &candidate) {
              auto pending =
                  scope_.get_pending_availability(candidate.candidate_hash);
              Option<RelayChainBlockInfo> relay_parent_opt;
              if (pending) {
                relay_parent_opt = pending->get().relay_parent;
              } else if (auto rp =
                             scope_.ancestor_by_hash(candidate.relay_parent)) {
                relay_parent_opt = rp->get();
              }
              if (!relay_parent_opt) {
                return;
              }
              const auto &relay_parent = *relay_parent_opt;

              BlockNumber min_relay_parent_number;
              if (pending) {
                min_relay_parent_number =
                    is_type<const NodePointerRoot>(parent_pointer)
                        ? pending->get().relay_parent.number
                        : info->earliest_rp.number;
              } else {
                min_relay_parent_number =
                    std::max(info->earliest_rp.number,
                             scope_.earliest_relay_parent().number);
              }

              // Relay parents never move backwards along the chain.
              if (relay_parent.number < min_relay_parent_number) {
                return;
              }

              if (node_has_candidate_child(parent_pointer,
                                           candidate.candidate_hash)) {
                return;
              }

              auto constraints = child_constraints;
              if (pending) {
                constraints.min_relay_parent_number =
                    pending->get().relay_parent.number;
              }

              auto fragment_res = validator_->createFragment(
                  relay_parent, constraints, candidate.candidate);
              if (fragment_res.has_error()) {
                SL_DEBUG(logger_,
                         "Failed to instantiate fragment. (relay parent={}, "
                         "candidate hash={}, error={})",
                         relay_parent.hash,
                         candidate.candidate_hash,
                         fragment_res.error().message());
                return;
              }

              Fragment &fragment = fragment_res.value();
              ConstraintModifications cumulative_modifications =
                  info->modifications;
              cumulative_modifications.stack(
                  fragment.constraintModifications());

              const auto ix = insert_node(FragmentNode{
                  .parent = parent_pointer,
                  .fragment = std::move(fragment),
                  .candidate_hash = candidate.candidate_hash,
                  .depth = info->child_depth,
                  .cumulative_modifications =
                      std::move(cumulative_modifications),
                  .children = {}});

              if (ix + 1 != nodes_.size()) {
                for (auto &p : parents) {
                  shiftPointer(p, ix);
                }
                for (auto &p : added) {
                  shiftPointer(p, ix);
                }
              }
              added.emplace_back(ix);
            });
      }

      parents = std::move(added);
    }
  }

  void FragmentChain::add_and_populate(const CandidateHash &hash,
                                       const CandidateStorage &storage) {
    auto opt_candidate_entry = storage.get(hash);
    if (!opt_candidate_entry) {
      return;
    }

    const auto &candidate_parent = opt_candidate_entry->get()
                                       .candidate.persisted_validation_data
                                       .parent_head;

    Vec<NodePointer> bases{};
    if (scope_.base_constraints.required_parent == candidate_parent) {
      bases.emplace_back(NodePointerRoot{});
    }

    for (size_t ix = 0ull; ix < nodes_.size(); ++ix) {
      const auto &n = nodes_[ix];
      if (n.cumulative_modifications.required_parent
          && n.cumulative_modifications.required_parent.value()
                 == candidate_parent) {
        bases.emplace_back(ix);
      }
    }

    populate_from_bases(storage, bases);
  }

  size_t FragmentChain::insert_node(FragmentNode &&node) {
    const auto parent_pointer = node.parent;
    const auto candidate_hash = node.candidate_hash;

    auto &bv = candidates_[candidate_hash];
    if (bv.bits.empty()) {
      bv.bits.resize(scope_.max_depth + 1);
    }
    bv.bits[node.depth] = true;

    if (auto ptr = if_type<const NodePointerStorage>(parent_pointer)) {
      const NodePointerStorage pointer{nodes_.size()};
      nodes_.emplace_back(std::move(node));
      nodes_[ptr->get()].children.emplace_back(pointer, candidate_hash);
      return pointer;
    }

    if (nodes_.empty() || is_type<const NodePointerRoot>(nodes_.back().parent)) {
      nodes_.emplace_back(std::move(node));
      return nodes_.size() - 1;
    }

    // Children of the root occupy a contiguous prefix.
    const auto it = std::find_if(
        nodes_.begin(), nodes_.end(), [](const FragmentNode &item) {
          return !is_type<const NodePointerRoot>(item.parent);
        });
    const auto pos = size_t(std::distance(nodes_.begin(), it));
    nodes_.insert(it, std::move(node));

    for (size_t ix = pos + 1; ix < nodes_.size(); ++ix) {
      auto &n = nodes_[ix];
      shiftPointer(n.parent, pos);
      for (auto &child : n.children) {
        shiftPointer(child.first, pos);
      }
    }
    for (size_t ix = 0; ix < pos; ++ix) {
      for (auto &child : nodes_[ix].children) {
        shiftPointer(child.first, pos);
      }
    }
    return pos;
  }

  Vec<std::pair<NodePointer, CandidateHash>> FragmentChain::children_of(
      const NodePointer &pointer) const {
    return visit_in_place(
        pointer,
        [&](const NodePointerRoot &) {
          Vec<std::pair<NodePointer, CandidateHash>> res;
          for (size_t ix = 0; ix < nodes_.size(); ++ix) {
            const FragmentNode &n = nodes_[ix];
            if (!is_type<const NodePointerRoot>(n.parent)) {
              break;
            }
            res.emplace_back(NodePointerStorage{ix}, n.candidate_hash);
          }
          return res;
        },
        [&](const NodePointerStorage &ptr) {
          if (ptr < nodes_.size()) {
            return nodes_[ptr].children;
          }
          return Vec<std::pair<NodePointer, CandidateHash>>{};
        });
  }

  Option<NodePointer> FragmentChain::node_candidate_child(
      const NodePointer &pointer, const CandidateHash &candidate_hash) const {
    return visit_in_place(
        pointer,
        [&](const NodePointerStorage &ptr) -> Option<NodePointer> {
          if (ptr < nodes_.size()) {
            return nodes_[ptr].candidateChild(candidate_hash);
          }
          return std::nullopt;
        },
        [&](const NodePointerRoot &) -> Option<NodePointer> {
          for (size_t ix = 0ull; ix < nodes_.size(); ++ix) {
            const FragmentNode &n = nodes_[ix];
            if (!is_type<const NodePointerRoot>(n.parent)) {
              break;
            }
            if (n.candidate_hash == candidate_hash) {
              return NodePointer{ix};
            }
          }
          return std::nullopt;
        });
  }

  bool FragmentChain::node_has_candidate_child(
      const NodePointer &pointer, const CandidateHash &candidate_hash) const {
    return node_candidate_child(pointer, candidate_hash).has_value();
  }

  bool FragmentChain::path_contains_backed_only_candidates(
      NodePointer parent_pointer,
      const CandidateStorage &candidate_storage) const {
    while (auto ptr = if_type<NodePointerStorage>(parent_pointer)) {
      const auto &node = nodes_[ptr->get()];
      if (!candidate_storage.is_backed(node.candidate_hash)) {
        return false;
      }
      parent_pointer = node.parent;
    }
    return true;
  }

  Vec<size_t> FragmentChain::hypothetical_depths(
      const CandidateHash &hash,
      const HypotheticalCandidate &candidate,
      const CandidateStorage &candidate_storage,
      bool backed_in_path_only) const {
    if (!backed_in_path_only) {
      if (auto depths = this->candidate(hash)) {
        return std::move(*depths);
      }
    }

    const auto crp = relayParent(candidate);
    Option<std::reference_wrapper<const RelayChainBlockInfo>>
        candidate_relay_parent;
    if (scope_.relay_parent.hash == crp.get()) {
      candidate_relay_parent = scope_.relay_parent;
    } else if (auto it = scope_.ancestors_by_hash.find(crp.get());
               it != scope_.ancestors_by_hash.end()) {
      candidate_relay_parent = it->second;
    }
    if (!candidate_relay_parent) {
      return {};
    }

    const auto max_depth = scope_.max_depth;
    BitVec depths;
    depths.bits.resize(max_depth + 1);

    const auto parent_head_hash = parentHeadDataHash(*hasher_, candidate);

    auto process_parent_pointer = [&](const NodePointer &parent_pointer) {
      auto info = parent_info(parent_pointer);
      if (!info) {
        return;
      }
      const auto &earliest_rp = info->out_of_scope_pending
                                  ? scope_.earliest_relay_parent()
                                  : info->earliest_rp;

      if (info->child_depth > max_depth) {
        return;
      }

      if (earliest_rp.number > candidate_relay_parent->get().number) {
        return;
      }

      auto child_constraints_res = validator_->applyModifications(
          scope_.base_constraints, info->modifications);
      if (child_constraints_res.has_error()) {
        SL_DEBUG(logger_,
                 "Failed to apply modifications. (error={})",
                 child_constraints_res.error().message());
        return;
      }

      const auto &child_constraints = child_constraints_res.value();
      if (parent_head_hash
          != hasher_->blake2b_256(child_constraints.required_parent)) {
        return;
      }

      if (auto value = if_type<const HypotheticalCandidateComplete>(candidate)) {
        auto fragment_res = validator_->createFragment(
            candidate_relay_parent->get(),
            child_constraints,
            toProspectiveCandidate(value->get().receipt,
                                   value->get().persisted_validation_data));
        if (fragment_res.has_error()) {
          SL_DEBUG(logger_,
                   "Hypothetical candidate doesn't fit. (relay parent={}, "
                   "candidate hash={}, error={})",
                   candidate_relay_parent->get().hash,
                   hash,
                   fragment_res.error().message());
          return;
        }
      }

      if (!backed_in_path_only
          || path_contains_backed_only_candidates(parent_pointer,
                                                  candidate_storage)) {
        depths.bits[info->child_depth] = true;
      }
    };

    process_parent_pointer(NodePointerRoot{});
    for (size_t ix = 0; ix < nodes_.size(); ++ix) {
      process_parent_pointer(ix);
    }

    return setBits(depths);
  }

  bool FragmentChain::find_valid_child(
      Ancestors &ancestors,
      const Vec<std::pair<NodePointer, CandidateHash>> &children,
      Option<NodePointer> &next) const {
    next.reset();
    Option<CandidateHash> first_hash;
    for (const auto &[pointer, hash] : children) {
      if (ancestors.erase(hash) == 0) {
        continue;
      }
      if (first_hash) {
        SL_ERROR(logger_,
                 "Trying to find new backable candidates for a parachain for "
                 "which we've backed a fork. This is a bug and the runtime "
                 "should not have allowed it. (para={}, first={}, second={})",
                 scope_.para,
                 *first_hash,
                 hash);
        return false;
      }
      first_hash = hash;
      next = pointer;
    }
    return true;
  }

  Option<NodePointer> FragmentChain::find_ancestor_path(
      Ancestors ancestors) const {
    size_t depth = 0;
    NodePointer last_node{NodePointerRoot{}};
    Option<NodePointer> next_node{NodePointerRoot{}};

    while (next_node) {
      if (depth > scope_.max_depth) {
        return std::nullopt;
      }

      last_node = *next_node;
      if (!find_valid_child(ancestors, children_of(last_node), next_node)) {
        return std::nullopt;
      }
      ++depth;
    }

    return last_node;
  }

}  // namespace fragchain::parachain::fragment
