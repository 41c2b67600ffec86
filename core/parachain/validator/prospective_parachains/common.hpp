/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/variant.hpp>
#include <scale/bitvec.hpp>

#include "common/visitor.hpp"
#include "crypto/hasher.hpp"
#include "parachain/inclusion_emulator.hpp"
#include "parachain/types.hpp"

namespace fragchain::parachain::fragment {

  template <typename... Args>
  using HashMap = std::unordered_map<Args...>;
  template <typename... Args>
  using HashSet = std::unordered_set<Args...>;
  template <typename... Args>
  using Vec = std::vector<Args...>;
  using BitVec = ::scale::BitVec;
  using ParaId = ParachainId;
  template <typename... Args>
  using Option = std::optional<Args...>;
  template <typename... Args>
  using Map = std::map<Args...>;

  /// The state of a candidate.
  ///
  /// Candidates aren't even considered until they've at least been seconded.
  enum CandidateState {
    /// The candidate has been introduced in a spam-protected way but
    /// is not necessarily backed.
    Introduced,
    /// The candidate has been seconded.
    Seconded,
    /// The candidate has been completely backed by the group.
    Backed,
  };

  struct HypotheticalCandidateComplete {
    /// The hash of the candidate.
    CandidateHash candidate_hash;
    /// The receipt of the candidate.
    network::CommittedCandidateReceipt receipt;
    /// The persisted validation data of the candidate.
    runtime::PersistedValidationData persisted_validation_data;
  };

  struct HypotheticalCandidateIncomplete {
    /// The claimed hash of the candidate.
    CandidateHash candidate_hash;
    /// The claimed para-ID of the candidate.
    ParachainId candidate_para;
    /// The claimed head-data hash of the candidate.
    Hash parent_head_data_hash;
    /// The claimed relay parent of the candidate.
    Hash candidate_relay_parent;
  };

  /// A hypothetical candidate to be evaluated for membership in a fragment
  /// chain.
  ///
  /// Complete candidates have already had their candidate receipt fetched,
  /// while incomplete candidates are simply claims about properties that a
  /// fetched candidate would have. Complete candidates can be evaluated more
  /// strictly than incomplete candidates.
  using HypotheticalCandidate = boost::variant<HypotheticalCandidateComplete,
                                               HypotheticalCandidateIncomplete>;

  inline Hash parentHeadDataHash(const crypto::Hasher &hasher,
                                 const HypotheticalCandidate &candidate) {
    return visit_in_place(
        candidate,
        [&](const HypotheticalCandidateComplete &v) {
          return hasher.blake2b_256(v.persisted_validation_data.parent_head);
        },
        [&](const HypotheticalCandidateIncomplete &v) {
          return v.parent_head_data_hash;
        });
  }

  inline std::reference_wrapper<const Hash> relayParent(
      const HypotheticalCandidate &candidate) {
    return visit_in_place(
        candidate,
        [](const HypotheticalCandidateComplete &v)
            -> std::reference_wrapper<const Hash> {
          return v.receipt.descriptor.relay_parent;
        },
        [](const HypotheticalCandidateIncomplete &v)
            -> std::reference_wrapper<const Hash> {
          return v.candidate_relay_parent;
        });
  }

  inline const CandidateHash &candidateHash(
      const HypotheticalCandidate &candidate) {
    auto p = visit_in_place(
        candidate,
        [](const auto &v) -> std::reference_wrapper<const CandidateHash> {
          return v.candidate_hash;
        });
    return p.get();
  }

}  // namespace fragchain::parachain::fragment
