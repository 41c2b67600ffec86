/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <set>
#include <utility>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "parachain/validator/prospective_parachains/common.hpp"

namespace fragchain::parachain::fragment {

  struct CandidateEntry {
    CandidateHash candidate_hash;
    Hash parent_head_data_hash;
    Hash output_head_data_hash;
    RelayHash relay_parent;
    ProspectiveCandidate candidate;
    CandidateState state;
  };

  /**
   * Known candidates of a single parachain, independent of any relay-parent
   * scope. Candidates are indexed by the hash of the head-data they build on
   * and by the hash of the head-data they produce. All mutations keep the
   * three indexes consistent.
   */
  class CandidateStorage {
   public:
    enum class Error {
      CANDIDATE_ALREADY_KNOWN = 1,
      PERSISTED_VALIDATION_DATA_MISMATCH,
    };

    explicit CandidateStorage(std::shared_ptr<crypto::Hasher> hasher);

    /**
     * Introduce a new candidate.
     * @param candidate committed receipt of the candidate
     * @param persisted_validation_data must hash to the value declared in
     * the candidate descriptor
     * @param initial_state state of the new entry
     * @return hash of the candidate
     */
    outcome::result<CandidateHash> add_candidate(
        const network::CommittedCandidateReceipt &candidate,
        const runtime::PersistedValidationData &persisted_validation_data,
        CandidateState initial_state = CandidateState::Introduced);

    /// Remove a candidate from the store. Unknown hashes are ignored.
    void remove_candidate(const CandidateHash &candidate_hash);

    /// Note that an existing candidate has been seconded. A backed candidate
    /// stays backed.
    void mark_seconded(const CandidateHash &candidate_hash);

    /// Note that an existing candidate has been backed.
    void mark_backed(const CandidateHash &candidate_hash);

    bool is_backed(const CandidateHash &candidate_hash) const;

    bool contains(const CandidateHash &candidate_hash) const;

    /// Retain only candidates which pass the predicate.
    template <typename F>
    void retain(F &&pred /*bool(CandidateHash)*/) {
      for (auto it = by_candidate_hash_.begin();
           it != by_candidate_hash_.end();) {
        if (pred(it->first)) {
          ++it;
        } else {
          SL_TRACE(logger_, "Dropping candidate. (hash={})", it->first);
          it = by_candidate_hash_.erase(it);
        }
      }

      retain_index(by_parent_head_, pred);
      retain_index(by_output_head_, pred);
    }

    /// Get head-data by hash. Candidates producing the head-data are looked
    /// up before candidates building on it.
    Option<std::reference_wrapper<const HeadData>> head_data_by_hash(
        const Hash &hash) const;

    Option<Hash> relay_parent_by_candidate_hash(
        const CandidateHash &candidate_hash) const;

    /// Visit every candidate building on the given parent head-data, in
    /// ascending order of candidate hash.
    template <typename F>
    void iter_para_children(const Hash &parent_head_hash, F &&func) const {
      if (auto it = by_parent_head_.find(parent_head_hash);
          it != by_parent_head_.end()) {
        for (const auto &h : it->second) {
          if (auto c_it = by_candidate_hash_.find(h);
              c_it != by_candidate_hash_.end()) {
            func(c_it->second);
          }
        }
      }
    }

    Option<std::reference_wrapper<const CandidateEntry>> get(
        const CandidateHash &candidate_hash) const;

    /// Number of distinct parent heads and number of candidates.
    std::pair<size_t, size_t> len() const {
      return std::make_pair(by_parent_head_.size(), by_candidate_hash_.size());
    }

   private:
    using Index = HashMap<Hash, std::set<CandidateHash>>;

    static void remove_from_index(Index &index,
                                  const Hash &key,
                                  const CandidateHash &candidate_hash);

    template <typename F>
    static void retain_index(Index &index, const F &pred) {
      for (auto it = index.begin(); it != index.end();) {
        auto &candidates = it->second;
        std::erase_if(candidates,
                      [&](const CandidateHash &h) { return !pred(h); });
        if (candidates.empty()) {
          it = index.erase(it);
        } else {
          ++it;
        }
      }
    }

    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;

    // Index from head data hash to candidate hashes with that head data as a
    // parent.
    Index by_parent_head_;

    // Index from head data hash to candidate hashes outputting that head data.
    Index by_output_head_;

    // Index from candidate hash to the candidate entry.
    HashMap<CandidateHash, CandidateEntry> by_candidate_hash_;
  };

}  // namespace fragchain::parachain::fragment

OUTCOME_HPP_DECLARE_ERROR(fragchain::parachain::fragment,
                          CandidateStorage::Error);
