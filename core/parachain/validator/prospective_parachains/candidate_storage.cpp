/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/candidate_storage.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(fragchain::parachain::fragment,
                            CandidateStorage::Error,
                            e) {
  using E = decltype(e);
  switch (e) {
    case E::CANDIDATE_ALREADY_KNOWN:
      return "CandidateStorage: candidate already known";
    case E::PERSISTED_VALIDATION_DATA_MISMATCH:
      return "CandidateStorage: persisted validation data mismatch";
  }
  return "CandidateStorage: unknown error";
}

namespace fragchain::parachain::fragment {

  CandidateStorage::CandidateStorage(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)},
        logger_{log::createLogger("CandidateStorage", "candidate_storage")} {
    BOOST_ASSERT(hasher_);
  }

  outcome::result<CandidateHash> CandidateStorage::add_candidate(
      const network::CommittedCandidateReceipt &candidate,
      const runtime::PersistedValidationData &persisted_validation_data,
      CandidateState initial_state) {
    const auto candidate_hash = network::candidateHash(*hasher_, candidate);
    if (by_candidate_hash_.contains(candidate_hash)) {
      return Error::CANDIDATE_ALREADY_KNOWN;
    }

    if (runtime::persistedValidationDataHash(*hasher_,
                                             persisted_validation_data)
        != candidate.descriptor.persisted_data_hash) {
      return Error::PERSISTED_VALIDATION_DATA_MISMATCH;
    }

    const auto parent_head_hash =
        hasher_->blake2b_256(persisted_validation_data.parent_head);
    const auto output_head_hash =
        hasher_->blake2b_256(candidate.commitments.para_head);

    by_parent_head_[parent_head_hash].insert(candidate_hash);
    by_output_head_[output_head_hash].insert(candidate_hash);
    by_candidate_hash_.emplace(
        candidate_hash,
        CandidateEntry{
            .candidate_hash = candidate_hash,
            .parent_head_data_hash = parent_head_hash,
            .output_head_data_hash = output_head_hash,
            .relay_parent = candidate.descriptor.relay_parent,
            .candidate = toProspectiveCandidate(candidate,
                                                persisted_validation_data),
            .state = initial_state,
        });

    SL_TRACE(logger_,
             "Candidate added. (hash={}, parent head={}, output head={})",
             candidate_hash,
             parent_head_hash,
             output_head_hash);
    return candidate_hash;
  }

  void CandidateStorage::remove_from_index(
      Index &index, const Hash &key, const CandidateHash &candidate_hash) {
    if (auto it = index.find(key); it != index.end()) {
      it->second.erase(candidate_hash);
      if (it->second.empty()) {
        index.erase(it);
      }
    }
  }

  void CandidateStorage::remove_candidate(const CandidateHash &candidate_hash) {
    auto it = by_candidate_hash_.find(candidate_hash);
    if (it == by_candidate_hash_.end()) {
      return;
    }

    remove_from_index(
        by_parent_head_, it->second.parent_head_data_hash, candidate_hash);
    remove_from_index(
        by_output_head_, it->second.output_head_data_hash, candidate_hash);
    by_candidate_hash_.erase(it);
    SL_TRACE(logger_, "Candidate removed. (hash={})", candidate_hash);
  }

  void CandidateStorage::mark_seconded(const CandidateHash &candidate_hash) {
    auto it = by_candidate_hash_.find(candidate_hash);
    if (it == by_candidate_hash_.end()) {
      SL_TRACE(logger_,
               "Candidate marked as seconded but not found in storage. "
               "(hash={})",
               candidate_hash);
      return;
    }
    SL_TRACE(
        logger_, "Candidate marked as seconded. (hash={})", candidate_hash);
    if (it->second.state != CandidateState::Backed) {
      it->second.state = CandidateState::Seconded;
    }
  }

  void CandidateStorage::mark_backed(const CandidateHash &candidate_hash) {
    auto it = by_candidate_hash_.find(candidate_hash);
    if (it == by_candidate_hash_.end()) {
      SL_TRACE(logger_,
               "Candidate marked as backed but not found in storage. "
               "(hash={})",
               candidate_hash);
      return;
    }
    SL_TRACE(logger_, "Candidate marked as backed. (hash={})", candidate_hash);
    it->second.state = CandidateState::Backed;
  }

  bool CandidateStorage::is_backed(const CandidateHash &candidate_hash) const {
    auto it = by_candidate_hash_.find(candidate_hash);
    return it != by_candidate_hash_.end()
       and it->second.state == CandidateState::Backed;
  }

  bool CandidateStorage::contains(const CandidateHash &candidate_hash) const {
    return by_candidate_hash_.contains(candidate_hash);
  }

  Option<std::reference_wrapper<const HeadData>>
  CandidateStorage::head_data_by_hash(const Hash &hash) const {
    auto search = [&](const Index &index)
        -> Option<std::reference_wrapper<const CandidateEntry>> {
      if (auto it = index.find(hash); it != index.end()) {
        if (!it->second.empty()) {
          return get(*it->second.begin());
        }
      }
      return std::nullopt;
    };

    if (auto e = search(by_output_head_)) {
      return {{e->get().candidate.commitments.para_head}};
    }
    if (auto e = search(by_parent_head_)) {
      return {{e->get().candidate.persisted_validation_data.parent_head}};
    }
    return std::nullopt;
  }

  Option<Hash> CandidateStorage::relay_parent_by_candidate_hash(
      const CandidateHash &candidate_hash) const {
    if (auto it = by_candidate_hash_.find(candidate_hash);
        it != by_candidate_hash_.end()) {
      return it->second.relay_parent;
    }
    return std::nullopt;
  }

  Option<std::reference_wrapper<const CandidateEntry>> CandidateStorage::get(
      const CandidateHash &candidate_hash) const {
    if (auto it = by_candidate_hash_.find(candidate_hash);
        it != by_candidate_hash_.end()) {
      return {{it->second}};
    }
    return std::nullopt;
  }

}  // namespace fragchain::parachain::fragment
