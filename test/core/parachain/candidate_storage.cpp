/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/candidate_storage.hpp"
#include "core/parachain/parachain_test_harness.hpp"

using namespace fragchain::parachain::fragment;

class CandidateStorageTest : public ProspectiveParachainsTest {
  void SetUp() override {
    ProspectiveParachainsTest::SetUp();
  }

  void TearDown() override {
    ProspectiveParachainsTest::TearDown();
  }
};

TEST_F(CandidateStorageTest, candidate_storage_methods) {
  CandidateStorage storage{hasher_};
  const Hash relay_parent = fromNumber(69);

  const auto &[pvd, candidate] =
      make_committed_candidate(5, relay_parent, 8, {4, 5, 6}, {1, 2, 3}, 7);

  const Hash candidate_hash = hash(candidate);
  const Hash parent_head_hash = hashOf(pvd.parent_head);
  const Hash output_head_hash = hashOf(candidate.commitments.para_head);

  auto calculate_count = [&](const Hash &h) {
    size_t count = 0;
    storage.iter_para_children(h, [&](const auto &) { ++count; });
    return count;
  };

  // Invalid pvd hash
  auto wrong_pvd = pvd;
  wrong_pvd.max_pov_size = 0;
  ASSERT_EQ(storage.add_candidate(candidate, wrong_pvd).error(),
            CandidateStorage::Error::PERSISTED_VALIDATION_DATA_MISMATCH);
  ASSERT_FALSE(storage.contains(candidate_hash));

  ASSERT_EQ(calculate_count(parent_head_hash), 0);
  ASSERT_FALSE(storage.head_data_by_hash(output_head_hash).has_value());
  ASSERT_FALSE(storage.head_data_by_hash(parent_head_hash).has_value());
  ASSERT_EQ(storage.len(), std::make_pair(size_t(0), size_t(0)));

  // Add a valid candidate.
  ASSERT_OUTCOME_SUCCESS(added, storage.add_candidate(candidate, pvd));
  ASSERT_EQ(added, candidate_hash);
  ASSERT_TRUE(storage.contains(candidate_hash));
  ASSERT_FALSE(storage.is_backed(candidate_hash));
  ASSERT_EQ(storage.get(candidate_hash)->get().state,
            CandidateState::Introduced);

  ASSERT_EQ(calculate_count(parent_head_hash), 1);
  ASSERT_EQ(calculate_count(output_head_hash), 0);
  ASSERT_EQ(storage.head_data_by_hash(output_head_hash).value().get(),
            candidate.commitments.para_head);
  ASSERT_EQ(storage.head_data_by_hash(parent_head_hash).value().get(),
            pvd.parent_head);
  ASSERT_EQ(storage.relay_parent_by_candidate_hash(candidate_hash),
            relay_parent);
  ASSERT_EQ(storage.len(), std::make_pair(size_t(1), size_t(1)));

  // Re-adding a candidate fails, even with a mismatching pvd.
  ASSERT_EQ(storage.add_candidate(candidate, pvd).error(),
            CandidateStorage::Error::CANDIDATE_ALREADY_KNOWN);
  ASSERT_EQ(storage.add_candidate(candidate, wrong_pvd).error(),
            CandidateStorage::Error::CANDIDATE_ALREADY_KNOWN);

  // Rejected insertions leave every index untouched.
  ASSERT_EQ(storage.len(), std::make_pair(size_t(1), size_t(1)));
  ASSERT_EQ(calculate_count(parent_head_hash), 1);
  ASSERT_EQ(storage.head_data_by_hash(output_head_hash).value().get(),
            candidate.commitments.para_head);
  ASSERT_EQ(storage.get(candidate_hash)->get().state,
            CandidateState::Introduced);

  storage.mark_seconded(candidate_hash);
  ASSERT_EQ(storage.get(candidate_hash)->get().state,
            CandidateState::Seconded);

  // Now mark it as backed
  storage.mark_backed(candidate_hash);
  // Marking it twice is fine.
  storage.mark_backed(candidate_hash);
  ASSERT_TRUE(storage.is_backed(candidate_hash));

  // A backed candidate is not downgraded.
  storage.mark_seconded(candidate_hash);
  ASSERT_TRUE(storage.is_backed(candidate_hash));

  // Unknown candidates are ignored.
  storage.mark_backed(fromNumber(100));
  storage.mark_seconded(fromNumber(100));
  ASSERT_FALSE(storage.contains(fromNumber(100)));
  ASSERT_FALSE(storage.is_backed(fromNumber(100)));
  ASSERT_FALSE(storage.relay_parent_by_candidate_hash(fromNumber(100)));

  // Remove candidate and re-add it later in backed state.
  storage.remove_candidate(candidate_hash);
  ASSERT_FALSE(storage.contains(candidate_hash));

  // Removing it twice is fine.
  storage.remove_candidate(candidate_hash);
  ASSERT_FALSE(storage.contains(candidate_hash));
  ASSERT_EQ(calculate_count(parent_head_hash), 0);
  ASSERT_FALSE(storage.head_data_by_hash(output_head_hash).has_value());
  ASSERT_FALSE(storage.head_data_by_hash(parent_head_hash).has_value());
  ASSERT_EQ(storage.len(), std::make_pair(size_t(0), size_t(0)));

  ASSERT_OUTCOME_SUCCESS_TRY(
      storage.add_candidate(candidate, pvd, CandidateState::Backed));
  ASSERT_TRUE(storage.contains(candidate_hash));
  ASSERT_TRUE(storage.is_backed(candidate_hash));
  ASSERT_EQ(calculate_count(parent_head_hash), 1);
  ASSERT_EQ(storage.head_data_by_hash(output_head_hash).value().get(),
            candidate.commitments.para_head);
  ASSERT_EQ(storage.head_data_by_hash(parent_head_hash).value().get(),
            pvd.parent_head);
  ASSERT_EQ(storage.relay_parent_by_candidate_hash(candidate_hash),
            relay_parent);
  ASSERT_EQ(storage.len(), std::make_pair(size_t(1), size_t(1)));
}

TEST_F(CandidateStorageTest, children_are_visited_in_hash_order) {
  CandidateStorage storage{hasher_};
  const Hash relay_parent = fromNumber(69);
  const HeadData parent_head{4, 5, 6};

  std::vector<Hash> expected;
  for (uint8_t i = 0; i < 5; ++i) {
    const auto &[pvd, candidate] = make_committed_candidate(
        5, relay_parent, 8, parent_head, {1, 2, i}, 7);
    ASSERT_OUTCOME_SUCCESS(candidate_hash,
                           storage.add_candidate(candidate, pvd));
    expected.emplace_back(candidate_hash);
  }
  std::sort(expected.begin(), expected.end());

  std::vector<Hash> visited;
  storage.iter_para_children(hashOf(parent_head),
                             [&](const CandidateEntry &entry) {
                               visited.emplace_back(entry.candidate_hash);
                             });
  ASSERT_EQ(visited, expected);
  ASSERT_EQ(storage.len(), std::make_pair(size_t(1), size_t(5)));
}

TEST_F(CandidateStorageTest, retain_keeps_indexes_consistent) {
  CandidateStorage storage{hasher_};
  const Hash relay_parent = fromNumber(69);

  const auto &[pvd_a, candidate_a] =
      make_committed_candidate(5, relay_parent, 8, {0}, {1}, 7);
  const auto &[pvd_b, candidate_b] =
      make_committed_candidate(5, relay_parent, 8, {1}, {2}, 7);
  const Hash hash_a = hash(candidate_a);
  const Hash hash_b = hash(candidate_b);

  ASSERT_OUTCOME_SUCCESS_TRY(storage.add_candidate(candidate_a, pvd_a));
  ASSERT_OUTCOME_SUCCESS_TRY(storage.add_candidate(candidate_b, pvd_b));
  ASSERT_EQ(storage.len(), std::make_pair(size_t(2), size_t(2)));

  storage.retain([&](const CandidateHash &h) { return h != hash_a; });

  ASSERT_FALSE(storage.contains(hash_a));
  ASSERT_TRUE(storage.contains(hash_b));
  ASSERT_EQ(storage.len(), std::make_pair(size_t(1), size_t(1)));

  // Head-data {0} was only known through the removed candidate.
  ASSERT_FALSE(storage.head_data_by_hash(hashOf(HeadData{0})).has_value());

  // Head-data {1} is still the parent of the remaining candidate.
  ASSERT_EQ(storage.head_data_by_hash(hashOf(HeadData{1})).value().get(),
            HeadData{1});
  ASSERT_EQ(storage.head_data_by_hash(hashOf(HeadData{2})).value().get(),
            HeadData{2});

  size_t children = 0;
  storage.iter_para_children(hashOf(HeadData{0}),
                             [&](const auto &) { ++children; });
  ASSERT_EQ(children, 0);

  storage.retain([](const CandidateHash &) { return false; });
  ASSERT_EQ(storage.len(), std::make_pair(size_t(0), size_t(0)));
}
