/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/scope.hpp"
#include "core/parachain/parachain_test_harness.hpp"

using namespace fragchain::parachain::fragment;

class ScopeTest : public ProspectiveParachainsTest {
  void SetUp() override {
    ProspectiveParachainsTest::SetUp();
  }

  void TearDown() override {
    ProspectiveParachainsTest::TearDown();
  }
};

TEST_F(ScopeTest, scope_only_takes_ancestors_up_to_min) {
  const auto relay_parent = make_relay_block(0, 5);
  Vec<RelayChainBlockInfo> ancestors = {
      make_relay_block(4, 4),
      make_relay_block(3, 3),
      make_relay_block(2, 2),
  };

  const size_t max_depth = 2;
  const auto base_constraints = make_constraints(3, {2}, {1, 2, 3});

  Vec<PendingAvailability> pending_availability;
  ASSERT_OUTCOME_SUCCESS(scope,
                         Scope::with_ancestors(1,
                                               relay_parent,
                                               base_constraints,
                                               pending_availability,
                                               max_depth,
                                               ancestors));
  ASSERT_EQ(scope.ancestors.size(), 2);
  ASSERT_EQ(scope.ancestors_by_hash.size(), 2);
  ASSERT_EQ(scope.earliest_relay_parent(), make_relay_block(3, 3));
  ASSERT_FALSE(scope.ancestor_by_hash(fromNumber(2)).has_value());
}

TEST_F(ScopeTest, scope_ignores_ancestors_when_min_is_relay_parent) {
  const auto relay_parent = make_relay_block(0, 5);
  Vec<RelayChainBlockInfo> ancestors = {make_relay_block(4, 4)};

  const auto base_constraints = make_constraints(5, {}, {1, 2, 3});

  ASSERT_OUTCOME_SUCCESS(
      scope,
      Scope::with_ancestors(
          1, relay_parent, base_constraints, {}, 2, ancestors));
  ASSERT_TRUE(scope.ancestors.empty());
  ASSERT_TRUE(scope.ancestors_by_hash.empty());
  ASSERT_EQ(scope.earliest_relay_parent(), relay_parent);
}

TEST_F(ScopeTest, scope_rejects_unordered_ancestors) {
  const auto relay_parent = make_relay_block(0, 5);
  Vec<RelayChainBlockInfo> ancestors = {
      make_relay_block(4, 4),
      make_relay_block(2, 2),
      make_relay_block(3, 3),
  };

  const size_t max_depth = 2;
  const auto base_constraints = make_constraints(0, {2}, {1, 2, 3});

  Vec<PendingAvailability> pending_availability;
  UnexpectedAncestor details{};
  ASSERT_EQ(Scope::with_ancestors(1,
                                  relay_parent,
                                  base_constraints,
                                  pending_availability,
                                  max_depth,
                                  ancestors,
                                  &details)
                .error(),
            Scope::Error::UNEXPECTED_ANCESTOR);
  ASSERT_EQ(details, (UnexpectedAncestor{.number = 2, .prev = 4}));
}

TEST_F(ScopeTest, scope_rejects_ancestor_for_0_block) {
  const auto relay_parent = make_relay_block(0, 0);
  Vec<RelayChainBlockInfo> ancestors = {RelayChainBlockInfo{
      .hash = fromNumber(99),
      .number = 99999,
      .storage_root = fromNumber(69),
  }};

  const size_t max_depth = 2;
  const auto base_constraints = make_constraints(0, {}, {1, 2, 3});

  Vec<PendingAvailability> pending_availability;
  UnexpectedAncestor details{};
  ASSERT_EQ(Scope::with_ancestors(1,
                                  relay_parent,
                                  base_constraints,
                                  pending_availability,
                                  max_depth,
                                  ancestors,
                                  &details)
                .error(),
            Scope::Error::UNEXPECTED_ANCESTOR);
  ASSERT_EQ(details, (UnexpectedAncestor{.number = 99999, .prev = 0}));
}

TEST_F(ScopeTest, scope_rejects_ancestors_that_skip_blocks) {
  const auto relay_parent = make_relay_block(10, 10);
  Vec<RelayChainBlockInfo> ancestors = {make_relay_block(8, 8)};

  const size_t max_depth = 2;
  const auto base_constraints = make_constraints(8, {8, 9}, {1, 2, 3});

  Vec<PendingAvailability> pending_availability;
  ASSERT_EQ(Scope::with_ancestors(1,
                                  relay_parent,
                                  base_constraints,
                                  pending_availability,
                                  max_depth,
                                  ancestors)
                .error(),
            Scope::Error::UNEXPECTED_ANCESTOR);
}

TEST_F(ScopeTest, scope_lookups) {
  const auto relay_parent = make_relay_block(10, 10);
  Vec<RelayChainBlockInfo> ancestors = {
      make_relay_block(9, 9),
      make_relay_block(8, 8),
  };
  const auto base_constraints = make_constraints(0, {}, {1, 2, 3});
  const Vec<PendingAvailability> pending_availability{PendingAvailability{
      .candidate_hash = fromNumber(42),
      .relay_parent = make_relay_block(5, 5),
  }};

  ASSERT_OUTCOME_SUCCESS(scope,
                         Scope::with_ancestors(3,
                                               relay_parent,
                                               base_constraints,
                                               pending_availability,
                                               4,
                                               ancestors));
  ASSERT_EQ(scope.para, 3);
  ASSERT_EQ(scope.max_depth, 4);
  ASSERT_EQ(scope.earliest_relay_parent(), make_relay_block(8, 8));

  ASSERT_EQ(scope.ancestor_by_hash(fromNumber(10)).value().get(),
            relay_parent);
  ASSERT_EQ(scope.ancestor_by_hash(fromNumber(9)).value().get(),
            make_relay_block(9, 9));
  ASSERT_FALSE(scope.ancestor_by_hash(fromNumber(5)).has_value());

  auto pending = scope.get_pending_availability(fromNumber(42));
  ASSERT_TRUE(pending.has_value());
  ASSERT_EQ(pending->get().relay_parent, make_relay_block(5, 5));
  ASSERT_FALSE(scope.get_pending_availability(fromNumber(43)).has_value());
}

TEST_F(ScopeTest, scope_from_backing_params_limits_ancestry) {
  const auto relay_parent = make_relay_block(10, 10);
  Vec<RelayChainBlockInfo> ancestors = {
      make_relay_block(9, 9),
      make_relay_block(8, 8),
      make_relay_block(7, 7),
  };
  const auto base_constraints = make_constraints(0, {}, {1, 2, 3});

  ASSERT_OUTCOME_SUCCESS(
      scope,
      scopeFromBackingParams(1,
                             relay_parent,
                             base_constraints,
                             {},
                             AsyncBackingParams{.max_candidate_depth = 3,
                                                .allowed_ancestry_len = 2},
                             ancestors));
  ASSERT_EQ(scope.max_depth, 3);
  ASSERT_EQ(scope.ancestors.size(), 2);
  ASSERT_EQ(scope.earliest_relay_parent(), make_relay_block(8, 8));

  ASSERT_OUTCOME_SUCCESS(
      no_ancestry,
      scopeFromBackingParams(1,
                             relay_parent,
                             base_constraints,
                             {},
                             AsyncBackingParams{.max_candidate_depth = 0,
                                                .allowed_ancestry_len = 0},
                             ancestors));
  ASSERT_EQ(no_ancestry.max_depth, 0);
  ASSERT_TRUE(no_ancestry.ancestors.empty());
  ASSERT_EQ(no_ancestry.earliest_relay_parent(), relay_parent);
}
