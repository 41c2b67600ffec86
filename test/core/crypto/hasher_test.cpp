/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using fragchain::common::BufferView;
using fragchain::common::Hash256;
using fragchain::crypto::HasherImpl;

class HasherFixture : public testing::Test {
 protected:
  HasherImpl hasher;
};

/**
 * @given empty input
 * @when blake2b_256 hash is calculated
 * @then the well-known digest of the empty string is returned
 */
TEST_F(HasherFixture, blake2b_256_empty) {
  ASSERT_OUTCOME_SUCCESS(
      expected,
      Hash256::fromHex(
          "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"));
  ASSERT_EQ(hasher.blake2b_256(BufferView{}), expected);
}

/**
 * @given two inputs differing in one byte
 * @when blake2b_256 hash is calculated for each of them
 * @then hashes differ and hashing the same input twice gives the same value
 */
TEST_F(HasherFixture, blake2b_256_distinguishes_inputs) {
  const std::vector<uint8_t> first{0x0a, 0x0b};
  const std::vector<uint8_t> second{0x0a, 0x0c};

  const auto hash = hasher.blake2b_256(first);
  ASSERT_EQ(hash, hasher.blake2b_256(first));
  ASSERT_NE(hash, hasher.blake2b_256(second));
}
