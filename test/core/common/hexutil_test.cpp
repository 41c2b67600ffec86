/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using namespace fragchain::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST(Common, Hexutil_Hex) {
  std::vector<uint8_t> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
  ASSERT_EQ(hex_lower({}), ""s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  ASSERT_OUTCOME_SUCCESS(actual, unhex("00010204081020fF"));
  ASSERT_EQ(actual,
            (std::vector<uint8_t>{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20,
                                  0xff}));
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

TEST(Common, Hexutil_UnhexWith0x) {
  ASSERT_OUTCOME_SUCCESS(actual, unhexWith0x("0x0a0b"));
  ASSERT_EQ(actual, (std::vector<uint8_t>{0x0a, 0x0b}));

  EXPECT_EC(unhexWith0x("0a0b"), UnhexError::MISSING_0X_PREFIX);
}
