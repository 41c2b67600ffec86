/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <blake2.h>

#include <boost/assert.hpp>

namespace fragchain::crypto {
  using common::Hash256;

  Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    Hash256 out;
    // libb2 argument order: out, in, key
    BOOST_VERIFY(
        blake2b(out.data(), 32, data.data(), data.size(), nullptr, 0) == 0);
    return out;
  }

}  // namespace fragchain::crypto
