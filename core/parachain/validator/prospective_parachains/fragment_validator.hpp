/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "parachain/inclusion_emulator.hpp"

namespace fragchain::parachain::fragment {

  /**
   * Validity checks the fragment chain relies on. The chain only
   * distinguishes success from failure of these operations.
   */
  class FragmentValidator {
   public:
    virtual ~FragmentValidator() = default;

    /// Derive the constraints of a child from the base constraints and the
    /// cumulative modifications of its ancestors.
    virtual outcome::result<Constraints> applyModifications(
        const Constraints &constraints,
        const ConstraintModifications &modifications) const = 0;

    /// Check the candidate against the constraints at the given relay-parent.
    virtual outcome::result<Fragment> createFragment(
        const RelayChainBlockInfo &relay_parent,
        const Constraints &constraints,
        const ProspectiveCandidate &candidate) const = 0;
  };

}  // namespace fragchain::parachain::fragment
