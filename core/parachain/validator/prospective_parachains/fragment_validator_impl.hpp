/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/validator/prospective_parachains/fragment_validator.hpp"

namespace fragchain::parachain::fragment {

  /// Validator backed by the inclusion emulator.
  class FragmentValidatorImpl : public FragmentValidator {
   public:
    ~FragmentValidatorImpl() override = default;

    outcome::result<Constraints> applyModifications(
        const Constraints &constraints,
        const ConstraintModifications &modifications) const override;

    outcome::result<Fragment> createFragment(
        const RelayChainBlockInfo &relay_parent,
        const Constraints &constraints,
        const ProspectiveCandidate &candidate) const override;
  };

}  // namespace fragchain::parachain::fragment
