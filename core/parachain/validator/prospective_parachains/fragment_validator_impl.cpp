/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/prospective_parachains/fragment_validator_impl.hpp"

namespace fragchain::parachain::fragment {

  outcome::result<Constraints> FragmentValidatorImpl::applyModifications(
      const Constraints &constraints,
      const ConstraintModifications &modifications) const {
    return constraints.applyModifications(modifications);
  }

  outcome::result<Fragment> FragmentValidatorImpl::createFragment(
      const RelayChainBlockInfo &relay_parent,
      const Constraints &constraints,
      const ProspectiveCandidate &candidate) const {
    return Fragment::create(relay_parent, constraints, candidate);
  }

}  // namespace fragchain::parachain::fragment
