/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/inclusion_emulator.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(fragchain::parachain::fragment,
                            Constraints::Error,
                            e) {
  using E = decltype(e);
  switch (e) {
    case E::DISALLOWED_HRMP_WATERMARK:
      return "Constraints: disallowed HRMP watermark";
    case E::NO_SUCH_HRMP_CHANNEL:
      return "Constraints: no such HRMP channel";
    case E::HRMP_BYTES_OVERFLOW:
      return "Constraints: HRMP bytes overflow";
    case E::HRMP_MESSAGE_OVERFLOW:
      return "Constraints: HRMP message overflow";
    case E::UMP_MESSAGE_OVERFLOW:
      return "Constraints: UMP message overflow";
    case E::UMP_BYTES_OVERFLOW:
      return "Constraints: UMP bytes overflow";
    case E::DMP_MESSAGE_UNDERFLOW:
      return "Constraints: DMP message underflow";
    case E::APPLIED_NONEXISTENT_CODE_UPGRADE:
      return "Constraints: applied nonexistent code upgrade";
  }
  return "Constraints: unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY(fragchain::parachain::fragment,
                            Fragment::Error,
                            e) {
  using E = decltype(e);
  switch (e) {
    case E::HRMP_MESSAGES_DESCENDING_OR_DUPLICATE:
      return "Fragment: HRMP messages descending or duplicate";
    case E::PERSISTED_VALIDATION_DATA_MISMATCH:
      return "Fragment: persisted validation data mismatch";
    case E::VALIDATION_CODE_MISMATCH:
      return "Fragment: validation code mismatch";
    case E::RELAY_PARENT_TOO_OLD:
      return "Fragment: relay parent too old";
    case E::CODE_UPGRADE_RESTRICTED:
      return "Fragment: code upgrade restricted";
    case E::CODE_SIZE_TOO_LARGE:
      return "Fragment: code size too large";
    case E::DMP_ADVANCEMENT_RULE:
      return "Fragment: DMP advancement rule violated";
    case E::HRMP_MESSAGES_PER_CANDIDATE_OVERFLOW:
      return "Fragment: HRMP messages per candidate overflow";
    case E::UMP_MESSAGES_PER_CANDIDATE_OVERFLOW:
      return "Fragment: UMP messages per candidate overflow";
  }
  return "Fragment: unknown error";
}

namespace fragchain::parachain::fragment {

  outcome::result<void> Constraints::checkModifications(
      const ConstraintModifications &modifications) const {
    if (modifications.hrmp_watermark) {
      if (auto trunk = if_type<const HrmpWatermarkUpdateTrunk>(
              *modifications.hrmp_watermark)) {
        // Head updates are always valid.
        const auto &watermarks = hrmp_inbound.valid_watermarks;
        if (std::find(watermarks.begin(), watermarks.end(), trunk->get().v)
            == watermarks.end()) {
          return Error::DISALLOWED_HRMP_WATERMARK;
        }
      }
    }

    for (const auto &[id, outbound_hrmp_mod] : modifications.outbound_hrmp) {
      auto it = hrmp_channels_out.find(id);
      if (it == hrmp_channels_out.end()) {
        return Error::NO_SUCH_HRMP_CHANNEL;
      }
      if (it->second.bytes_remaining < outbound_hrmp_mod.bytes_submitted) {
        return Error::HRMP_BYTES_OVERFLOW;
      }
      if (it->second.messages_remaining
          < outbound_hrmp_mod.messages_submitted) {
        return Error::HRMP_MESSAGE_OVERFLOW;
      }
    }

    if (ump_remaining < modifications.ump_messages_sent) {
      return Error::UMP_MESSAGE_OVERFLOW;
    }
    if (ump_remaining_bytes < modifications.ump_bytes_sent) {
      return Error::UMP_BYTES_OVERFLOW;
    }

    if (modifications.dmp_messages_processed > dmp_remaining_messages.size()) {
      return Error::DMP_MESSAGE_UNDERFLOW;
    }

    if (!future_validation_code && modifications.code_upgrade_applied) {
      return Error::APPLIED_NONEXISTENT_CODE_UPGRADE;
    }

    return outcome::success();
  }

  outcome::result<Constraints> Constraints::applyModifications(
      const ConstraintModifications &modifications) const {
    Constraints new_constraints{*this};

    if (modifications.required_parent) {
      new_constraints.required_parent = *modifications.required_parent;
    }

    if (modifications.hrmp_watermark) {
      auto &watermarks = new_constraints.hrmp_inbound.valid_watermarks;
      const auto watermark =
          fromHrmpWatermarkUpdate(*modifications.hrmp_watermark);
      const auto pos =
          std::lower_bound(watermarks.begin(), watermarks.end(), watermark);
      const bool exact = pos != watermarks.end() && *pos == watermark;
      if (!exact
          && is_type<const HrmpWatermarkUpdateTrunk>(
              *modifications.hrmp_watermark)) {
        // Trunk update landing on disallowed watermark is not OK.
        return Error::DISALLOWED_HRMP_WATERMARK;
      }
      watermarks.erase(watermarks.begin(), pos);
    }

    for (const auto &[id, outbound_hrmp_mod] : modifications.outbound_hrmp) {
      auto it = new_constraints.hrmp_channels_out.find(id);
      if (it == new_constraints.hrmp_channels_out.end()) {
        return Error::NO_SUCH_HRMP_CHANNEL;
      }
      auto &outbound = it->second;
      if (outbound.bytes_remaining < outbound_hrmp_mod.bytes_submitted) {
        return Error::HRMP_BYTES_OVERFLOW;
      }
      if (outbound.messages_remaining < outbound_hrmp_mod.messages_submitted) {
        return Error::HRMP_MESSAGE_OVERFLOW;
      }
      outbound.bytes_remaining -= outbound_hrmp_mod.bytes_submitted;
      outbound.messages_remaining -= outbound_hrmp_mod.messages_submitted;
    }

    if (new_constraints.ump_remaining < modifications.ump_messages_sent) {
      return Error::UMP_MESSAGE_OVERFLOW;
    }
    new_constraints.ump_remaining -= modifications.ump_messages_sent;

    if (new_constraints.ump_remaining_bytes < modifications.ump_bytes_sent) {
      return Error::UMP_BYTES_OVERFLOW;
    }
    new_constraints.ump_remaining_bytes -= modifications.ump_bytes_sent;

    auto &dmp = new_constraints.dmp_remaining_messages;
    if (modifications.dmp_messages_processed > dmp.size()) {
      return Error::DMP_MESSAGE_UNDERFLOW;
    }
    dmp.erase(dmp.begin(),
              dmp.begin() + ptrdiff_t(modifications.dmp_messages_processed));

    if (modifications.code_upgrade_applied) {
      if (!new_constraints.future_validation_code) {
        return Error::APPLIED_NONEXISTENT_CODE_UPGRADE;
      }
      new_constraints.validation_code_hash =
          new_constraints.future_validation_code->second;
      new_constraints.future_validation_code.reset();
    }

    return new_constraints;
  }

  outcome::result<void> validateAgainstConstraints(
      const Constraints &constraints,
      const RelayChainBlockInfo &relay_parent,
      const ProspectiveCandidate &candidate,
      const ConstraintModifications &modifications) {
    runtime::PersistedValidationData expected_pvd{
        .parent_head = constraints.required_parent,
        .relay_parent_number = relay_parent.number,
        .relay_parent_storage_root = relay_parent.storage_root,
        .max_pov_size = uint32_t(constraints.max_pov_size),
    };

    if (expected_pvd != candidate.persisted_validation_data) {
      return Fragment::Error::PERSISTED_VALIDATION_DATA_MISMATCH;
    }

    if (constraints.validation_code_hash != candidate.validation_code_hash) {
      return Fragment::Error::VALIDATION_CODE_MISMATCH;
    }

    if (relay_parent.number < constraints.min_relay_parent_number) {
      return Fragment::Error::RELAY_PARENT_TOO_OLD;
    }

    size_t announced_code_size = 0ull;
    if (candidate.commitments.opt_para_runtime) {
      if (constraints.upgrade_restriction
          && *constraints.upgrade_restriction == UpgradeRestriction::Present) {
        return Fragment::Error::CODE_UPGRADE_RESTRICTED;
      }
      announced_code_size = candidate.commitments.opt_para_runtime->size();
    }

    if (announced_code_size > constraints.max_code_size) {
      return Fragment::Error::CODE_SIZE_TOO_LARGE;
    }

    if (modifications.dmp_messages_processed == 0) {
      if (!constraints.dmp_remaining_messages.empty()
          && constraints.dmp_remaining_messages[0] <= relay_parent.number) {
        return Fragment::Error::DMP_ADVANCEMENT_RULE;
      }
    }

    if (candidate.commitments.outbound_hor_msgs.size()
        > constraints.max_hrmp_num_per_candidate) {
      return Fragment::Error::HRMP_MESSAGES_PER_CANDIDATE_OVERFLOW;
    }

    if (candidate.commitments.upward_msgs.size()
        > constraints.max_ump_num_per_candidate) {
      return Fragment::Error::UMP_MESSAGES_PER_CANDIDATE_OVERFLOW;
    }

    return constraints.checkModifications(modifications);
  }

  outcome::result<Fragment> Fragment::create(
      const RelayChainBlockInfo &relay_parent,
      const Constraints &operating_constraints,
      const ProspectiveCandidate &candidate) {
    const network::CandidateCommitments &commitments = candidate.commitments;

    std::unordered_map<ParachainId, OutboundHrmpChannelModification>
        outbound_hrmp;
    std::optional<ParachainId> last_recipient;
    for (const network::OutboundHorizontal &message :
         commitments.outbound_hor_msgs) {
      if (last_recipient && *last_recipient >= message.para_id) {
        return Error::HRMP_MESSAGES_DESCENDING_OR_DUPLICATE;
      }
      last_recipient = message.para_id;
      OutboundHrmpChannelModification &record = outbound_hrmp[message.para_id];

      record.bytes_submitted += message.upward_msg.size();
      record.messages_submitted += 1;
    }

    size_t ump_sent_bytes = 0ull;
    for (const auto &m : commitments.upward_msgs) {
      ump_sent_bytes += m.size();
    }

    ConstraintModifications modifications{
        .required_parent = commitments.para_head,
        .hrmp_watermark = ((commitments.watermark == relay_parent.number)
                               ? HrmpWatermarkUpdate{HrmpWatermarkUpdateHead{
                                   .v = commitments.watermark}}
                               : HrmpWatermarkUpdate{HrmpWatermarkUpdateTrunk{
                                   .v = commitments.watermark}}),
        .outbound_hrmp = std::move(outbound_hrmp),
        .ump_messages_sent = commitments.upward_msgs.size(),
        .ump_bytes_sent = ump_sent_bytes,
        .dmp_messages_processed = commitments.downward_msgs_count,
        .code_upgrade_applied =
            operating_constraints.future_validation_code
                ? (relay_parent.number
                   >= operating_constraints.future_validation_code->first)
                : false,
    };

    OUTCOME_TRY(validateAgainstConstraints(
        operating_constraints, relay_parent, candidate, modifications));

    return Fragment{
        .relay_parent = relay_parent,
        .operating_constraints = operating_constraints,
        .candidate = candidate,
        .modifications = std::move(modifications),
    };
  }

}  // namespace fragchain::parachain::fragment
