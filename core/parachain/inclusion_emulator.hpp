/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/variant.hpp>

#include "common/visitor.hpp"
#include "outcome/outcome.hpp"
#include "parachain/types.hpp"

namespace fragchain::parachain::fragment {

  enum UpgradeRestriction {
    /// There is an upgrade restriction and there are no details about its
    /// specifics nor how long
    /// it could last.
    Present = 0,
  };

  /// Constraints on inbound HRMP channels.
  struct InboundHrmpLimitations {
    /// An exhaustive set of all valid watermarks, sorted ascending
    std::vector<BlockNumber> valid_watermarks;
  };

  /// Constraints on outbound HRMP channels.
  struct OutboundHrmpChannelLimitations {
    /// The maximum bytes that can be written to the channel.
    size_t bytes_remaining;
    /// The maximum messages that can be written to the channel.
    size_t messages_remaining;
  };

  struct HrmpWatermarkUpdateHead {
    BlockNumber v;
  };
  struct HrmpWatermarkUpdateTrunk {
    BlockNumber v;
  };
  using HrmpWatermarkUpdate =
      boost::variant<HrmpWatermarkUpdateHead, HrmpWatermarkUpdateTrunk>;
  inline BlockNumber fromHrmpWatermarkUpdate(const HrmpWatermarkUpdate &value) {
    return visit_in_place(value, [](const auto &val) { return val.v; });
  }

  struct OutboundHrmpChannelModification {
    /// The number of bytes submitted to the channel.
    size_t bytes_submitted;
    /// The number of messages submitted to the channel.
    size_t messages_submitted;
  };

  struct ConstraintModifications {
    /// The required parent head to build upon.
    std::optional<HeadData> required_parent{};
    /// The new HRMP watermark
    std::optional<HrmpWatermarkUpdate> hrmp_watermark{};
    /// Outbound HRMP channel modifications.
    std::unordered_map<ParachainId, OutboundHrmpChannelModification>
        outbound_hrmp{};
    /// The amount of UMP messages sent.
    size_t ump_messages_sent{0ull};
    /// The amount of UMP bytes sent.
    size_t ump_bytes_sent{0ull};
    /// The amount of DMP messages processed.
    size_t dmp_messages_processed{0ull};
    /// Whether a pending code upgrade has been applied.
    bool code_upgrade_applied{false};

    /// Modifications which leave constraints untouched.
    static ConstraintModifications identity() {
      return ConstraintModifications{};
    }

    /// Stack other modifications on top of these. Newer parent head and
    /// watermark replace the current ones, counters are accumulated.
    void stack(const ConstraintModifications &other) {
      if (other.required_parent) {
        required_parent = other.required_parent;
      }
      if (other.hrmp_watermark) {
        hrmp_watermark = other.hrmp_watermark;
      }

      for (const auto &[id, mods] : other.outbound_hrmp) {
        auto &record = outbound_hrmp[id];
        record.messages_submitted += mods.messages_submitted;
        record.bytes_submitted += mods.bytes_submitted;
      }

      ump_messages_sent += other.ump_messages_sent;
      ump_bytes_sent += other.ump_bytes_sent;
      dmp_messages_processed += other.dmp_messages_processed;
      code_upgrade_applied |= other.code_upgrade_applied;
    }
  };

  struct Constraints {
    enum class Error {
      DISALLOWED_HRMP_WATERMARK = 1,
      NO_SUCH_HRMP_CHANNEL,
      HRMP_BYTES_OVERFLOW,
      HRMP_MESSAGE_OVERFLOW,
      UMP_MESSAGE_OVERFLOW,
      UMP_BYTES_OVERFLOW,
      DMP_MESSAGE_UNDERFLOW,
      APPLIED_NONEXISTENT_CODE_UPGRADE,
    };

    /// The minimum relay-parent number accepted under these constraints.
    BlockNumber min_relay_parent_number;
    /// The maximum Proof-of-Validity size allowed, in bytes.
    size_t max_pov_size;
    /// The maximum new validation code size allowed, in bytes.
    size_t max_code_size;
    /// The amount of UMP messages remaining.
    size_t ump_remaining;
    /// The amount of UMP bytes remaining.
    size_t ump_remaining_bytes;
    /// The maximum number of UMP messages allowed per candidate.
    size_t max_ump_num_per_candidate;
    /// Remaining DMP queue. Only includes sent-at block numbers.
    std::vector<BlockNumber> dmp_remaining_messages;
    /// The limitations of all registered inbound HRMP channels.
    InboundHrmpLimitations hrmp_inbound;
    /// The limitations of all registered outbound HRMP channels.
    std::unordered_map<ParachainId, OutboundHrmpChannelLimitations>
        hrmp_channels_out;
    /// The maximum number of HRMP messages allowed per candidate.
    size_t max_hrmp_num_per_candidate;
    /// The required parent head-data of the parachain.
    HeadData required_parent;
    /// The expected validation-code-hash of this parachain.
    ValidationCodeHash validation_code_hash;
    /// The code upgrade restriction signal as-of this parachain.
    std::optional<UpgradeRestriction> upgrade_restriction;
    /// The future validation code hash, if any, and at what relay-parent
    /// number the upgrade would be minimally applied.
    std::optional<std::pair<BlockNumber, ValidationCodeHash>>
        future_validation_code;

    /// Check whether the modifications could be applied to these constraints
    /// without producing a new value.
    outcome::result<void> checkModifications(
        const ConstraintModifications &modifications) const;

    /// Produce the constraints a child of a candidate with the given
    /// modifications has to satisfy.
    outcome::result<Constraints> applyModifications(
        const ConstraintModifications &modifications) const;
  };

  struct RelayChainBlockInfo {
    /// The hash of the relay-chain block.
    Hash hash;
    /// The number of the relay-chain block.
    BlockNumber number;
    /// The storage-root of the relay-chain block.
    Hash storage_root;

    bool operator==(const RelayChainBlockInfo &) const = default;
  };

  struct ProspectiveCandidate {
    /// The commitments to the output of the execution.
    network::CandidateCommitments commitments;
    /// The collator that created the candidate.
    CollatorId collator;
    /// The signature of the collator on the payload.
    CollatorSignature collator_signature;
    /// The persisted validation data used to create the candidate.
    runtime::PersistedValidationData persisted_validation_data;
    /// The hash of the PoV.
    Hash pov_hash;
    /// The validation code hash used by the candidate.
    ValidationCodeHash validation_code_hash;
  };

  /// Extract the part of a committed receipt that is checked against
  /// constraints.
  inline ProspectiveCandidate toProspectiveCandidate(
      const network::CommittedCandidateReceipt &receipt,
      const runtime::PersistedValidationData &persisted_validation_data) {
    return ProspectiveCandidate{
        .commitments = receipt.commitments,
        .collator = receipt.descriptor.collator_id,
        .collator_signature = receipt.descriptor.signature,
        .persisted_validation_data = persisted_validation_data,
        .pov_hash = receipt.descriptor.pov_hash,
        .validation_code_hash = receipt.descriptor.validation_code_hash,
    };
  }

  /// A candidate checked against a set of operating constraints at a
  /// relay-parent, together with the modifications it makes.
  struct Fragment {
    enum class Error {
      HRMP_MESSAGES_DESCENDING_OR_DUPLICATE = 1,
      PERSISTED_VALIDATION_DATA_MISMATCH,
      VALIDATION_CODE_MISMATCH,
      RELAY_PARENT_TOO_OLD,
      CODE_UPGRADE_RESTRICTED,
      CODE_SIZE_TOO_LARGE,
      DMP_ADVANCEMENT_RULE,
      HRMP_MESSAGES_PER_CANDIDATE_OVERFLOW,
      UMP_MESSAGES_PER_CANDIDATE_OVERFLOW,
    };

    /// The new relay-parent.
    RelayChainBlockInfo relay_parent;
    /// The constraints this fragment is operating under.
    Constraints operating_constraints;
    /// The core information about the prospective candidate.
    ProspectiveCandidate candidate;
    /// Modifications to the constraints based on the outputs of
    /// the candidate.
    ConstraintModifications modifications;

    const RelayChainBlockInfo &relayParent() const {
      return relay_parent;
    }

    const ConstraintModifications &constraintModifications() const {
      return modifications;
    }

    /**
     * Create a new fragment. Fails if the candidate does not satisfy the
     * operating constraints at the given relay-parent, or if its outbound
     * HRMP messages are not sorted by strictly ascending recipient.
     */
    static outcome::result<Fragment> create(
        const RelayChainBlockInfo &relay_parent,
        const Constraints &operating_constraints,
        const ProspectiveCandidate &candidate);
  };

  outcome::result<void> validateAgainstConstraints(
      const Constraints &constraints,
      const RelayChainBlockInfo &relay_parent,
      const ProspectiveCandidate &candidate,
      const ConstraintModifications &modifications);

}  // namespace fragchain::parachain::fragment

OUTCOME_HPP_DECLARE_ERROR(fragchain::parachain::fragment, Constraints::Error);
OUTCOME_HPP_DECLARE_ERROR(fragchain::parachain::fragment, Fragment::Error);
