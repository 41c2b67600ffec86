/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <tuple>
#include <vector>

#include <scale/scale.hpp>
#include <scale/tie.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"

namespace fragchain::parachain {

  using Hash = common::Hash256;
  using ParachainId = uint32_t;
  using UpwardMessage = common::Buffer;
  using ParachainRuntime = common::Buffer;
  using HeadData = common::Buffer;
  using CandidateHash = Hash;
  using RelayHash = Hash;
  using CollatorPublicKey = common::Blob<32>;
  using CollatorId = CollatorPublicKey;
  using CollatorSignature = common::Hash512;
  using ValidationCodeHash = Hash;
  using BlockNumber = primitives::BlockNumber;

}  // namespace fragchain::parachain

namespace fragchain::network {

  struct OutboundHorizontal {
    SCALE_TIE(2);

    parachain::ParachainId para_id;  /// Parachain Id is recepient id
    parachain::UpwardMessage
        upward_msg;  /// upward message for parallel parachain
  };

  struct CandidateCommitments {
    SCALE_TIE(6);

    std::vector<parachain::UpwardMessage> upward_msgs;  /// upward messages
    std::vector<OutboundHorizontal>
        outbound_hor_msgs;  /// outbound horizontal messages
    std::optional<parachain::ParachainRuntime>
        opt_para_runtime;           /// new parachain runtime if present
    parachain::HeadData para_head;  /// parachain head data
    uint32_t downward_msgs_count;   /// number of downward messages that were
    /// processed by the parachain
    parachain::BlockNumber
        watermark;  /// watermark which specifies the relay chain block
    /// number up to which all inbound horizontal messages
    /// have been processed
  };

  /**
   * Unique descriptor of a candidate receipt.
   */
  struct CandidateDescriptor {
    SCALE_TIE(9);

    parachain::ParachainId para_id;  /// Parachain Id
    primitives::BlockHash
        relay_parent;  /// Hash of the relay chain block the candidate is
    /// executed in the context of
    parachain::CollatorPublicKey collator_id;  /// Collators public key.
    primitives::BlockHash
        persisted_data_hash;         /// Hash of the persisted validation data
    primitives::BlockHash pov_hash;  /// Hash of the PoV block.
    common::Hash256
        erasure_encoding_root;  /// Root of the block's erasure encoding Merkle
    /// tree.
    parachain::CollatorSignature
        signature;  /// Collator signature of the concatenated components
    primitives::BlockHash
        para_head_hash;  /// Hash of the parachain head data of this candidate.
    primitives::BlockHash
        validation_code_hash;  /// Hash of the parachain Runtime.
  };

  struct CommittedCandidateReceipt {
    SCALE_TIE(2);

    CandidateDescriptor descriptor;
    CandidateCommitments commitments;
  };

  inline parachain::CandidateHash candidateHash(
      const crypto::Hasher &hasher, const CommittedCandidateReceipt &receipt) {
    auto commitments_hash =
        hasher.blake2b_256(::scale::encode(receipt.commitments).value());
    return hasher.blake2b_256(
        ::scale::encode(std::tie(receipt.descriptor, commitments_hash))
            .value());
  }

}  // namespace fragchain::network

namespace fragchain::runtime {

  struct PersistedValidationData {
    SCALE_TIE(4);

    /// The parent head-data.
    parachain::HeadData parent_head;
    /// The relay-chain block number this is in the context of.
    parachain::BlockNumber relay_parent_number;
    /// The relay-chain block storage root this is in the context of.
    parachain::Hash relay_parent_storage_root;
    /// The maximum legal size of a POV block, in bytes.
    uint32_t max_pov_size;
  };

  inline parachain::Hash persistedValidationDataHash(
      const crypto::Hasher &hasher, const PersistedValidationData &data) {
    return hasher.blake2b_256(::scale::encode(data).value());
  }

}  // namespace fragchain::runtime

namespace fragchain::parachain::fragment {

  struct AsyncBackingParams {
    SCALE_TIE(2);
    /// The maximum number of para blocks between the para head in a relay
    /// parent and a new candidate. Restricts nodes from building arbitrary long
    /// chains and spamming other validators.
    ///
    /// When async backing is disabled, the only valid value is 0.
    uint32_t max_candidate_depth;
    /// How many ancestors of a relay parent are allowed to build candidates on
    /// top of.
    ///
    /// When async backing is disabled, the only valid value is 0.
    uint32_t allowed_ancestry_len;
  };

}  // namespace fragchain::parachain::fragment
