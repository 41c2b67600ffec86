/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <cstring>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

#include "crypto/hasher/hasher_impl.hpp"
#include "parachain/inclusion_emulator.hpp"
#include "parachain/types.hpp"
#include "parachain/validator/prospective_parachains/fragment_validator_impl.hpp"

using namespace fragchain::parachain;
namespace network = fragchain::network;
namespace runtime = fragchain::runtime;
namespace common = fragchain::common;
namespace crypto = fragchain::crypto;

class ProspectiveParachainsTest : public testing::Test {
 protected:
  void SetUp() override {
    testutil::prepareLoggers();
    hasher_ = std::make_shared<crypto::HasherImpl>();
    validator_ = std::make_shared<fragment::FragmentValidatorImpl>();
  }

  void TearDown() override {
    validator_.reset();
    hasher_.reset();
  }

  std::shared_ptr<crypto::Hasher> hasher_;
  std::shared_ptr<fragment::FragmentValidator> validator_;

  static constexpr uint32_t MAX_POV_SIZE = 1000000;

  Hash hash(const network::CommittedCandidateReceipt &data) const {
    return network::candidateHash(*hasher_, data);
  }

  Hash hashOf(const HeadData &head) const {
    return hasher_->blake2b_256(head);
  }

  static fragment::Constraints make_constraints(
      BlockNumber min_relay_parent_number,
      std::vector<BlockNumber> valid_watermarks,
      HeadData required_parent) {
    return fragment::Constraints{
        .min_relay_parent_number = min_relay_parent_number,
        .max_pov_size = MAX_POV_SIZE,
        .max_code_size = 1000000,
        .ump_remaining = 10,
        .ump_remaining_bytes = 1000,
        .max_ump_num_per_candidate = 10,
        .dmp_remaining_messages = std::vector<BlockNumber>(10, 0),
        .hrmp_inbound = fragment::InboundHrmpLimitations{.valid_watermarks =
                                                             valid_watermarks},
        .hrmp_channels_out = {},
        .max_hrmp_num_per_candidate = 0,
        .required_parent = required_parent,
        .validation_code_hash = fromNumber(42),
        .upgrade_restriction = std::nullopt,
        .future_validation_code = std::nullopt,
    };
  }

  std::pair<runtime::PersistedValidationData,
            network::CommittedCandidateReceipt>
  make_committed_candidate(ParachainId para_id,
                           const Hash &relay_parent,
                           BlockNumber relay_parent_number,
                           const HeadData &parent_head,
                           const HeadData &para_head,
                           BlockNumber hrmp_watermark) const {
    runtime::PersistedValidationData persisted_validation_data{
        .parent_head = parent_head,
        .relay_parent_number = relay_parent_number,
        .relay_parent_storage_root = fromNumber(69),
        .max_pov_size = MAX_POV_SIZE,
    };

    network::CommittedCandidateReceipt candidate{
        .descriptor =
            network::CandidateDescriptor{
                .para_id = para_id,
                .relay_parent = relay_parent,
                .collator_id = {},
                .persisted_data_hash = runtime::persistedValidationDataHash(
                    *hasher_, persisted_validation_data),
                .pov_hash = fromNumber(1),
                .erasure_encoding_root = fromNumber(1),
                .signature = {},
                .para_head_hash = hasher_->blake2b_256(para_head),
                .validation_code_hash = fromNumber(42),
            },
        .commitments =
            network::CandidateCommitments{
                .upward_msgs = {},
                .outbound_hor_msgs = {},
                .opt_para_runtime = std::nullopt,
                .para_head = para_head,
                .downward_msgs_count = 1,
                .watermark = hrmp_watermark,
            },
    };

    return std::make_pair(std::move(persisted_validation_data),
                          std::move(candidate));
  }

  static fragment::RelayChainBlockInfo make_relay_block(uint8_t hash,
                                                        BlockNumber number) {
    return fragment::RelayChainBlockInfo{
        .hash = fromNumber(hash),
        .number = number,
        .storage_root = fromNumber(69),
    };
  }

  static Hash fromNumber(uint8_t n) {
    Hash h{};
    memset(h.data(), n, h.size());
    return h;
  }
};
