/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "types/felt.hpp"

namespace appchain {

  using Payload = std::vector<Felt>;

  /**
   * @struct MessageToStarknet
   * Message emitted by an appchain contract towards Starknet.
   */
  struct MessageToStarknet {
    /// Appchain-side sender
    Felt from_address;
    /// Starknet-side receiver
    Felt to_address;
    Payload payload;

    bool operator==(const MessageToStarknet &) const = default;
  };

  /**
   * @struct MessageToAppchain
   * Message sent from Starknet and executed on the appchain.
   */
  struct MessageToAppchain {
    /// Starknet-side sender
    Felt from_address;
    /// Appchain-side receiver
    Felt to_address;
    Felt nonce;
    /// Entry point of the receiver
    Felt selector;
    Payload payload;

    bool operator==(const MessageToAppchain &) const = default;
  };

  /**
   * @struct ProgramOutput
   * Decoded output of the Starknet OS program for one state update.
   */
  struct ProgramOutput {
    Felt initial_root;
    Felt final_root;
    Felt prev_block_number;
    Felt new_block_number;
    Felt prev_block_hash;
    Felt new_block_hash;
    Felt os_program_hash;
    Felt config_hash;
    Felt use_kzg_da;
    Felt full_output;
    std::vector<MessageToStarknet> messages_to_starknet;
    std::vector<MessageToAppchain> messages_to_appchain;

    bool operator==(const ProgramOutput &) const = default;
  };

}  // namespace appchain
