/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <span>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/program_output.hpp"

/**
 * Starknet OS program output wire format.
 *
 * ```
 * [bootloader header: 3]
 * [initial_root, final_root, prev_block_number, new_block_number,
 *  prev_block_hash, new_block_hash, os_program_hash, config_hash,
 *  use_kzg_da, full_output]
 * [n, messages to starknet: n felts of (from, to, len, payload[len])...]
 * [n, messages to appchain: n felts of (from, to, nonce, selector, len,
 *  payload[len])...]
 * ```
 */
namespace appchain::snos {

  constexpr size_t kBootloaderHeaderSize = 3;
  constexpr size_t kHeaderSize = 10;
  constexpr size_t kMessageToStarknetHeaderSize = 3;
  constexpr size_t kMessageToAppchainHeaderSize = 5;

  using BootloaderHeader = std::array<Felt, kBootloaderHeaderSize>;

  enum class DecodeError : uint8_t {
    // malformed stream
    MALFORMED_STREAM = 1,
    SEGMENT_LENGTH_OVERFLOW,
    INCOMPLETE_MESSAGE,
    // unsupported mode
    AGGREGATOR_NOT_SUPPORTED,
    KZG_DA_NOT_SUPPORTED,
    FULL_OUTPUT_NOT_SUPPORTED,
  };

  /// What to do with a trailing record header cut short by its batch end
  enum class TruncationPolicy : uint8_t {
    /// Drop the record and stop decoding the batch
    Lenient,
    /// Fail with DecodeError::INCOMPLETE_MESSAGE
    Strict,
  };

  struct DecodeOptions {
    TruncationPolicy truncation = TruncationPolicy::Lenient;
  };

  /**
   * Decode program output stream, bootloader header included.
   * Elements following the second message batch are not read.
   */
  outcome::result<ProgramOutput> decodeProgramOutput(
      std::span<const Felt> stream, const DecodeOptions &options = {});

  /// Inverse of `decodeProgramOutput`
  std::vector<Felt> encodeProgramOutput(
      const ProgramOutput &output,
      const BootloaderHeader &bootloader_header = {});

}  // namespace appchain::snos

OUTCOME_HPP_DECLARE_ERROR(appchain::snos, DecodeError);
