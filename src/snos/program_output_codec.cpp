/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "snos/program_output_codec.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY(appchain::snos, DecodeError, e) {
  using E = appchain::snos::DecodeError;
  switch (e) {
    case E::MALFORMED_STREAM:
      return "Program output stream is shorter than declared";
    case E::SEGMENT_LENGTH_OVERFLOW:
      return "Segment length does not fit into index";
    case E::INCOMPLETE_MESSAGE:
      return "Message record is incomplete";
    case E::AGGREGATOR_NOT_SUPPORTED:
      return "Aggregator programs are not supported";
    case E::KZG_DA_NOT_SUPPORTED:
      return "KZG data availability mode is not supported";
    case E::FULL_OUTPUT_NOT_SUPPORTED:
      return "Full output mode is not supported";
  }
  return "Unknown snos::DecodeError";
}

namespace appchain::snos {
  namespace {
    using FeltsIn = std::span<const Felt>;

    // Offsets inside the os output header
    constexpr size_t kInitialRootOffset = 0;
    constexpr size_t kFinalRootOffset = 1;
    constexpr size_t kPrevBlockNumberOffset = 2;
    constexpr size_t kNewBlockNumberOffset = 3;
    constexpr size_t kPrevBlockHashOffset = 4;
    constexpr size_t kNewBlockHashOffset = 5;
    constexpr size_t kOsProgramHashOffset = 6;
    constexpr size_t kConfigHashOffset = 7;
    constexpr size_t kUseKzgDaOffset = 8;
    constexpr size_t kFullOutputOffset = 9;

    outcome::result<size_t> toIndex(const Felt &felt) {
      auto value = felt.toU256();
      if (value > std::numeric_limits<size_t>::max()) {
        return DecodeError::SEGMENT_LENGTH_OVERFLOW;
      }
      return static_cast<size_t>(value);
    }

    struct Decoder {
      FeltsIn input_;

      bool empty() const {
        return input_.empty();
      }

      size_t size() const {
        return input_.size();
      }

      outcome::result<FeltsIn> take(size_t n) {
        if (n > input_.size()) {
          return DecodeError::MALFORMED_STREAM;
        }
        auto r = input_.first(n);
        input_ = input_.subspan(n);
        return r;
      }

      outcome::result<Felt> next() {
        BOOST_OUTCOME_TRY(auto one, take(1));
        return one.front();
      }

      /// Length-prefixed segment
      outcome::result<FeltsIn> segment() {
        BOOST_OUTCOME_TRY(auto count, next());
        BOOST_OUTCOME_TRY(auto n, toIndex(count));
        return take(n);
      }
    };

    /**
     * Split one batch into records of `header_size` felts followed by a
     * payload whose length is the last header felt.
     * `make(header, payload)` builds a message from a complete record.
     * A short trailing header ends the batch, a payload past the batch end
     * is malformed.
     */
    template <typename Message, typename MakeMessage>
    outcome::result<std::vector<Message>> decodeMessages(
        FeltsIn batch,
        size_t header_size,
        TruncationPolicy policy,
        const MakeMessage &make) {
      std::vector<Message> messages;
      Decoder decoder{batch};
      while (not decoder.empty()) {
        if (decoder.size() < header_size) {
          if (policy == TruncationPolicy::Strict) {
            return DecodeError::INCOMPLETE_MESSAGE;
          }
          break;
        }
        BOOST_OUTCOME_TRY(auto header, decoder.take(header_size));
        BOOST_OUTCOME_TRY(auto payload_size, toIndex(header.back()));
        BOOST_OUTCOME_TRY(auto payload, decoder.take(payload_size));
        messages.emplace_back(make(header, payload));
      }
      return messages;
    }

    void putSegment(std::vector<Felt> &out, const std::vector<Felt> &segment) {
      out.emplace_back(Felt::fromU64(segment.size()));
      out.insert(out.end(), segment.begin(), segment.end());
    }

    void putPayload(std::vector<Felt> &out, const Payload &payload) {
      out.emplace_back(Felt::fromU64(payload.size()));
      out.insert(out.end(), payload.begin(), payload.end());
    }
  }  // namespace

  outcome::result<ProgramOutput> decodeProgramOutput(
      std::span<const Felt> stream, const DecodeOptions &options) {
    Decoder decoder{stream};
    BOOST_OUTCOME_TRY(decoder.take(kBootloaderHeaderSize));
    BOOST_OUTCOME_TRY(auto header, decoder.take(kHeaderSize));

    ProgramOutput output{
        .initial_root = header[kInitialRootOffset],
        .final_root = header[kFinalRootOffset],
        .prev_block_number = header[kPrevBlockNumberOffset],
        .new_block_number = header[kNewBlockNumberOffset],
        .prev_block_hash = header[kPrevBlockHashOffset],
        .new_block_hash = header[kNewBlockHashOffset],
        .os_program_hash = header[kOsProgramHashOffset],
        .config_hash = header[kConfigHashOffset],
        .use_kzg_da = header[kUseKzgDaOffset],
        .full_output = header[kFullOutputOffset],
    };

    if (not output.os_program_hash.isZero()) {
      return DecodeError::AGGREGATOR_NOT_SUPPORTED;
    }
    if (not output.use_kzg_da.isZero()) {
      return DecodeError::KZG_DA_NOT_SUPPORTED;
    }
    if (not output.full_output.isZero()) {
      return DecodeError::FULL_OUTPUT_NOT_SUPPORTED;
    }

    BOOST_OUTCOME_TRY(auto to_starknet, decoder.segment());
    BOOST_OUTCOME_TRY(auto to_appchain, decoder.segment());

    BOOST_OUTCOME_TRY(
        output.messages_to_starknet,
        decodeMessages<MessageToStarknet>(
            to_starknet,
            kMessageToStarknetHeaderSize,
            options.truncation,
            [](FeltsIn header, FeltsIn payload) {
              return MessageToStarknet{
                  .from_address = header[0],
                  .to_address = header[1],
                  .payload = {payload.begin(), payload.end()},
              };
            }));

    BOOST_OUTCOME_TRY(
        output.messages_to_appchain,
        decodeMessages<MessageToAppchain>(
            to_appchain,
            kMessageToAppchainHeaderSize,
            options.truncation,
            [](FeltsIn header, FeltsIn payload) {
              return MessageToAppchain{
                  .from_address = header[0],
                  .to_address = header[1],
                  .nonce = header[2],
                  .selector = header[3],
                  .payload = {payload.begin(), payload.end()},
              };
            }));

    return output;
  }

  std::vector<Felt> encodeProgramOutput(
      const ProgramOutput &output, const BootloaderHeader &bootloader_header) {
    std::vector<Felt> stream{bootloader_header.begin(),
                             bootloader_header.end()};
    stream.insert(stream.end(),
                  {
                      output.initial_root,
                      output.final_root,
                      output.prev_block_number,
                      output.new_block_number,
                      output.prev_block_hash,
                      output.new_block_hash,
                      output.os_program_hash,
                      output.config_hash,
                      output.use_kzg_da,
                      output.full_output,
                  });

    std::vector<Felt> to_starknet;
    for (auto &message : output.messages_to_starknet) {
      to_starknet.emplace_back(message.from_address);
      to_starknet.emplace_back(message.to_address);
      putPayload(to_starknet, message.payload);
    }
    putSegment(stream, to_starknet);

    std::vector<Felt> to_appchain;
    for (auto &message : output.messages_to_appchain) {
      to_appchain.emplace_back(message.from_address);
      to_appchain.emplace_back(message.to_address);
      to_appchain.emplace_back(message.nonce);
      to_appchain.emplace_back(message.selector);
      putPayload(to_appchain, message.payload);
    }
    putSegment(stream, to_appchain);

    return stream;
  }

}  // namespace appchain::snos
