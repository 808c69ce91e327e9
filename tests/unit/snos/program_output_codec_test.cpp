/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "snos/program_output_codec.hpp"

using appchain::Felt;
using appchain::MessageToAppchain;
using appchain::MessageToStarknet;
using appchain::ProgramOutput;
using appchain::snos::DecodeError;
using appchain::snos::DecodeOptions;
using appchain::snos::decodeProgramOutput;
using appchain::snos::encodeProgramOutput;
using appchain::snos::TruncationPolicy;

namespace {
  Felt f(uint64_t v) {
    return Felt::fromU64(v);
  }

  /// Bootloader header and a header with all supported flags off
  std::vector<Felt> header() {
    return {f(100), f(101), f(102),  // bootloader
            f(1),   f(2),   f(3),   f(4), f(5), f(6),
            f(0),   f(7),   f(0),   f(0)};
  }

  std::vector<Felt> concat(std::vector<Felt> a, const std::vector<Felt> &b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
  }

  const DecodeOptions kStrict{.truncation = TruncationPolicy::Strict};
}  // namespace

/**
 * @given stream with no messages
 * @when decode
 * @then header fields are read by their offsets
 */
TEST(ProgramOutputCodecTest, DecodeHeader) {
  auto stream = concat(header(), {f(0), f(0)});
  ASSERT_OUTCOME_SUCCESS(output, decodeProgramOutput(stream));
  EXPECT_EQ(output.initial_root, f(1));
  EXPECT_EQ(output.final_root, f(2));
  EXPECT_EQ(output.prev_block_number, f(3));
  EXPECT_EQ(output.new_block_number, f(4));
  EXPECT_EQ(output.prev_block_hash, f(5));
  EXPECT_EQ(output.new_block_hash, f(6));
  EXPECT_TRUE(output.os_program_hash.isZero());
  EXPECT_EQ(output.config_hash, f(7));
  EXPECT_TRUE(output.messages_to_starknet.empty());
  EXPECT_TRUE(output.messages_to_appchain.empty());
}

/**
 * @given stream with messages in both batches
 * @when decode
 * @then messages are decoded in stream order
 */
TEST(ProgramOutputCodecTest, DecodeMessages) {
  auto stream = concat(header(),
                       {
                           // to starknet: 2 records, 4 + 3 felts
                           f(7),
                           f(11), f(12), f(1), f(13),
                           f(21), f(22), f(0),
                           // to appchain: 1 record, 7 felts
                           f(7),
                           f(31), f(32), f(33), f(34), f(2), f(35), f(36),
                       });
  ASSERT_OUTCOME_SUCCESS(output, decodeProgramOutput(stream));

  ASSERT_EQ(output.messages_to_starknet.size(), 2);
  EXPECT_EQ(output.messages_to_starknet[0],
            (MessageToStarknet{
                .from_address = f(11), .to_address = f(12), .payload = {f(13)}}));
  EXPECT_EQ(output.messages_to_starknet[1],
            (MessageToStarknet{
                .from_address = f(21), .to_address = f(22), .payload = {}}));

  ASSERT_EQ(output.messages_to_appchain.size(), 1);
  EXPECT_EQ(output.messages_to_appchain[0],
            (MessageToAppchain{
                .from_address = f(31),
                .to_address = f(32),
                .nonce = f(33),
                .selector = f(34),
                .payload = {f(35), f(36)},
            }));
}

TEST(ProgramOutputCodecTest, RoundTrip) {
  ProgramOutput output{
      .initial_root = f(1),
      .final_root = f(2),
      .prev_block_number = appchain::maxFelt(),
      .new_block_number = f(0),
      .prev_block_hash = f(5),
      .new_block_hash = f(6),
      .config_hash = f(7),
      .messages_to_starknet = {{f(1), f(2), {f(3), f(4)}}, {f(5), f(6), {}}},
      .messages_to_appchain = {{f(7), f(8), f(9), f(10), {f(11)}}},
  };
  auto stream = encodeProgramOutput(output, {f(100), f(101), f(102)});
  EXPECT_EQ(stream.size(), 3 + 10 + 1 + 5 + 3 + 1 + 6);
  EXPECT_EQ(stream.front(), f(100));
  ASSERT_OUTCOME_SUCCESS(decoded, decodeProgramOutput(stream));
  EXPECT_EQ(decoded, output);
}

/**
 * @given Starknet-bound batch declaring 2 elements, short of a 3 felts header
 * @when decode leniently
 * @then batch yields no messages and the next batch is still read
 */
TEST(ProgramOutputCodecTest, TruncatedHeaderIsDropped) {
  auto stream = concat(header(),
                       {
                           f(2), f(11), f(12),
                           f(6), f(31), f(32), f(33), f(34), f(1), f(35),
                       });
  ASSERT_OUTCOME_SUCCESS(output, decodeProgramOutput(stream));
  EXPECT_TRUE(output.messages_to_starknet.empty());
  ASSERT_EQ(output.messages_to_appchain.size(), 1);
  EXPECT_EQ(output.messages_to_appchain[0].payload, std::vector{f(35)});

  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream, kStrict),
                       DecodeError::INCOMPLETE_MESSAGE);
}

/**
 * @given Starknet-bound batch of 5 felts whose only record has a complete
 * header but declares a payload longer than the rest of the batch
 * @when decode with either policy
 * @then stream is malformed, elements of the next batch are not consumed
 * as payload
 */
TEST(ProgramOutputCodecTest, PayloadOverrunningBatchIsMalformed) {
  auto stream = concat(header(),
                       {
                           f(5), f(11), f(12), f(10), f(13), f(14),
                           f(0),
                       });
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream),
                       DecodeError::MALFORMED_STREAM);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream, kStrict),
                       DecodeError::MALFORMED_STREAM);
}

/**
 * @given complete record followed by a partial one in the same batch
 * @when decode leniently
 * @then the complete record is kept
 */
TEST(ProgramOutputCodecTest, TrailingPartialRecordIsDropped) {
  auto stream = concat(header(),
                       {
                           f(5), f(11), f(12), f(0), f(21), f(22),
                           f(0),
                       });
  ASSERT_OUTCOME_SUCCESS(output, decodeProgramOutput(stream));
  ASSERT_EQ(output.messages_to_starknet.size(), 1);
  EXPECT_EQ(output.messages_to_starknet[0].from_address, f(11));
}

/**
 * @given batch ending right after a record header whose payload is missing
 * @when decode with either policy
 * @then stream is malformed
 */
TEST(ProgramOutputCodecTest, MissingPayloadAtBatchEnd) {
  auto stream = concat(header(), {f(3), f(11), f(12), f(1), f(0)});
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream),
                       DecodeError::MALFORMED_STREAM);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream, kStrict),
                       DecodeError::MALFORMED_STREAM);
}

/**
 * @given Starknet-bound batch declaring 5 felts while only 2 felts are left
 * in the whole stream
 * @when decode with either policy
 * @then the batch can't be read in full and the stream is malformed
 */
TEST(ProgramOutputCodecTest, BatchLongerThanStreamIsMalformed) {
  auto stream = concat(header(), {f(5), f(11), f(12)});
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream),
                       DecodeError::MALFORMED_STREAM);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream, kStrict),
                       DecodeError::MALFORMED_STREAM);
}

TEST(ProgramOutputCodecTest, ShortStreamIsMalformed) {
  auto full = concat(header(), {f(0), f(0)});

  for (size_t size : {0, 2, 3, 12, 13, 14}) {
    std::span<const Felt> stream{full.data(), size};
    ASSERT_OUTCOME_ERROR(decodeProgramOutput(stream),
                         DecodeError::MALFORMED_STREAM);
  }

  // batch declares more elements than the stream has
  auto short_batch = concat(header(), {f(3), f(1), f(2)});
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(short_batch),
                       DecodeError::MALFORMED_STREAM);
}

TEST(ProgramOutputCodecTest, TrailingElementsAreIgnored) {
  auto stream = concat(header(), {f(0), f(0), f(42), f(43)});
  ASSERT_OUTCOME_SUCCESS(output, decodeProgramOutput(stream));
  EXPECT_TRUE(output.messages_to_appchain.empty());
}

TEST(ProgramOutputCodecTest, LengthOverflow) {
  auto huge = Felt::fromU256(appchain::U256{1} << 70);

  auto count = concat(header(), {huge, f(0)});
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(count),
                       DecodeError::SEGMENT_LENGTH_OVERFLOW);

  auto payload = concat(header(), {f(3), f(1), f(2), huge, f(0)});
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(payload),
                       DecodeError::SEGMENT_LENGTH_OVERFLOW);
}

/**
 * @given header with unsupported mode flags
 * @when decode
 * @then mode error is returned before any message is read
 */
TEST(ProgramOutputCodecTest, UnsupportedModes) {
  auto with = [](size_t offset) {
    auto stream = header();
    stream[3 + offset] = f(1);
    return stream;
  };

  // no message batches at all: flags are checked first
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(with(6)),
                       DecodeError::AGGREGATOR_NOT_SUPPORTED);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(with(8)),
                       DecodeError::KZG_DA_NOT_SUPPORTED);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(with(9)),
                       DecodeError::FULL_OUTPUT_NOT_SUPPORTED);

  // aggregator is reported first
  auto all = with(6);
  all[3 + 8] = f(1);
  all[3 + 9] = f(1);
  ASSERT_OUTCOME_ERROR(decodeProgramOutput(all),
                       DecodeError::AGGREGATOR_NOT_SUPPORTED);
}
