/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/access_control.hpp"
#include "app/appchain_service.hpp"
#include "blockchain/message_ledger.hpp"
#include "blockchain/rolling_state.hpp"
#include "mock/app/fact_registry_mock.hpp"
#include "snos/program_output_codec.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/prepare_loggers.hpp"

using appchain::AppchainState;
using appchain::Felt;
using appchain::maxFelt;
using appchain::MessageToAppchain;
using appchain::MessageToStarknet;
using appchain::ProgramOutput;
using appchain::app::AccessControl;
using appchain::app::AppchainService;
using appchain::app::FactRegistryMock;
using appchain::app::ProgramConfig;
using appchain::app::ProgramInfo;
using appchain::blockchain::MessageLedger;
using appchain::blockchain::RollingState;
using appchain::snos::DecodeError;
using appchain::storage::InMemorySpacedStorage;
using testing::Return;

namespace {
  Felt f(uint64_t v) {
    return Felt::fromU64(v);
  }
}  // namespace

class AppchainServiceTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*facts, enabled()).WillByDefault(Return(false));
    service = create();
  }

  std::shared_ptr<AppchainService> create(
      appchain::snos::DecodeOptions options = {}) {
    auto logsys = testutil::prepareLoggers();
    auto access = std::make_shared<AccessControl>(
        logsys, storage, appchain::app::AccessControlConfig{owner});
    auto program = std::make_shared<ProgramConfig>(
        logsys, storage, facts, ProgramInfo{.config_hash = config_hash});
    auto rolling = std::make_shared<RollingState>(
        logsys, storage, appchain::blockchain::RollingStateConfig{});
    auto ledger = std::make_shared<MessageLedger>(logsys, storage);
    return std::make_shared<AppchainService>(
        logsys, storage, access, program, rolling, ledger, options);
  }

  ProgramOutput nextOutput(const AppchainState &from,
                           const Felt &new_block_number) const {
    return ProgramOutput{
        .initial_root = from.state_root,
        .final_root = f(from.state_root.toU256().convert_to<uint64_t>() + 1),
        .prev_block_number = from.block_number,
        .new_block_number = new_block_number,
        .prev_block_hash = from.block_hash,
        .new_block_hash = f(0xbb),
        .config_hash = config_hash,
    };
  }

  std::shared_ptr<InMemorySpacedStorage> storage =
      std::make_shared<InMemorySpacedStorage>();
  std::shared_ptr<testing::NiceMock<FactRegistryMock>> facts =
      std::make_shared<testing::NiceMock<FactRegistryMock>>();
  std::shared_ptr<AppchainService> service;

  const Felt owner = f(0xa11ce);
  const Felt operator_ = f(0x0b);
  const Felt stranger = f(0x5e);
  const Felt config_hash = f(0xc0);

  const AppchainState genesis{
      .state_root = f(5),
      .block_number = maxFelt(),
      .block_hash = f(7),
  };
};

TEST_F(AppchainServiceTest, InitializeIsOwnerOnly) {
  ASSERT_OUTCOME_ERROR(service->initialize(stranger, genesis),
                       AccessControl::Error::OWNER_ONLY);
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));
  EXPECT_EQ(service->getState(), genesis);
}

/**
 * @given initialized service and a registered operator
 * @when operator submits a valid output with messages
 * @then state moves forward and messages are recorded
 */
TEST_F(AppchainServiceTest, UpdateByOperator) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));
  ASSERT_OUTCOME_SUCCESS(service->registerOperator(owner, operator_));

  auto output = nextOutput(genesis, f(0));
  MessageToStarknet to_starknet{
      .from_address = f(1), .to_address = f(2), .payload = {f(3)}};
  MessageToAppchain to_appchain{.from_address = f(4),
                                .to_address = f(5),
                                .nonce = f(6),
                                .selector = f(7),
                                .payload = {}};
  output.messages_to_starknet = {to_starknet};
  output.messages_to_appchain = {to_appchain};
  auto stream = appchain::snos::encodeProgramOutput(output);

  ASSERT_OUTCOME_SUCCESS(next, service->updateState(operator_, stream));
  AppchainState expected{
      .state_root = f(6), .block_number = f(0), .block_hash = f(0xbb)};
  EXPECT_EQ(next, expected);
  EXPECT_EQ(service->getState(), expected);

  ASSERT_OUTCOME_SUCCESS(
      count,
      service->messageToStarknetCount(MessageLedger::messageHash(to_starknet)));
  EXPECT_EQ(count, 1);
  ASSERT_OUTCOME_SUCCESS(sealed,
                         service->isMessageToAppchainSealed(
                             MessageLedger::messageHash(to_appchain)));
  EXPECT_TRUE(sealed);
}

TEST_F(AppchainServiceTest, UnauthorizedUpdate) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));
  auto stream =
      appchain::snos::encodeProgramOutput(nextOutput(genesis, f(0)));
  ASSERT_OUTCOME_ERROR(service->updateState(stranger, stream),
                       AccessControl::Error::UNAUTHORIZED);
  EXPECT_EQ(service->getState(), genesis);
}

/**
 * @given output that is rejected by the validator
 * @when it is submitted
 * @then neither the state nor the message records change
 */
TEST_F(AppchainServiceTest, RejectedUpdateWritesNothing) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));

  auto output = nextOutput(genesis, f(0));
  output.initial_root = f(999);
  MessageToStarknet to_starknet{
      .from_address = f(1), .to_address = f(2), .payload = {}};
  output.messages_to_starknet = {to_starknet};

  ASSERT_OUTCOME_ERROR(
      service->updateState(owner, appchain::snos::encodeProgramOutput(output)),
      RollingState::Error::INVALID_PREVIOUS_ROOT);
  EXPECT_EQ(service->getState(), genesis);
  ASSERT_OUTCOME_SUCCESS(
      count,
      service->messageToStarknetCount(MessageLedger::messageHash(to_starknet)));
  EXPECT_EQ(count, 0);
}

TEST_F(AppchainServiceTest, ReplayIsRejected) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));
  auto stream =
      appchain::snos::encodeProgramOutput(nextOutput(genesis, f(0)));
  ASSERT_OUTCOME_SUCCESS(next, service->updateState(owner, stream));
  ASSERT_OUTCOME_ERROR(service->updateState(owner, stream),
                       RollingState::Error::INVALID_PREVIOUS_BLOCK_NUMBER);
  EXPECT_EQ(service->getState(), next);
}

TEST_F(AppchainServiceTest, ConfigHashMismatch) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));
  auto output = nextOutput(genesis, f(0));
  output.config_hash = f(0xc1);
  ASSERT_OUTCOME_ERROR(
      service->updateState(owner, appchain::snos::encodeProgramOutput(output)),
      ProgramConfig::Error::CONFIG_HASH_MISMATCH);
  EXPECT_EQ(service->getState(), genesis);
}

TEST_F(AppchainServiceTest, DecodeErrors) {
  ASSERT_OUTCOME_SUCCESS(service->initialize(owner, genesis));

  std::vector<Felt> too_short{f(0), f(0), f(0), f(5)};
  ASSERT_OUTCOME_ERROR(service->updateState(owner, too_short),
                       DecodeError::MALFORMED_STREAM);

  auto output = nextOutput(genesis, f(0));
  output.use_kzg_da = f(1);
  ASSERT_OUTCOME_ERROR(
      service->updateState(owner, appchain::snos::encodeProgramOutput(output)),
      DecodeError::KZG_DA_NOT_SUPPORTED);

  // payload length of the only record points past its batch
  auto with_message = nextOutput(genesis, f(0));
  with_message.messages_to_starknet = {{f(1), f(2), {f(3), f(4)}}};
  auto overrun = appchain::snos::encodeProgramOutput(with_message);
  overrun[16] = f(3);
  ASSERT_OUTCOME_ERROR(service->updateState(owner, overrun),
                       DecodeError::MALFORMED_STREAM);
  EXPECT_EQ(service->getState(), genesis);
}

TEST_F(AppchainServiceTest, StrictMessageRecords) {
  auto strict =
      create({.truncation = appchain::snos::TruncationPolicy::Strict});
  ASSERT_OUTCOME_SUCCESS(strict->initialize(owner, genesis));

  auto stream =
      appchain::snos::encodeProgramOutput(nextOutput(genesis, f(0)));
  // starknet-bound batch of one felt, too short for a record
  stream[13] = f(1);
  stream.insert(stream.begin() + 14, f(42));

  ASSERT_OUTCOME_ERROR(strict->updateState(owner, stream),
                       DecodeError::INCOMPLETE_MESSAGE);
  ASSERT_OUTCOME_SUCCESS(create()->updateState(owner, stream));
}

TEST_F(AppchainServiceTest, SetProgramInfo) {
  ProgramInfo info{.program_hash = f(0x51), .config_hash = f(0xc1)};
  ASSERT_OUTCOME_ERROR(service->setProgramInfo(stranger, info),
                       AccessControl::Error::OWNER_ONLY);
  ASSERT_OUTCOME_SUCCESS(service->setProgramInfo(owner, info));
  EXPECT_EQ(service->getProgramInfo(), info);
}

TEST_F(AppchainServiceTest, OperatorsAreManagedByOwner) {
  ASSERT_OUTCOME_ERROR(service->registerOperator(stranger, operator_),
                       AccessControl::Error::OWNER_ONLY);
  ASSERT_OUTCOME_SUCCESS(service->registerOperator(owner, operator_));
  ASSERT_OUTCOME_SUCCESS(is_operator, service->isOperator(operator_));
  EXPECT_TRUE(is_operator);

  // operators can't manage other operators
  ASSERT_OUTCOME_ERROR(service->registerOperator(operator_, stranger),
                       AccessControl::Error::OWNER_ONLY);

  ASSERT_OUTCOME_SUCCESS(service->unregisterOperator(owner, operator_));
  ASSERT_OUTCOME_SUCCESS(still_operator, service->isOperator(operator_));
  EXPECT_FALSE(still_operator);
}
