/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/impl/fact_registry_impl.hpp"
#include "mock/app/configuration_mock.hpp"
#include "testutil/prepare_loggers.hpp"

using appchain::Hash256;
using appchain::app::ConfigurationMock;
using appchain::app::FactRegistryImpl;
using testing::ReturnRef;

namespace {
  Hash256 fact(uint8_t last) {
    Hash256 hash{};
    hash[0] = 0xfa;
    hash[31] = last;
    return hash;
  }

  constexpr auto kFacts = R"(
- 0xfa00000000000000000000000000000000000000000000000000000000000001
- 0xfa00000000000000000000000000000000000000000000000000000000000002
)";
}  // namespace

class FactRegistryTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

TEST_F(FactRegistryTest, LoadsFacts) {
  auto registry =
      FactRegistryImpl::createForTesting(testutil::prepareLoggers(), kFacts);
  EXPECT_TRUE(registry.enabled());
  EXPECT_EQ(registry.size(), 2);
  EXPECT_TRUE(registry.isValid(fact(1)));
  EXPECT_TRUE(registry.isValid(fact(2)));
  EXPECT_FALSE(registry.isValid(fact(3)));
}

TEST_F(FactRegistryTest, EmptyListRejectsEverything) {
  auto registry =
      FactRegistryImpl::createForTesting(testutil::prepareLoggers(), "");
  EXPECT_TRUE(registry.enabled());
  EXPECT_FALSE(registry.isValid(fact(1)));
}

TEST_F(FactRegistryTest, InvalidInput) {
  EXPECT_THROW_OUTCOME(FactRegistryImpl::createForTesting(
                           testutil::prepareLoggers(), "key: value"),
                       FactRegistryImpl::Error::NOT_A_SEQUENCE);
  EXPECT_THROW_OUTCOME(
      FactRegistryImpl::createForTesting(testutil::prepareLoggers(), "- 0x01"),
      FactRegistryImpl::Error::INVALID_FACT);
  EXPECT_THROW_OUTCOME(
      FactRegistryImpl::createForTesting(testutil::prepareLoggers(), "- [1]"),
      FactRegistryImpl::Error::INVALID_FACT);
}

/**
 * @given configuration without facts file
 * @when registry is created
 * @then it is disabled
 */
TEST_F(FactRegistryTest, DisabledWithoutFile) {
  auto config = std::make_shared<ConfigurationMock>();
  appchain::app::Configuration::AppchainConfig appchain_config;
  EXPECT_CALL(*config, appchain()).WillRepeatedly(ReturnRef(appchain_config));

  FactRegistryImpl registry{testutil::prepareLoggers(), config};
  EXPECT_FALSE(registry.enabled());
  EXPECT_EQ(registry.size(), 0);
}

TEST_F(FactRegistryTest, MissingFile) {
  auto config = std::make_shared<ConfigurationMock>();
  appchain::app::Configuration::AppchainConfig appchain_config{
      .facts_file = "/nonexistent/appchain/facts.yaml",
  };
  EXPECT_CALL(*config, appchain()).WillRepeatedly(ReturnRef(appchain_config));

  EXPECT_THROW_OUTCOME(FactRegistryImpl(testutil::prepareLoggers(), config),
                       FactRegistryImpl::Error::FILE_NOT_LOADED);
}
