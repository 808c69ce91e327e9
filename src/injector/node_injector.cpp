/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/access_control.hpp"
#include "app/appchain_service.hpp"
#include "app/configuration.hpp"
#include "app/impl/fact_registry_impl.hpp"
#include "app/program_config.hpp"
#include "blockchain/message_ledger.hpp"
#include "blockchain/rolling_state.hpp"
#include "log/logger.hpp"
#include "snos/program_output_codec.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace {
  namespace di = boost::di;
  using namespace appchain;  // NOLINT

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<storage::SpacedStorage>.to([](const auto &injector) -> std::shared_ptr<storage::SpacedStorage> {
          auto &cfg = injector.template create<app::Configuration const &>();
          if (cfg.database().in_memory) {
            return std::make_shared<storage::InMemorySpacedStorage>();
          }
          return injector.template create<std::shared_ptr<storage::RocksDb>>();
        }),
        di::bind<app::FactRegistry>.to<app::FactRegistryImpl>(),
        di::bind<app::AccessControlConfig>.to([](const auto &injector) {
          return app::AccessControlConfig{
              injector.template create<app::Configuration const &>().appchain().owner,
          };
        }),
        di::bind<app::ProgramInfo>.to([](const auto &injector) {
          auto &appchain = injector.template create<app::Configuration const &>().appchain();
          return app::ProgramInfo{
              .program_hash = appchain.program_hash,
              .config_hash = appchain.config_hash,
          };
        }),
        di::bind<blockchain::RollingStateConfig>.to([](const auto &injector) {
          auto &appchain = injector.template create<app::Configuration const &>().appchain();
          return blockchain::RollingStateConfig{
              .prev_block_hash = appchain.check_prev_block_hash
                                   ? blockchain::PrevBlockHashPolicy::Enforce
                                   : blockchain::PrevBlockHashPolicy::Ignore,
          };
        }),
        di::bind<snos::DecodeOptions>.to([](const auto &injector) {
          auto &appchain = injector.template create<app::Configuration const &>().appchain();
          return snos::DecodeOptions{
              .truncation = appchain.strict_message_records
                              ? snos::TruncationPolicy::Strict
                              : snos::TruncationPolicy::Lenient,
          };
        }),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace appchain::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::AppchainService> NodeInjector::injectAppchainService() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::AppchainService>>();
  }
}  // namespace appchain::injector
