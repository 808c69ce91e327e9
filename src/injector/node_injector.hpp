/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace appchain::log {
  class LoggingSystem;
}  // namespace appchain::log

namespace appchain::app {
  class Configuration;
  class AppchainService;
}  // namespace appchain::app

namespace appchain::injector {

  /**
   * Dependency injector of the node. Provides the appchain service with
   * storage, access control, program config and rolling state behind it.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::AppchainService> injectAppchainService();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace appchain::injector
