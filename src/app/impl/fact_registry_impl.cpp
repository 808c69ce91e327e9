/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/fact_registry_impl.hpp"

#include <algorithm>
#include <string>

#include <qtils/error_throw.hpp>
#include <qtils/unhex.hpp>
#include <yaml-cpp/yaml.h>

#include "app/configuration.hpp"

namespace appchain::app {

  FactRegistryImpl::FactRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("FactRegistry", "application")} {}

  FactRegistryImpl::FactRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config)
      : FactRegistryImpl(std::move(logsys)) {
    const auto &path = config->appchain().facts_file;
    if (path.empty()) {
      SL_INFO(logger_, "Facts file is not set; fact checking disabled");
      return;
    }

    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &e) {
      SL_ERROR(logger_, "Failed to load facts '{}': {}", path.string(), e.what());
      qtils::raise(Error::FILE_NOT_LOADED);
    }
    load(root);
    SL_INFO(logger_, "Loaded {} facts from '{}'", facts_.size(), path.string());
  }

  FactRegistryImpl FactRegistryImpl::createForTesting(
      qtils::SharedRef<log::LoggingSystem> logsys, std::string_view yaml) {
    FactRegistryImpl registry{std::move(logsys)};
    registry.load(YAML::Load(std::string(yaml)));
    return registry;
  }

  bool FactRegistryImpl::isValid(const Hash256 &fact) const {
    return facts_.contains(fact);
  }

  void FactRegistryImpl::load(const YAML::Node &root) {
    enabled_ = true;

    if (root.IsDefined() and not root.IsNull() and not root.IsSequence()) {
      qtils::raise(Error::NOT_A_SEQUENCE);
    }

    if (root.IsSequence()) {
      for (const auto &node : root) {
        if (not node.IsScalar()) {
          qtils::raise(Error::INVALID_FACT);
        }
        auto hex = node.as<std::string>();
        qtils::ByteVec bytes;
        Hash256 fact;
        if (not qtils::unhex0x(bytes, hex, true).has_value()
            or bytes.size() != fact.size()) {
          SL_ERROR(logger_, "Invalid fact '{}'", hex);
          qtils::raise(Error::INVALID_FACT);
        }
        std::ranges::copy(bytes, fact.begin());
        facts_.emplace(fact);
      }
    }

    if (facts_.empty()) {
      SL_WARN(logger_, "Facts list is empty; every update will be rejected");
    }
  }

}  // namespace appchain::app
