/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef APPCHAIN_BUILD_VERSION
#define APPCHAIN_BUILD_VERSION "unknown"
#endif

namespace appchain {
  const std::string &buildVersion() {
    static const std::string version{APPCHAIN_BUILD_VERSION};
    return version;
  }
}  // namespace appchain
