/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace appchain {
  /// Version string stamped in by the build
  const std::string &buildVersion();
}  // namespace appchain
