/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace appchain::storage {

  /**
   * @brief Error codes of storage backends.
   * RocksDB statuses are mapped onto these by status_as_error().
   */
  enum class StorageError : int {  // NOLINT(performance-enum-size)
    NOT_SUPPORTED = 1,
    CORRUPTION,
    INVALID_ARGUMENT,
    IO_ERROR,
    NOT_FOUND,
    /// RocksDb instance was destroyed while its space is still in use
    STORAGE_GONE,
    /// Stored value has unexpected length
    INVALID_VALUE,

    UNKNOWN = 1000,
  };

}  // namespace appchain::storage

OUTCOME_HPP_DECLARE_ERROR(appchain::storage, StorageError);
