/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(appchain::storage, StorageError, e) {
  using E = appchain::storage::StorageError;
  switch (e) {
    case E::NOT_SUPPORTED:
      return "Operation is not supported by storage";
    case E::CORRUPTION:
      return "Storage data is corrupted";
    case E::INVALID_ARGUMENT:
      return "Invalid argument to storage";
    case E::IO_ERROR:
      return "Storage IO error";
    case E::NOT_FOUND:
      return "Entry not found in storage";
    case E::STORAGE_GONE:
      return "Storage instance has been destroyed";
    case E::INVALID_VALUE:
      return "Stored value has unexpected length";
    case E::UNKNOWN:
      break;
  }
  return "Unknown storage error";
}
