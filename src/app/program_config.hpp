/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/hash_types.hpp"
#include "log/logger.hpp"
#include "types/program_output.hpp"

namespace appchain::storage {
  class SpacedStorage;
  struct BufferStorage;
}  // namespace appchain::storage

namespace appchain::app {
  class FactRegistry;

  /// Program expected to produce accepted outputs
  struct ProgramInfo {
    Felt program_hash;
    Felt config_hash;

    bool operator==(const ProgramInfo &) const = default;
  };

  /**
   * Persistent program info and the checks of an output against it.
   * Stored info takes precedence over the one given at construction.
   */
  class ProgramConfig {
   public:
    enum class Error {
      CONFIG_HASH_MISMATCH = 1,
      FACT_NOT_VERIFIED,
      CORRUPTED_PROGRAM_INFO,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::CONFIG_HASH_MISMATCH:
          return "Output config hash doesn't match program info";
        case E::FACT_NOT_VERIFIED:
          return "Output fact is not registered";
        case E::CORRUPTED_PROGRAM_INFO:
          return "Persisted program info is corrupted";
      }
      return "Unknown ProgramConfig error";
    }

    ProgramConfig(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<storage::SpacedStorage> storage,
                  qtils::SharedRef<FactRegistry> facts,
                  ProgramInfo defaults);

    const ProgramInfo &getProgramInfo() const {
      return info_;
    }

    outcome::result<void> setProgramInfo(const ProgramInfo &info);

    /// Fact of `stream` produced by the current program
    Hash256 fact(std::span<const Felt> stream) const;

    /**
     * Check decoded `output` and its raw `stream`: config hash must match,
     * the fact must be registered if the registry is enabled
     */
    outcome::result<void> checkOutput(const ProgramOutput &output,
                                      std::span<const Felt> stream) const;

    static qtils::ByteVec encode(const ProgramInfo &info);

    static outcome::result<ProgramInfo> decode(qtils::BytesIn bytes);

   private:
    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    qtils::SharedRef<FactRegistry> facts_;
    ProgramInfo info_;
  };

}  // namespace appchain::app
