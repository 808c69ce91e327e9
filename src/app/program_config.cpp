/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/program_config.hpp"

#include <qtils/error_throw.hpp>

#include "app/fact_registry.hpp"
#include "crypto/sha/sha256.hpp"
#include "storage/predefined_keys.hpp"
#include "storage/spaced_storage.hpp"

namespace appchain::app {

  ProgramConfig::ProgramConfig(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      qtils::SharedRef<FactRegistry> facts,
      ProgramInfo defaults)
      : logger_{logsys->getLogger("ProgramConfig", "application")},
        space_{storage->getSpace(storage::Space::Appchain)},
        facts_{std::move(facts)},
        info_{defaults} {
    auto raw_res = space_->tryGet(storage::kProgramInfoLookupKey);
    if (raw_res.has_error()) {
      SL_CRITICAL(
          logger_, "Can't read persisted program info: {}", raw_res.error());
      qtils::raise(raw_res.error());
    }
    if (auto &raw = raw_res.value(); raw.has_value()) {
      auto info_res = decode(raw.value());
      if (info_res.has_error()) {
        SL_CRITICAL(
            logger_, "Can't decode program info: {}", info_res.error());
        qtils::raise(info_res.error());
      }
      info_ = info_res.value();
    }
    SL_DEBUG(logger_,
             "Program hash {}, config hash {}",
             info_.program_hash,
             info_.config_hash);
  }

  outcome::result<void> ProgramConfig::setProgramInfo(const ProgramInfo &info) {
    BOOST_OUTCOME_TRY(space_->put(storage::kProgramInfoLookupKey, encode(info)));
    info_ = info;
    SL_INFO(logger_,
            "Program info set: program hash {}, config hash {}",
            info_.program_hash,
            info_.config_hash);
    return outcome::success();
  }

  Hash256 ProgramConfig::fact(std::span<const Felt> stream) const {
    auto output_hash = crypto::sha256Felts({stream});
    qtils::ByteVec preimage;
    preimage.reserve(Felt::kSize + output_hash.size());
    preimage.insert(preimage.end(),
                    info_.program_hash.bytes().begin(),
                    info_.program_hash.bytes().end());
    preimage.insert(preimage.end(), output_hash.begin(), output_hash.end());
    return crypto::sha256(preimage);
  }

  outcome::result<void> ProgramConfig::checkOutput(
      const ProgramOutput &output, std::span<const Felt> stream) const {
    if (output.config_hash != info_.config_hash) {
      return Error::CONFIG_HASH_MISMATCH;
    }
    if (facts_->enabled() and not facts_->isValid(fact(stream))) {
      return Error::FACT_NOT_VERIFIED;
    }
    return outcome::success();
  }

  qtils::ByteVec ProgramConfig::encode(const ProgramInfo &info) {
    qtils::ByteVec out;
    out.reserve(2 * Felt::kSize);
    for (const auto &felt : {info.program_hash, info.config_hash}) {
      out.insert(out.end(), felt.bytes().begin(), felt.bytes().end());
    }
    return out;
  }

  outcome::result<ProgramInfo> ProgramConfig::decode(qtils::BytesIn bytes) {
    if (bytes.size() != 2 * Felt::kSize) {
      return Error::CORRUPTED_PROGRAM_INFO;
    }
    auto program_hash = Felt::fromBytes(bytes.first(Felt::kSize));
    auto config_hash = Felt::fromBytes(bytes.subspan(Felt::kSize));
    if (program_hash.has_error() or config_hash.has_error()) {
      return Error::CORRUPTED_PROGRAM_INFO;
    }
    return ProgramInfo{
        .program_hash = program_hash.value(),
        .config_hash = config_hash.value(),
    };
  }

}  // namespace appchain::app
