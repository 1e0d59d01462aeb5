//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "concurrency/worker.hpp"
#include "config/enrich_config.hpp"
#include "sidecar/sidecar_store.hpp"

namespace assetlens {
/**
 * @brief Fills in the metadata of one record per activation: sidecar description, open notes
 * and flags, size, modification time, the detail string and the thumbnail cache path.
 */
class InfoWorker : public Worker {
  Q_OBJECT

 public:
  InfoWorker(std::shared_ptr<SidecarStore> sidecar, const EnrichConfig& config,
             QObject* parent = nullptr);

  /**
   * @brief Enrich one record in place. The referent is re-checked before every read that may
   * block, and the record is left untouched from the first failed check on.
   *
   * @return ref when the record got loaded, std::nullopt when it was already loaded, stale or
   * the worker was interrupted
   */
  auto ProcessFileInformation(const RecordRef& ref) -> std::optional<RecordRef>;

 protected:
  auto Step(const RecordRef& ref) -> std::optional<RecordRef> override;

 private:
  struct SidecarData {
    std::string description_;
    int         todo_count_ = 0;
    uint32_t    flags_      = NO_FLAG;
  };

  auto                          IsStale(const Record& record) const -> bool;
  auto                          ReadSidecar(const content_key_t& key, const Record& record)
      -> std::optional<SidecarData>;

  std::shared_ptr<SidecarStore> sidecar_;
  std::filesystem::path         cache_root_;
  bool                          verify_existence_;
};
};  // namespace assetlens
