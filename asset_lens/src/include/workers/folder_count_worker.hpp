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
#include <optional>

#include "concurrency/worker.hpp"
#include "config/enrich_config.hpp"

namespace assetlens {
/**
 * @brief Counts the visible entries below each sub-record of a folder grouping. The count is a
 * display value: walking stops once it passes the cap.
 *
 * ItemReady is emitted once per sub-record, never for the grouping itself.
 */
class FolderCountWorker : public Worker {
  Q_OBJECT

 public:
  explicit FolderCountWorker(const EnrichConfig& config, QObject* parent = nullptr);

  auto Cap() const -> item_count_t { return cap_; }

 protected:
  auto Step(const RecordRef& ref) -> std::optional<RecordRef> override;

 private:
  auto         CountEntries(const std::filesystem::path& root, const Record& parent,
                            const Record& child) -> std::optional<item_count_t>;

  item_count_t cap_;
};
};  // namespace assetlens
