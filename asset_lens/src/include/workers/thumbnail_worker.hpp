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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

#include "concurrency/worker.hpp"
#include "config/enrich_config.hpp"
#include "thumbnail/image_cache.hpp"
#include "thumbnail/thumbnail_generator.hpp"

namespace assetlens {
/**
 * @brief Loads the cached thumbnail of a record, generating it first when the cache has none
 * and the file type is decodable. A failed generation leaves the placeholder in place and is
 * not retried.
 */
class ThumbnailWorker : public Worker {
  Q_OBJECT

 public:
  ThumbnailWorker(std::shared_ptr<ThumbnailGenerator> generator, std::shared_ptr<ImageCache> cache,
                  const EnrichConfig& config, QObject* parent = nullptr);

 protected:
  auto Step(const RecordRef& ref) -> std::optional<RecordRef> override;

 private:
  auto IsStale(const Record& record) const -> bool;
  auto WaitForInfo(const Record& record) -> bool;
  auto LoadCached(const RecordRef& ref, Record& record, const std::filesystem::path& thumbnail,
                  int height) -> std::optional<RecordRef>;
  auto ProcessThumbnail(const RecordRef& ref, Record& record,
                        const std::filesystem::path& source,
                        const std::filesystem::path& thumbnail, int height)
      -> std::optional<RecordRef>;
  void SetPlaceholder(Record& record, const std::filesystem::path& source,
                      const std::filesystem::path& thumbnail);

  std::shared_ptr<ThumbnailGenerator> generator_;
  std::shared_ptr<ImageCache>         cache_;
  std::filesystem::path               cache_root_;
  std::unordered_set<std::string>     extensions_;
  uint64_t                            max_source_bytes_;
  int                                 thumbnail_size_;
  int                                 info_wait_retries_;
  std::chrono::milliseconds           info_wait_step_;
};
};  // namespace assetlens
