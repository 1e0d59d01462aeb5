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

#include <QMetaType>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "record/record.hpp"
#include "type/type.hpp"

namespace assetlens {
enum class SortRole { NAME, SIZE, LAST_MODIFIED };

/**
 * @brief The volatile in-memory listing that owns every Record. Replacing or clearing it
 * discards the previous generation so queued RecordRefs stop resolving.
 */
class RecordCollection {
 public:
  explicit RecordCollection(std::string data_key = {});
  ~RecordCollection();

  RecordCollection(const RecordCollection&)            = delete;
  RecordCollection& operator=(const RecordCollection&) = delete;

  auto Add(std::shared_ptr<Record> record) -> RecordRef;
  void Replace(std::vector<std::shared_ptr<Record>> records);
  void Clear();

  auto Snapshot() const -> std::vector<RecordRef>;
  auto Size() const -> size_t;
  auto At(size_t index) const -> std::shared_ptr<Record>;
  auto Generation() const -> uint64_t;
  auto DataKey() const -> const std::string& { return data_key_; }

  auto IsFullyLoaded() const -> bool { return fully_loaded_.load(); }
  void SetFullyLoaded(bool loaded) { fully_loaded_.store(loaded); }

  void Sort(SortRole role, bool descending = false);
  void ResetThumbnails();

 private:
  void                                 DiscardLocked();

  std::string                          data_key_;
  mutable std::mutex                   mutex_;
  std::vector<std::shared_ptr<Record>> records_;
  uint64_t                             generation_   = 0;
  std::atomic<bool>                    fully_loaded_ = false;
};

using CollectionRef = std::weak_ptr<RecordCollection>;

// Factories used by whoever walks the filesystem to build a listing
auto MakeFileRecord(record_id_t id, const std::filesystem::directory_entry& entry, int row_height)
    -> std::shared_ptr<Record>;
auto MakeSequenceRecord(record_id_t id, const SequencePattern& pattern,
                        std::vector<std::string>                      frames,
                        std::vector<std::filesystem::directory_entry> entries, int row_height)
    -> std::shared_ptr<Record>;
auto MakeFolderRecord(record_id_t id, const std::filesystem::path& path,
                      std::vector<std::shared_ptr<Record>> children, int row_height)
    -> std::shared_ptr<Record>;
};  // namespace assetlens

Q_DECLARE_METATYPE(assetlens::CollectionRef)
