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

#include <QColor>
#include <QImage>
#include <QMetaType>

#include <atomic>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "record/sequence.hpp"
#include "type/type.hpp"

namespace assetlens {
enum class RecordType { FILE, SEQUENCE, FOLDER };

enum RecordFlag : uint32_t {
  NO_FLAG      = 0,
  EDITABLE     = 1u << 0,
  DRAG_ENABLED = 1u << 1,
  ARCHIVED     = 1u << 2,
  FAVOURITE    = 1u << 3,
  ACTIVE       = 1u << 4,
};

/**
 * @brief One browsable entry: a file, a collapsed file sequence or a folder.
 *
 * Records are owned by a RecordCollection. Workers only ever reach them through a RecordRef and
 * write fields in place while holding mutex_. The loaded flags are atomics so the interactive
 * thread can poll them without taking the lock.
 */
class Record {
 public:
  record_id_t                                 id_;
  RecordType                                  type_;

  record_path_t                               path_;
  std::string                                 display_name_;
  std::optional<SequencePattern>              sequence_;
  std::vector<std::string>                    frames_;

  // Only kept until the info worker has read them
  std::vector<std::filesystem::directory_entry> entries_;
  // Sub-records of a folder grouping
  std::vector<std::shared_ptr<Record>>        children_;

  uint32_t                                    flags_             = NO_FLAG;
  std::string                                 description_;
  int                                         todo_count_        = 0;
  item_count_t                                item_count_        = 0;
  uint64_t                                    size_              = 0;
  std::time_t                                 last_modified_     = 0;
  std::string                                 details_;
  std::string                                 start_path_;
  std::string                                 end_path_;

  int                                         row_height_        = 54;
  record_path_t                               thumbnail_path_;
  QImage                                      thumbnail_;
  QColor                                      thumbnail_background_;
  QImage                                      default_thumbnail_;
  QColor                                      default_thumbnail_background_;

  std::atomic<bool>                           info_loaded_       = false;
  std::atomic<bool>                           thumbnail_loaded_  = false;

  mutable std::mutex                          mutex_;

  explicit Record(record_id_t id, RecordType type, record_path_t path);

  Record(const Record&)            = delete;
  Record& operator=(const Record&) = delete;

  auto ContentKey() const -> content_key_t;
  auto Extension() const -> std::string;
  auto HasFlag(RecordFlag flag) const -> bool;
  void MarkDiscarded();
  auto IsDiscarded() const -> bool;

 private:
  std::atomic<bool> discarded_ = false;
};

/**
 * @brief Non-owning handle to a Record. It never keeps the record usable after its collection
 * let go of it: Lock() fails as soon as the record was discarded, even if a worker still holds a
 * strong pointer obtained from an earlier Lock().
 */
class RecordRef {
 public:
  RecordRef() = default;
  explicit RecordRef(const std::shared_ptr<Record>& record);

  auto Lock() const -> std::shared_ptr<Record>;
  auto IsAlive() const -> bool { return Lock() != nullptr; }
  auto IsValid() const -> bool { return valid_; }
  auto Id() const -> record_id_t { return id_; }

  bool operator==(const RecordRef& other) const;

 private:
  std::weak_ptr<Record> record_;
  record_id_t           id_    = 0;
  bool                  valid_ = false;
};
};  // namespace assetlens

Q_DECLARE_METATYPE(assetlens::RecordRef)
