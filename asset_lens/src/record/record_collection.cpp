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

#include "record/record_collection.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace assetlens {
namespace {
void DiscardRecursively(const std::shared_ptr<Record>& record) {
  if (!record) {
    return;
  }
  record->MarkDiscarded();
  for (const auto& child : record->children_) {
    DiscardRecursively(child);
  }
}
}  // namespace

RecordCollection::RecordCollection(std::string data_key) : data_key_(std::move(data_key)) {}

RecordCollection::~RecordCollection() {
  std::lock_guard<std::mutex> lock(mutex_);
  DiscardLocked();
}

auto RecordCollection::Add(std::shared_ptr<Record> record) -> RecordRef {
  RecordRef ref(record);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
  }
  fully_loaded_.store(false);
  return ref;
}

void RecordCollection::Replace(std::vector<std::shared_ptr<Record>> records) {
  std::lock_guard<std::mutex> lock(mutex_);
  DiscardLocked();
  records_ = std::move(records);
  ++generation_;
  fully_loaded_.store(false);
}

void RecordCollection::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  DiscardLocked();
  ++generation_;
  fully_loaded_.store(false);
}

void RecordCollection::DiscardLocked() {
  for (const auto& record : records_) {
    DiscardRecursively(record);
  }
  records_.clear();
}

auto RecordCollection::Snapshot() const -> std::vector<RecordRef> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RecordRef>      refs;
  refs.reserve(records_.size());
  for (const auto& record : records_) {
    refs.emplace_back(record);
  }
  return refs;
}

auto RecordCollection::Size() const -> size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

auto RecordCollection::At(size_t index) const -> std::shared_ptr<Record> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= records_.size()) {
    return nullptr;
  }
  return records_[index];
}

auto RecordCollection::Generation() const -> uint64_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

void RecordCollection::Sort(SortRole role, bool descending) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto less = [role](const std::shared_ptr<Record>& a, const std::shared_ptr<Record>& b) {
    if (a == b) {
      return false;
    }
    std::scoped_lock both(a->mutex_, b->mutex_);
    switch (role) {
      case SortRole::SIZE:
        if (a->size_ != b->size_) return a->size_ < b->size_;
        break;
      case SortRole::LAST_MODIFIED:
        if (a->last_modified_ != b->last_modified_) return a->last_modified_ < b->last_modified_;
        break;
      case SortRole::NAME:
        break;
    }
    return a->path_.generic_string() < b->path_.generic_string();
  };

  if (descending) {
    std::stable_sort(records_.begin(), records_.end(),
                     [&less](const auto& a, const auto& b) { return less(b, a); });
  } else {
    std::stable_sort(records_.begin(), records_.end(), less);
  }
}

void RecordCollection::ResetThumbnails() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& record : records_) {
    std::lock_guard<std::mutex> record_lock(record->mutex_);
    record->thumbnail_loaded_.store(false);
    record->thumbnail_path_.clear();
    record->thumbnail_            = record->default_thumbnail_;
    record->thumbnail_background_ = record->default_thumbnail_background_;
  }
}

auto MakeFileRecord(record_id_t id, const std::filesystem::directory_entry& entry, int row_height)
    -> std::shared_ptr<Record> {
  auto record         = std::make_shared<Record>(id, RecordType::FILE, entry.path());
  record->row_height_ = row_height;
  record->entries_.push_back(entry);
  return record;
}

auto MakeSequenceRecord(record_id_t id, const SequencePattern& pattern,
                        std::vector<std::string>                      frames,
                        std::vector<std::filesystem::directory_entry> entries, int row_height)
    -> std::shared_ptr<Record> {
  auto record         = std::make_shared<Record>(id, RecordType::SEQUENCE, pattern.Key());
  record->sequence_   = pattern;
  record->frames_     = std::move(frames);
  record->entries_    = std::move(entries);
  record->row_height_ = row_height;
  return record;
}

auto MakeFolderRecord(record_id_t id, const std::filesystem::path& path,
                      std::vector<std::shared_ptr<Record>> children, int row_height)
    -> std::shared_ptr<Record> {
  auto record         = std::make_shared<Record>(id, RecordType::FOLDER, path);
  record->children_   = std::move(children);
  record->row_height_ = row_height;
  return record;
}
};  // namespace assetlens
