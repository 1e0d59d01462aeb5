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

#include "record/record.hpp"

#include <memory>
#include <string>

#include "type/supported_file_type.hpp"

namespace assetlens {
Record::Record(record_id_t id, RecordType type, record_path_t path)
    : id_(id), type_(type), path_(std::move(path)) {
  display_name_ = path_.filename().string();
}

auto Record::ContentKey() const -> content_key_t {
  if (type_ == RecordType::SEQUENCE && sequence_.has_value()) {
    return sequence_->Key();
  }
  return path_.generic_string();
}

auto Record::Extension() const -> std::string {
  if (sequence_.has_value()) {
    return LowerExtension(fs::path("x." + sequence_->extension_));
  }
  return LowerExtension(path_);
}

auto Record::HasFlag(RecordFlag flag) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return (flags_ & flag) != 0;
}

void Record::MarkDiscarded() { discarded_.store(true, std::memory_order_release); }

auto Record::IsDiscarded() const -> bool { return discarded_.load(std::memory_order_acquire); }

RecordRef::RecordRef(const std::shared_ptr<Record>& record)
    : record_(record), id_(record ? record->id_ : 0), valid_(record != nullptr) {}

auto RecordRef::Lock() const -> std::shared_ptr<Record> {
  auto record = record_.lock();
  if (!record || record->IsDiscarded()) {
    return nullptr;
  }
  return record;
}

bool RecordRef::operator==(const RecordRef& other) const {
  if (valid_ != other.valid_) {
    return false;
  }
  // Ownership equality: stays meaningful after the record itself has expired
  return !record_.owner_before(other.record_) && !other.record_.owner_before(record_);
}
};  // namespace assetlens
