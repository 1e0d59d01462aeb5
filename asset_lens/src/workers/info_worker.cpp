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

#include "workers/info_worker.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "record/sequence.hpp"
#include "thumbnail/thumbnail_path.hpp"
#include "utils/log/log_category.hpp"
#include "utils/string/format.hpp"

namespace assetlens {
namespace {
auto ToTimeT(std::filesystem::file_time_type time) -> std::time_t {
  auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(time));
  return std::chrono::system_clock::to_time_t(sys);
}

struct EntryStat {
  uint64_t    size_          = 0;
  std::time_t last_modified_ = 0;
};

auto StatEntry(const std::filesystem::directory_entry& entry) -> EntryStat {
  EntryStat       stat;
  std::error_code ec;
  if (entry.is_regular_file(ec)) {
    const auto size = entry.file_size(ec);
    if (!ec) {
      stat.size_ = size;
    }
  }
  const auto mtime = entry.last_write_time(ec);
  if (!ec) {
    stat.last_modified_ = ToTimeT(mtime);
  }
  return stat;
}

// Notes are stored as { "<id>": { "text": ..., "checked": ... } }
auto CountOpenNotes(const nlohmann::json& notes) -> int {
  int  count = 0;
  auto visit = [&count](const nlohmann::json& note) {
    if (!note.is_object()) {
      return;
    }
    const auto text    = note.find("text");
    const auto checked = note.find("checked");
    const bool has_text =
        text != note.end() && text->is_string() && !text->get<std::string>().empty();
    const bool is_checked = checked != note.end() && checked->is_boolean() && checked->get<bool>();
    if (has_text && !is_checked) {
      ++count;
    }
  };
  if (notes.is_object() || notes.is_array()) {
    for (const auto& note : notes) {
      visit(note);
    }
  }
  return count;
}
}  // namespace

InfoWorker::InfoWorker(std::shared_ptr<SidecarStore> sidecar, const EnrichConfig& config,
                       QObject* parent)
    : Worker(parent),
      sidecar_(std::move(sidecar)),
      cache_root_(config.cache_root_),
      verify_existence_(config.verify_existence_) {}

auto InfoWorker::Step(const RecordRef& ref) -> std::optional<RecordRef> {
  return ProcessFileInformation(ref);
}

auto InfoWorker::IsStale(const Record& record) const -> bool {
  return interrupt_.load() || record.IsDiscarded();
}

auto InfoWorker::ReadSidecar(const content_key_t& key, const Record& record)
    -> std::optional<SidecarData> {
  SidecarData data;
  if (!sidecar_) {
    return data;
  }

  try {
    auto description = sidecar_->Value(key, "description");
    if (IsStale(record)) return std::nullopt;
    if (description.has_value() && description->is_string()) {
      data.description_ = description->get<std::string>();
    }

    auto notes = sidecar_->Value(key, "notes");
    if (IsStale(record)) return std::nullopt;
    if (notes.has_value()) {
      data.todo_count_ = CountOpenNotes(*notes);
    }

    auto flags = sidecar_->Value(key, "flags");
    if (IsStale(record)) return std::nullopt;
    if (flags.has_value() && flags->is_number_integer()) {
      data.flags_ |= flags->get<uint32_t>();
    }

    auto archived = sidecar_->Value(key, "archived");
    if (IsStale(record)) return std::nullopt;
    if (archived.has_value() && archived->is_boolean() && archived->get<bool>()) {
      data.flags_ |= ARCHIVED;
    }
  } catch (const SidecarReadError& e) {
    qCWarning(lcInfo) << "Sidecar unreadable for" << key.c_str() << ":" << e.what();
    return SidecarData{};
  }
  return data;
}

auto InfoWorker::ProcessFileInformation(const RecordRef& ref) -> std::optional<RecordRef> {
  auto record = ref.Lock();
  if (!record || interrupt_.load()) {
    return std::nullopt;
  }

  content_key_t                                 key;
  RecordType                                    type;
  record_path_t                                 path;
  std::optional<SequencePattern>                pattern;
  std::vector<std::string>                      frames;
  std::vector<std::filesystem::directory_entry> entries;
  {
    std::lock_guard<std::mutex> lock(record->mutex_);
    // Checked under the same lock that releases entries_, so a late worker never sees them gone
    if (record->info_loaded_.load()) {
      return std::nullopt;
    }
    key     = record->ContentKey();
    type    = record->type_;
    path    = record->path_;
    pattern = record->sequence_;
    frames  = record->frames_;
    entries = record->entries_;
  }

  auto sidecar = ReadSidecar(key, *record);
  if (!sidecar.has_value() || IsStale(*record)) {
    return std::nullopt;
  }
  {
    std::lock_guard<std::mutex> lock(record->mutex_);
    record->description_ = sidecar->description_;
    record->todo_count_  = sidecar->todo_count_;
    record->flags_ |= EDITABLE | DRAG_ENABLED | sidecar->flags_;
  }

  std::string start_path;
  std::string end_path;
  std::string display_name;
  std::string details;
  uint64_t    size          = 0;
  std::time_t last_modified = 0;
  bool        has_stats     = true;

  if (type == RecordType::SEQUENCE && pattern.has_value() && !frames.empty()) {
    std::vector<int> numbers;
    numbers.reserve(frames.size());
    for (const auto& frame : frames) {
      numbers.push_back(std::stoi(frame));
    }
    const size_t padding = frames.front().size();
    const auto [first, last] = std::minmax_element(numbers.begin(), numbers.end());

    start_path   = pattern->Expand(PadFrame(*first, padding));
    end_path     = pattern->Expand(PadFrame(*last, padding));
    display_name = std::filesystem::path(pattern->Expand("[" + FrameRangeString(numbers, padding) + "]"))
                       .filename()
                       .string();

    // Without entry handles there is nothing to aggregate, keep whatever is already there
    has_stats = !entries.empty();
    for (const auto& entry : entries) {
      if (IsStale(*record)) {
        return std::nullopt;
      }
      const auto stat = StatEntry(entry);
      size += stat.size_;
      last_modified = std::max(last_modified, stat.last_modified_);
    }
    details = format::SequenceDetails(frames.size(), last_modified, size);
  } else {
    const auto entry = entries.empty() ? std::filesystem::directory_entry(path) : entries.front();
    const auto stat  = StatEntry(entry);
    if (IsStale(*record)) {
      return std::nullopt;
    }
    size          = stat.size_;
    last_modified = stat.last_modified_;
    start_path    = path.string();
    end_path      = path.string();
    display_name  = path.filename().string();
    details       = type == RecordType::FOLDER ? format::TimestampToString(last_modified)
                                               : format::FileDetails(last_modified, size);
  }

  bool missing = false;
  if (verify_existence_) {
    std::error_code ec;
    missing = !std::filesystem::exists(end_path, ec);
    if (IsStale(*record)) {
      return std::nullopt;
    }
  }

  const auto thumbnail_path = ThumbnailPathFor(cache_root_, key);

  if (IsStale(*record)) {
    return std::nullopt;
  }
  {
    std::lock_guard<std::mutex> lock(record->mutex_);
    if (record->info_loaded_.load()) {
      return std::nullopt;
    }
    record->start_path_     = start_path;
    record->end_path_       = end_path;
    record->display_name_   = display_name;
    if (has_stats) {
      record->size_          = size;
      record->last_modified_ = last_modified;
      record->details_       = details;
    }
    record->thumbnail_path_ = thumbnail_path;
    if (missing) {
      record->flags_ |= ARCHIVED;
    }
    record->entries_.clear();
    record->entries_.shrink_to_fit();
    record->info_loaded_.store(true);
  }
  return ref;
}
};  // namespace assetlens
