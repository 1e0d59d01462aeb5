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

#include "workers/thumbnail_worker.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "thumbnail/thumbnail_path.hpp"
#include "type/supported_file_type.hpp"
#include "utils/log/log_category.hpp"

namespace assetlens {
ThumbnailWorker::ThumbnailWorker(std::shared_ptr<ThumbnailGenerator> generator,
                                 std::shared_ptr<ImageCache> cache, const EnrichConfig& config,
                                 QObject* parent)
    : Worker(parent),
      generator_(std::move(generator)),
      cache_(std::move(cache)),
      cache_root_(config.cache_root_),
      extensions_(config.thumbnail_extensions_),
      max_source_bytes_(config.max_source_bytes_),
      thumbnail_size_(config.thumbnail_size_),
      info_wait_retries_(config.info_wait_retries_),
      info_wait_step_(config.info_wait_step_) {}

auto ThumbnailWorker::IsStale(const Record& record) const -> bool {
  return interrupt_.load() || record.IsDiscarded();
}

auto ThumbnailWorker::WaitForInfo(const Record& record) -> bool {
  int attempts = 0;
  while (!record.info_loaded_.load()) {
    if (attempts >= info_wait_retries_) {
      return false;
    }
    if (!SleepFor(info_wait_step_) || IsStale(record)) {
      return false;
    }
    ++attempts;
  }
  return true;
}

auto ThumbnailWorker::Step(const RecordRef& ref) -> std::optional<RecordRef> {
  auto record = ref.Lock();
  if (!record || interrupt_.load()) {
    return std::nullopt;
  }
  if (record->HasFlag(ARCHIVED)) {
    return std::nullopt;
  }
  if (!WaitForInfo(*record)) {
    return std::nullopt;
  }
  if (record->thumbnail_loaded_.load()) {
    return std::nullopt;
  }

  std::filesystem::path thumbnail;
  std::filesystem::path source;
  std::string           extension;
  int                   height;
  {
    std::lock_guard<std::mutex> lock(record->mutex_);
    thumbnail = record->thumbnail_path_.empty()
                    ? ThumbnailPathFor(cache_root_, record->ContentKey())
                    : record->thumbnail_path_;
    // A collapsed sequence is represented by its first frame
    source    = record->type_ == RecordType::SEQUENCE && !record->start_path_.empty()
                    ? std::filesystem::path(record->start_path_)
                    : record->path_;
    extension = record->Extension();
    height    = record->row_height_;
  }

  std::error_code ec;
  if (std::filesystem::exists(thumbnail, ec)) {
    return LoadCached(ref, *record, thumbnail, height);
  }
  if (IsStale(*record)) {
    return std::nullopt;
  }
  if (!is_thumbnail_extension(extensions_, extension)) {
    return std::nullopt;
  }
  return ProcessThumbnail(ref, *record, source, thumbnail, height);
}

auto ThumbnailWorker::LoadCached(const RecordRef& ref, Record& record,
                                 const std::filesystem::path& thumbnail, int height)
    -> std::optional<RecordRef> {
  QImage image = cache_->Get(thumbnail.string(), height, true);
  if (image.isNull() || IsStale(record)) {
    return std::nullopt;
  }
  const auto background = cache_->BackgroundColor(thumbnail.string());
  {
    std::lock_guard<std::mutex> lock(record.mutex_);
    record.thumbnail_            = std::move(image);
    record.thumbnail_background_ = background.value_or(record.default_thumbnail_background_);
  }
  record.thumbnail_loaded_.store(true);
  return ref;
}

auto ThumbnailWorker::ProcessThumbnail(const RecordRef& ref, Record& record,
                                       const std::filesystem::path& source,
                                       const std::filesystem::path& thumbnail, int height)
    -> std::optional<RecordRef> {
  bool generated = false;
  try {
    std::error_code ec;
    const auto      source_size = std::filesystem::file_size(source, ec);
    if (ec) {
      qCWarning(lcThumbnail) << "Cannot stat" << source.c_str() << ec.message().c_str();
    } else if (source_size >= max_source_bytes_) {
      qCWarning(lcThumbnail) << "Refusing to generate a thumbnail for" << source.c_str() << "("
                             << source_size << "bytes)";
    } else if (!generator_) {
      qCWarning(lcThumbnail) << "No thumbnail generator configured";
    } else {
      generated = generator_->Generate(source, thumbnail, thumbnail_size_);
      if (!generated) {
        qCWarning(lcThumbnail) << "Thumbnail generation failed for" << source.c_str();
      }
    }
  } catch (const std::exception& e) {
    qCWarning(lcThumbnail) << "Thumbnail generation failed for" << source.c_str() << ":"
                           << e.what();
    generated = false;
  }

  if (IsStale(record)) {
    return std::nullopt;
  }
  if (generated) {
    auto loaded = LoadCached(ref, record, thumbnail, height);
    if (loaded.has_value() || IsStale(record)) {
      return loaded;
    }
  }
  SetPlaceholder(record, source, thumbnail);
  return std::nullopt;
}

void ThumbnailWorker::SetPlaceholder(Record& record, const std::filesystem::path& source,
                                     const std::filesystem::path& thumbnail) {
  {
    std::lock_guard<std::mutex> lock(record.mutex_);
    record.thumbnail_            = record.default_thumbnail_;
    record.thumbnail_background_ = record.default_thumbnail_background_;
  }
  record.thumbnail_loaded_.store(true);
  cache_->Invalidate(source.string());
  cache_->Invalidate(thumbnail.string());
}
};  // namespace assetlens
