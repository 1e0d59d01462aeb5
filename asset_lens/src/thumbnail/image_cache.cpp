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

#include "thumbnail/image_cache.hpp"

#include <utility>

namespace assetlens {
ImageCache::ImageCache(uint32_t capacity) : cache_(capacity) {}

auto ImageCache::Get(const std::string& path, int height, bool overwrite) -> QImage {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!overwrite) {
      auto cached = cache_.AccessElement(path);
      if (cached.has_value() && cached->height_ == height) {
        return cached->image_;
      }
    }
  }

  // Decode outside the lock, other threads keep reading cached entries meanwhile
  QImage image(QString::fromStdString(path));
  if (image.isNull()) {
    return {};
  }
  if (height > 0 && image.height() != height) {
    image = image.scaledToHeight(height, Qt::SmoothTransformation);
  }

  CachedImage entry;
  entry.height_     = height;
  entry.image_      = image;
  entry.background_ = image.scaled(1, 1, Qt::IgnoreAspectRatio, Qt::SmoothTransformation).pixelColor(0, 0);

  std::lock_guard<std::mutex> lock(mtx_);
  cache_.RecordAccess(path, std::move(entry));
  return image;
}

auto ImageCache::BackgroundColor(const std::string& path) -> std::optional<QColor> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        cached = cache_.AccessElement(path);
  if (!cached.has_value()) {
    return std::nullopt;
  }
  return cached->background_;
}

void ImageCache::Invalidate(const std::string& path) {
  std::lock_guard<std::mutex> lock(mtx_);
  cache_.RemoveRecord(path);
}

auto ImageCache::Size() -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return cache_.Size();
}
};  // namespace assetlens
