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

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "utils/cache/lru_cache.hpp"

namespace assetlens {
/**
 * @brief Decoded thumbnails shared by every thread, keyed by file path. Each entry remembers the
 * height it was scaled to and the average colour of the image.
 */
class ImageCache {
 public:
  struct CachedImage {
    int    height_ = 0;
    QImage image_;
    QColor background_;
  };

  explicit ImageCache(uint32_t capacity = LRUCache<std::string, CachedImage>::default_capacity_);

  /**
   * @brief Load an image scaled to height
   *
   * @param overwrite reload from disk even when a copy of the same height is cached
   * @return a null QImage if the file cannot be read
   */
  auto Get(const std::string& path, int height, bool overwrite = false) -> QImage;
  auto BackgroundColor(const std::string& path) -> std::optional<QColor>;
  void Invalidate(const std::string& path);
  auto Size() -> size_t;

 private:
  std::mutex                              mtx_;
  LRUCache<std::string, CachedImage>      cache_;
};
};  // namespace assetlens
