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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace assetlens {
// Extensions OpenCV's imgcodecs can decode into a thumbnail, lower-case, without the dot
static const std::unordered_set<std::string> default_thumbnail_extensions = {
    "jpg", "jpeg", "jpe", "png", "bmp", "dib", "tif", "tiff", "webp", "exr",
    "hdr", "pic",  "pbm", "pgm", "ppm", "pxm", "pnm", "sr",   "ras", "jp2"};

inline auto LowerExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(ext.begin());
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

inline bool is_thumbnail_extension(const std::unordered_set<std::string>& extensions,
                                   const std::string&                     ext) {
  return extensions.count(ext) > 0;
}
};  // namespace assetlens
