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

#include "thumbnail/thumbnail_path.hpp"

#include <cstdint>
#include <format>
#include <xxhash.h>

namespace assetlens {
auto ThumbnailPathFor(const std::filesystem::path& cache_root, const content_key_t& key)
    -> std::filesystem::path {
  const XXH64_hash_t hash = XXH3_64bits(key.data(), key.size());
  return cache_root / std::format("{:016x}.png", static_cast<uint64_t>(hash));
}
};  // namespace assetlens
