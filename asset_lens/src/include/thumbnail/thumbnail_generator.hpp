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

#include <filesystem>

namespace assetlens {
/**
 * @brief Produces a cached thumbnail image file from a source file. Implementations are called
 * from the thumbnail thread only.
 */
class ThumbnailGenerator {
 public:
  virtual ~ThumbnailGenerator() = default;

  /**
   * @brief Render source into dest, fitting the longer edge into size pixels
   *
   * @return false if the source could not be decoded or dest could not be written
   */
  virtual auto Generate(const std::filesystem::path& source, const std::filesystem::path& dest,
                        int size) -> bool = 0;
};

class OpenCvThumbnailGenerator final : public ThumbnailGenerator {
 public:
  auto Generate(const std::filesystem::path& source, const std::filesystem::path& dest, int size)
      -> bool override;
};
};  // namespace assetlens
