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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <json.hpp>
#include <string>
#include <unordered_set>

namespace assetlens {
/**
 * @brief Tunables of the enrichment threads. Every key of the JSON form is optional.
 */
struct EnrichConfig {
  std::chrono::milliseconds       info_interval_{50};
  std::chrono::milliseconds       thumbnail_interval_{100};
  std::chrono::milliseconds       folder_count_interval_{250};
  std::chrono::milliseconds       background_interval_{1000};
  std::chrono::milliseconds       background_sweep_{1500};
  std::chrono::milliseconds       monitor_interval_{200};

  // The thumbnail worker polls for info_loaded_ this many times before giving up
  int                             info_wait_retries_  = 20;
  std::chrono::milliseconds       info_wait_step_{100};

  uint64_t                        max_source_bytes_   = 2ull * 1024 * 1024 * 1024;
  int                             thumbnail_size_     = 512;
  int                             row_height_         = 54;
  uint32_t                        folder_count_cap_   = 999;
  uint32_t                        image_cache_size_   = 512;
  bool                            verify_existence_   = false;

  std::filesystem::path           cache_root_;
  std::filesystem::path           sidecar_path_;
  std::unordered_set<std::string> thumbnail_extensions_;

  EnrichConfig();

  static auto FromJson(const nlohmann::json& json) -> EnrichConfig;
  static auto LoadFromFile(const std::filesystem::path& path) -> EnrichConfig;
  auto        ToJson() const -> nlohmann::json;
  void        SaveToFile(const std::filesystem::path& path) const;
};
};  // namespace assetlens
