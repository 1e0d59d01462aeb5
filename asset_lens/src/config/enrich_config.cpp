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

#include "config/enrich_config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "type/supported_file_type.hpp"

namespace assetlens {
namespace {
using std::chrono::milliseconds;

void ReadInterval(const nlohmann::json& json, const char* key, milliseconds& out) {
  if (!json.contains(key)) {
    return;
  }
  const auto value = json.at(key).get<int64_t>();
  if (value <= 0) {
    throw std::runtime_error(std::format("Config key '{}' must be positive, got {}", key, value));
  }
  out = milliseconds(value);
}

template <typename T>
void ReadValue(const nlohmann::json& json, const char* key, T& out) {
  if (json.contains(key)) {
    out = json.at(key).get<T>();
  }
}

auto NormalizeExtension(std::string ext) -> std::string {
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(ext.begin());
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}
}  // namespace

EnrichConfig::EnrichConfig()
    : cache_root_(std::filesystem::temp_directory_path() / "assetlens" / "thumbnails"),
      sidecar_path_(std::filesystem::temp_directory_path() / "assetlens" / "sidecar.json"),
      thumbnail_extensions_(default_thumbnail_extensions) {}

auto EnrichConfig::FromJson(const nlohmann::json& json) -> EnrichConfig {
  if (!json.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }

  EnrichConfig config;
  try {
    ReadInterval(json, "info_interval_ms", config.info_interval_);
    ReadInterval(json, "thumbnail_interval_ms", config.thumbnail_interval_);
    ReadInterval(json, "folder_count_interval_ms", config.folder_count_interval_);
    ReadInterval(json, "background_interval_ms", config.background_interval_);
    ReadInterval(json, "background_sweep_ms", config.background_sweep_);
    ReadInterval(json, "monitor_interval_ms", config.monitor_interval_);
    ReadInterval(json, "info_wait_step_ms", config.info_wait_step_);

    ReadValue(json, "info_wait_retries", config.info_wait_retries_);
    ReadValue(json, "max_source_bytes", config.max_source_bytes_);
    ReadValue(json, "thumbnail_size", config.thumbnail_size_);
    ReadValue(json, "row_height", config.row_height_);
    ReadValue(json, "folder_count_cap", config.folder_count_cap_);
    ReadValue(json, "image_cache_size", config.image_cache_size_);
    ReadValue(json, "verify_existence", config.verify_existence_);

    if (json.contains("cache_root")) {
      config.cache_root_ = std::filesystem::path(json.at("cache_root").get<std::string>());
    }
    if (json.contains("sidecar_path")) {
      config.sidecar_path_ = std::filesystem::path(json.at("sidecar_path").get<std::string>());
    }
    if (json.contains("thumbnail_extensions")) {
      config.thumbnail_extensions_.clear();
      for (const auto& ext : json.at("thumbnail_extensions")) {
        config.thumbnail_extensions_.insert(NormalizeExtension(ext.get<std::string>()));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::format("Invalid config value: {}", e.what()));
  }

  if (config.thumbnail_size_ <= 0 || config.row_height_ <= 0) {
    throw std::runtime_error("Config thumbnail_size and row_height must be positive");
  }
  if (config.info_wait_retries_ < 0) {
    throw std::runtime_error("Config info_wait_retries must not be negative");
  }
  return config;
}

auto EnrichConfig::LoadFromFile(const std::filesystem::path& path) -> EnrichConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open config file {}", path.string()));
  }

  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(
        std::format("Failed to parse config file {}: {}", path.string(), e.what()));
  }
  return FromJson(json);
}

auto EnrichConfig::ToJson() const -> nlohmann::json {
  nlohmann::json json;
  json["info_interval_ms"]         = info_interval_.count();
  json["thumbnail_interval_ms"]    = thumbnail_interval_.count();
  json["folder_count_interval_ms"] = folder_count_interval_.count();
  json["background_interval_ms"]   = background_interval_.count();
  json["background_sweep_ms"]      = background_sweep_.count();
  json["monitor_interval_ms"]      = monitor_interval_.count();
  json["info_wait_step_ms"]        = info_wait_step_.count();
  json["info_wait_retries"]        = info_wait_retries_;
  json["max_source_bytes"]         = max_source_bytes_;
  json["thumbnail_size"]           = thumbnail_size_;
  json["row_height"]               = row_height_;
  json["folder_count_cap"]         = folder_count_cap_;
  json["image_cache_size"]         = image_cache_size_;
  json["verify_existence"]         = verify_existence_;
  json["cache_root"]               = cache_root_.string();
  json["sidecar_path"]             = sidecar_path_.string();

  std::vector<std::string> extensions(thumbnail_extensions_.begin(), thumbnail_extensions_.end());
  std::sort(extensions.begin(), extensions.end());
  json["thumbnail_extensions"] = extensions;
  return json;
}

void EnrichConfig::SaveToFile(const std::filesystem::path& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open config file {} for writing", path.string()));
  }
  file << ToJson().dump(4);
}
};  // namespace assetlens
