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

#include "sidecar/sidecar_store.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "utils/log/log_category.hpp"

namespace assetlens {
JsonSidecarStore::JsonSidecarStore(std::filesystem::path path) : path_(std::move(path)) {}

void JsonSidecarStore::EnsureLoadedLocked() {
  if (loaded_) {
    return;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    // A missing sidecar file is an empty store
    document_ = nlohmann::json::object();
    loaded_   = true;
    return;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    throw SidecarReadError(std::format("Failed to open sidecar file {}", path_.string()));
  }

  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw SidecarReadError(
        std::format("Failed to parse sidecar file {}: {}", path_.string(), e.what()));
  }
  if (!document.is_object()) {
    throw SidecarReadError(std::format("Sidecar file {} is not a JSON object", path_.string()));
  }

  document_ = std::move(document);
  loaded_   = true;
}

auto JsonSidecarStore::Value(const content_key_t& key, const sidecar_field_t& field)
    -> std::optional<nlohmann::json> {
  std::lock_guard<std::mutex> lock(mtx_);
  EnsureLoadedLocked();

  auto item = document_.find(key);
  if (item == document_.end() || !item->is_object()) {
    return std::nullopt;
  }
  auto value = item->find(field);
  if (value == item->end() || value->is_null()) {
    return std::nullopt;
  }
  return *value;
}

void JsonSidecarStore::SetValue(const content_key_t& key, const sidecar_field_t& field,
                                nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mtx_);
  EnsureLoadedLocked();
  document_[key][field] = std::move(value);
}

void JsonSidecarStore::Reload() {
  std::lock_guard<std::mutex> lock(mtx_);
  loaded_ = false;
  document_.clear();
}

void JsonSidecarStore::Save() {
  std::lock_guard<std::mutex> lock(mtx_);
  EnsureLoadedLocked();

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  std::ofstream file(path_);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open sidecar file {} for writing", path_.string()));
  }
  file << document_.dump(4);
  qCDebug(lcSidecar) << "Saved sidecar store" << path_.c_str();
}
};  // namespace assetlens
