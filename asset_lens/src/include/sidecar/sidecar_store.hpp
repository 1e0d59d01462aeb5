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
#include <json.hpp>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "type/type.hpp"

namespace assetlens {
class SidecarReadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Per-item key/value metadata kept beside the browsed files (descriptions, notes,
 * flags). Implementations must be safe to call from any worker thread.
 */
class SidecarStore {
 public:
  virtual ~SidecarStore() = default;

  /**
   * @brief Read one field of one item
   *
   * @return the stored value, or std::nullopt when the item or field is absent
   * @throws SidecarReadError when the backing store cannot be read
   */
  virtual auto Value(const content_key_t& key, const sidecar_field_t& field)
      -> std::optional<nlohmann::json>                                              = 0;
  virtual void SetValue(const content_key_t& key, const sidecar_field_t& field,
                        nlohmann::json value)                                       = 0;
};

/**
 * @brief SidecarStore persisted as a single JSON document: { key: { field: value } }
 */
class JsonSidecarStore final : public SidecarStore {
 public:
  explicit JsonSidecarStore(std::filesystem::path path);

  auto Value(const content_key_t& key, const sidecar_field_t& field)
      -> std::optional<nlohmann::json> override;
  void SetValue(const content_key_t& key, const sidecar_field_t& field,
                nlohmann::json value) override;

  // Drop the in-memory copy so the next read goes back to disk
  void Reload();
  void Save();

 private:
  void                  EnsureLoadedLocked();

  std::filesystem::path path_;
  std::mutex            mtx_;
  nlohmann::json        document_;
  bool                  loaded_ = false;
};
};  // namespace assetlens
