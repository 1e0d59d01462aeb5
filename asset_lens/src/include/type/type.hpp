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

#include <cstdint>
#include <filesystem>
#include <string>

namespace assetlens {

#define record_path_t   std::filesystem::path
#define record_id_t     uint64_t

// Key addressing a record inside the sidecar store and the thumbnail cache
#define content_key_t   std::string

// Sidecar field names
#define sidecar_field_t std::string

// Used by the folder-count worker and the progress monitor
#define item_count_t    uint32_t
};  // namespace assetlens
