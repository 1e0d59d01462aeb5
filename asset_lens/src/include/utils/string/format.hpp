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

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>

namespace assetlens::format {
/**
 * @brief Human readable byte count, e.g. 1536 -> "1.5KB"
 */
auto ByteToString(uint64_t bytes) -> std::string;

// "dd/MM/yyyy hh:mm" in local time
auto TimestampToString(std::time_t time) -> std::string;

auto FileDetails(std::time_t last_modified, uint64_t size) -> std::string;

auto SequenceDetails(size_t frame_count, std::time_t last_modified, uint64_t size) -> std::string;
};  // namespace assetlens::format
