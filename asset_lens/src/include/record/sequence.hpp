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
#include <optional>
#include <string>
#include <vector>

namespace assetlens {
/**
 * @brief The four parts of a frame-numbered file name, e.g.
 * "/shots/sh010_beauty_" + "0042" + "_v1" + "exr"
 *
 */
struct SequencePattern {
  std::string prefix_;
  std::string frame_;
  std::string suffix_;
  std::string extension_;

  auto        Expand(const std::string& frame_token) const -> std::string;
  auto        Key() const -> std::string;

  bool        operator==(const SequencePattern& other) const = default;
};

auto ParseSequence(const std::string& path) -> std::optional<SequencePattern>;

auto IsCollapsedSequence(const std::string& path) -> bool;

auto PadFrame(int frame, size_t padding) -> std::string;

/**
 * @brief Collapse a list of frame numbers into a range string, e.g. {1,2,3,5} with padding 4
 * gives "0001-0003,0005". Duplicates are ignored and the input does not need to be sorted.
 */
auto FrameRangeString(std::vector<int> frames, size_t padding) -> std::string;
};  // namespace assetlens
