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

#include "record/sequence.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace assetlens {
namespace {
const std::regex& SequenceRegex() {
  static const std::regex re(R"(^(.+?)([0-9]+)([^0-9\\/]*)\.([^\.]+)$)", std::regex::ECMAScript);
  return re;
}

const std::regex& CollapsedRegex() {
  static const std::regex re(R"(\[[0-9\-,]+\])", std::regex::ECMAScript);
  return re;
}
}  // namespace

auto SequencePattern::Expand(const std::string& frame_token) const -> std::string {
  return prefix_ + frame_token + suffix_ + "." + extension_;
}

auto SequencePattern::Key() const -> std::string { return Expand("[0]"); }

auto ParseSequence(const std::string& path) -> std::optional<SequencePattern> {
  std::smatch match;
  if (!std::regex_match(path, match, SequenceRegex())) {
    return std::nullopt;
  }
  SequencePattern pattern;
  pattern.prefix_    = match[1].str();
  pattern.frame_     = match[2].str();
  pattern.suffix_    = match[3].str();
  pattern.extension_ = match[4].str();
  return pattern;
}

auto IsCollapsedSequence(const std::string& path) -> bool {
  return std::regex_search(path, CollapsedRegex());
}

auto PadFrame(int frame, size_t padding) -> std::string {
  std::string digits = std::to_string(frame);
  if (digits.size() >= padding) {
    return digits;
  }
  return std::string(padding - digits.size(), '0') + digits;
}

auto FrameRangeString(std::vector<int> frames, size_t padding) -> std::string {
  std::sort(frames.begin(), frames.end());
  frames.erase(std::unique(frames.begin(), frames.end()), frames.end());

  std::string result;
  size_t      block_start = 0;
  for (size_t i = 0; i < frames.size(); ++i) {
    const bool block_ends = (i + 1 == frames.size()) || (frames[i + 1] != frames[i] + 1);
    if (!block_ends) {
      continue;
    }
    if (!result.empty()) {
      result += ",";
    }
    result += PadFrame(frames[block_start], padding);
    if (i != block_start) {
      result += "-" + PadFrame(frames[i], padding);
    }
    block_start = i + 1;
  }
  return result;
}
};  // namespace assetlens
