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

#include "utils/string/format.hpp"

#include <QDateTime>
#include <QString>

#include <array>
#include <cmath>
#include <format>
#include <string>

namespace assetlens::format {
auto ByteToString(uint64_t bytes) -> std::string {
  static constexpr std::array<const char*, 8> units = {"", "K", "M", "G", "T", "P", "E", "Z"};

  double                                      num   = static_cast<double>(bytes);
  for (const char* unit : units) {
    if (std::abs(num) < 1024.0) {
      return std::format("{:.1f}{}B", num, unit);
    }
    num /= 1024.0;
  }
  return std::format("{:.1f}YiB", num);
}

auto TimestampToString(std::time_t time) -> std::string {
  const QDateTime stamp = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(time));
  return stamp.toString(QStringLiteral("dd/MM/yyyy hh:mm")).toStdString();
}

auto FileDetails(std::time_t last_modified, uint64_t size) -> std::string {
  return TimestampToString(last_modified) + ";" + ByteToString(size);
}

auto SequenceDetails(size_t frame_count, std::time_t last_modified, uint64_t size) -> std::string {
  return std::format("{}f;{}", frame_count, FileDetails(last_modified, size));
}
};  // namespace assetlens::format
