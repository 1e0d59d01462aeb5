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

#include "concurrency/progress_monitor.hpp"

#include <utility>

namespace assetlens {
ProgressMonitor::ProgressMonitor(std::chrono::milliseconds interval, QObject* parent)
    : QObject(parent), timer_(this) {
  timer_.setInterval(static_cast<int>(interval.count()));
  connect(&timer_, &QTimer::timeout, this, &ProgressMonitor::Poll);
}

void ProgressMonitor::Register(std::shared_ptr<const RecordQueue> queue) {
  if (!queue) {
    return;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  queues_.push_back(std::move(queue));
}

auto ProgressMonitor::PendingCount() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  size_t                      count = 0;
  for (const auto& queue : queues_) {
    count += queue->Size();
  }
  return count;
}

auto ProgressMonitor::Text() const -> QString {
  const size_t count = PendingCount();
  if (count == 0) {
    return {};
  }
  return QStringLiteral("Loading... (%1 left)").arg(count);
}

void ProgressMonitor::Start() { timer_.start(); }

void ProgressMonitor::Stop() { timer_.stop(); }

void ProgressMonitor::Poll() {
  QString text = Text();
  if (text == last_text_) {
    return;
  }
  last_text_ = text;
  emit TextChanged(last_text_);
}
};  // namespace assetlens
