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

#include "concurrency/worker.hpp"

#include <exception>
#include <mutex>

#include "utils/log/log_category.hpp"

namespace assetlens {
Worker::Worker(QObject* parent) : QObject(parent), queue_(std::make_shared<RecordQueue>()) {}

void Worker::RequestReset() {
  {
    std::lock_guard<std::mutex> lock(sleep_mtx_);
    interrupt_.store(true);
  }
  queue_->Clear();
  sleep_cv_.notify_all();
}

void Worker::RequestShutdown() {
  {
    std::lock_guard<std::mutex> lock(sleep_mtx_);
    shutdown_requested_.store(true);
  }
  sleep_cv_.notify_all();
}

void Worker::Activate() {
  auto item = queue_->Get();
  if (!item.has_value()) {
    interrupt_.store(false);
    return;
  }

  try {
    auto result = Step(*item);
    if (result.has_value()) {
      emit ItemReady(*result);
      queue_->TaskDone();
    }
  } catch (const std::exception& e) {
    qCWarning(lcWorker) << metaObject()->className() << "dropped record" << item->Id() << ":"
                        << e.what();
  } catch (...) {
    qCWarning(lcWorker) << metaObject()->className() << "dropped record" << item->Id()
                        << ": unknown exception";
  }
  interrupt_.store(false);
}

auto Worker::SleepFor(std::chrono::milliseconds duration) -> bool {
  std::unique_lock<std::mutex> lock(sleep_mtx_);
  const bool                   woken = sleep_cv_.wait_for(lock, duration, [this] {
    return shutdown_requested_.load() || interrupt_.load();
  });
  return !woken;
}
};  // namespace assetlens
