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

#include <QObject>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "record/record.hpp"
#include "utils/queue/work_queue.hpp"

namespace assetlens {
using RecordQueue = WorkQueue<RecordRef>;

/**
 * @brief A unit of background work bound to one queue. Each Activate() takes at most one
 * RecordRef off the queue and hands it to Step().
 *
 * A Worker lives on the thread of its WorkerThread. Only the interrupt/shutdown flags and the
 * queue may be touched from other threads.
 */
class Worker : public QObject {
  Q_OBJECT

 public:
  explicit Worker(QObject* parent = nullptr);
  ~Worker() override = default;

  auto QueueHandle() const -> std::shared_ptr<const RecordQueue> { return queue_; }
  auto Queue() const -> const std::shared_ptr<RecordQueue>& { return queue_; }

  /**
   * @brief Ask the in-flight Step() to give up at its next checkpoint and drop every waiting
   * item. The flag is cleared again once the current activation finishes.
   */
  void         RequestReset();
  void         ClearInterrupt() { interrupt_.store(false); }
  auto         IsInterrupted() const -> bool { return interrupt_.load(); }

  virtual void RequestShutdown();
  auto         IsShuttingDown() const -> bool { return shutdown_requested_.load(); }

 public slots:
  void         Activate();
  // Run once when the owning thread's event loop starts
  virtual void Begin() {}

 signals:
  void ItemReady(assetlens::RecordRef ref);

 protected:
  /**
   * @brief Process one dequeued item
   *
   * @return the reference to report as ready, or std::nullopt when there is nothing to report
   * (stale reference, interrupted, already done)
   */
  virtual auto Step(const RecordRef& ref) -> std::optional<RecordRef> = 0;

  /**
   * @brief Sleep that wakes early on reset or shutdown
   *
   * @return false if it was cut short
   */
  auto         SleepFor(std::chrono::milliseconds duration) -> bool;

  std::atomic<bool> interrupt_          = false;
  std::atomic<bool> shutdown_requested_ = false;

 private:
  std::shared_ptr<RecordQueue> queue_;
  std::mutex                   sleep_mtx_;
  std::condition_variable      sleep_cv_;
};
};  // namespace assetlens
