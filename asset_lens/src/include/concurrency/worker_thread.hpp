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

#include <QThread>

#include <chrono>
#include <memory>

#include "concurrency/worker.hpp"

namespace assetlens {
/**
 * @brief Owns one OS thread and the Worker that runs on it. A coarse periodic timer created
 * inside the thread calls Worker::Activate() on every tick.
 */
class WorkerThread : public QThread {
  Q_OBJECT

 public:
  WorkerThread(std::unique_ptr<Worker> worker, std::chrono::milliseconds interval,
               QObject* parent = nullptr);
  ~WorkerThread() override;

  WorkerThread(const WorkerThread&)            = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;

  /**
   * @brief Submit a record to the worker's queue. A normal submission is dropped when the same
   * record is already waiting; a forced one always goes in, ahead of normal items.
   *
   * @return true if the reference was enqueued
   * @throws std::invalid_argument for an empty reference
   */
  auto Put(const RecordRef& ref, bool force = false) -> bool;

  /**
   * @brief Start the thread and its timer. A controller runs once: the worker's shutdown flag
   * stays set and the worker is handed back to the owning thread when the loop ends.
   *
   * @throws std::logic_error when called after Shutdown()
   */
  void Start();

  // Stop the timer, leave the event loop and join. Safe to call more than once.
  void Shutdown();
  auto IsShutDown() const -> bool { return shut_down_; }

  auto GetWorker() const -> Worker* { return worker_.get(); }
  auto Interval() const -> std::chrono::milliseconds { return interval_; }

 signals:
  void StopTimer();

 protected:
  void run() override;

 private:
  std::unique_ptr<Worker>   worker_;
  std::chrono::milliseconds interval_;
  bool                      shut_down_ = false;
};
};  // namespace assetlens
