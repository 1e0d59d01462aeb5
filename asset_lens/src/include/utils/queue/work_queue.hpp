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

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace assetlens {
/**
 * @brief A thread-safe, non-blocking queue of pending work used by the enrichment workers.
 *
 * Normal submissions enter at the front and are taken from the back, so they are serviced in
 * FIFO order. Forced submissions are pushed straight onto the back: they are taken before every
 * normal item already waiting, and in reverse order among themselves.
 */
template <typename T>
class WorkQueue {
 public:
  WorkQueue() = default;

  /**
   * @brief Enqueue an item. Without force, the caller is responsible for not submitting an
   * item that is already queued.
   *
   * @param item the item to enqueue
   * @param force place the item ahead of every waiting normal item
   */
  void Put(T item, bool force = false) {
    std::lock_guard<std::mutex> lock(mtx_);
    PutLocked(std::move(item), force);
  }

  /**
   * @brief Enqueue a normal item unless an equal one is already waiting
   *
   * @return true if the item was enqueued
   */
  auto PutIfAbsent(T item) -> bool {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(queue_.begin(), queue_.end(), item) != queue_.end()) {
      return false;
    }
    PutLocked(std::move(item), false);
    return true;
  }

  /**
   * @brief Non-blocking pop
   *
   * @return the next item, or std::nullopt when the queue is empty
   */
  auto Get() -> std::optional<T> {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.back());
    queue_.pop_back();
    return item;
  }

  auto Contains(const T& item) const -> bool {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::find(queue_.begin(), queue_.end(), item) != queue_.end();
  }

  auto Size() const -> size_t {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  auto Empty() const -> bool { return Size() == 0; }

  /**
   * @brief Drop every waiting item. Items already taken by Get() are not affected.
   */
  void Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
  }

  void TaskDone() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (unfinished_ > 0) {
      --unfinished_;
    }
  }

  /**
   * @brief Diagnostics only: submissions never reported done through TaskDone(). Items dropped
   * by Clear() and steps that produced no result stay counted, so this only grows over a
   * session. Use Size() for the pending depth.
   */
  auto Unfinished() const -> size_t {
    std::lock_guard<std::mutex> lock(mtx_);
    return unfinished_;
  }

 private:
  void PutLocked(T item, bool force) {
    if (force) {
      queue_.push_back(std::move(item));
    } else {
      queue_.push_front(std::move(item));
    }
    ++unfinished_;
  }

  std::deque<T>      queue_;
  size_t             unfinished_ = 0;
  mutable std::mutex mtx_;
};
};  // namespace assetlens
