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

#include "concurrency/worker_thread.hpp"

#include <QMetaObject>
#include <QTimer>

#include <format>
#include <stdexcept>
#include <utility>

#include "record/record_collection.hpp"
#include "utils/log/log_category.hpp"

namespace assetlens {
WorkerThread::WorkerThread(std::unique_ptr<Worker> worker, std::chrono::milliseconds interval,
                           QObject* parent)
    : QThread(parent), worker_(std::move(worker)), interval_(interval) {
  if (!worker_) {
    throw std::invalid_argument("WorkerThread: worker must not be null");
  }
  qRegisterMetaType<assetlens::RecordRef>("assetlens::RecordRef");
  qRegisterMetaType<assetlens::CollectionRef>("assetlens::CollectionRef");
  worker_->moveToThread(this);
}

WorkerThread::~WorkerThread() { Shutdown(); }

void WorkerThread::run() {
  QTimer timer;
  timer.setTimerType(Qt::CoarseTimer);
  timer.setInterval(static_cast<int>(interval_.count()));
  connect(&timer, &QTimer::timeout, worker_.get(), &Worker::Activate, Qt::DirectConnection);
  connect(this, &WorkerThread::StopTimer, &timer, &QTimer::stop, Qt::QueuedConnection);

  QMetaObject::invokeMethod(worker_.get(), &Worker::Begin, Qt::QueuedConnection);
  timer.start();
  qCDebug(lcWorker) << worker_->metaObject()->className() << "started, interval"
                    << interval_.count() << "ms";

  exec();

  timer.stop();
  // Hand the worker back so it is destroyed on the thread that owns this controller
  worker_->moveToThread(thread());
  qCDebug(lcWorker) << worker_->metaObject()->className() << "stopped";
}

auto WorkerThread::Put(const RecordRef& ref, bool force) -> bool {
  if (!ref.IsValid()) {
    throw std::invalid_argument(
        std::format("[ERROR] WorkerThread: {} expects a record reference",
                    worker_->metaObject()->className()));
  }
  worker_->ClearInterrupt();
  if (force) {
    worker_->Queue()->Put(ref, true);
    return true;
  }
  return worker_->Queue()->PutIfAbsent(ref);
}

void WorkerThread::Start() {
  if (shut_down_) {
    throw std::logic_error(std::format("[ERROR] WorkerThread: {} cannot restart after shutdown",
                                       worker_->metaObject()->className()));
  }
  start();
}

void WorkerThread::Shutdown() {
  if (!worker_) {
    return;
  }
  shut_down_ = true;
  emit StopTimer();
  worker_->RequestShutdown();
  quit();
  wait();
}
};  // namespace assetlens
