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
#include <QString>
#include <QTimer>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "concurrency/worker.hpp"

namespace assetlens {
/**
 * @brief Polls the depth of every registered queue and publishes a status line. It only ever
 * reads the queues.
 */
class ProgressMonitor : public QObject {
  Q_OBJECT

 public:
  explicit ProgressMonitor(std::chrono::milliseconds interval = std::chrono::milliseconds(200),
                           QObject*                  parent   = nullptr);

  void Register(std::shared_ptr<const RecordQueue> queue);
  auto PendingCount() const -> size_t;
  // "Loading... (N left)", or an empty string when every queue is drained
  auto Text() const -> QString;

  void Start();
  void Stop();

 public slots:
  void Poll();

 signals:
  void TextChanged(const QString& text);

 private:
  mutable std::mutex                              mtx_;
  std::vector<std::shared_ptr<const RecordQueue>> queues_;
  QTimer                                          timer_;
  QString                                         last_text_;
};
};  // namespace assetlens
