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

#include <cstddef>
#include <memory>

#include "concurrency/progress_monitor.hpp"
#include "concurrency/worker_thread.hpp"
#include "config/enrich_config.hpp"
#include "record/record_collection.hpp"
#include "sidecar/sidecar_store.hpp"
#include "thumbnail/image_cache.hpp"
#include "thumbnail/thumbnail_generator.hpp"
#include "workers/background_info_worker.hpp"
#include "workers/folder_count_worker.hpp"
#include "workers/info_worker.hpp"
#include "workers/thumbnail_worker.hpp"

namespace assetlens {
/**
 * @brief Owns the enrichment threads of one listing: per-record info, the background sweep,
 * thumbnails and folder counts, plus the monitor that reports what is left.
 *
 * Everything here is called from the thread that created the service. Results come back as
 * queued signals on that thread.
 */
class EnrichmentService : public QObject {
  Q_OBJECT

 public:
  EnrichmentService(EnrichConfig config, std::shared_ptr<SidecarStore> sidecar,
                    std::shared_ptr<ThumbnailGenerator> generator, QObject* parent = nullptr);
  explicit EnrichmentService(EnrichConfig config, QObject* parent = nullptr);
  ~EnrichmentService() override;

  /**
   * @brief Start the worker threads and the monitor. Shutdown is final for a service, so a
   * call after it is refused.
   *
   * @return true if the service is running after the call
   */
  auto Start() -> bool;
  void Shutdown();
  auto IsRunning() const -> bool { return running_; }

  /**
   * @brief Point the service at a new listing. Pending work for the previous one is dropped.
   */
  void SetCollection(const std::shared_ptr<RecordCollection>& collection);

  auto RequestInfo(const RecordRef& ref, bool force = false) -> bool;
  auto RequestThumbnail(const RecordRef& ref, bool force = false) -> bool;
  auto RequestFolderCount(const RecordRef& ref, bool force = false) -> bool;

  void ResetQueues();

  auto PendingCount() const -> size_t { return monitor_.PendingCount(); }
  auto StatusText() const -> QString { return monitor_.Text(); }

  auto Config() const -> const EnrichConfig& { return config_; }
  auto Sidecar() const -> const std::shared_ptr<SidecarStore>& { return sidecar_; }
  auto Images() const -> const std::shared_ptr<ImageCache>& { return image_cache_; }
  auto Monitor() -> ProgressMonitor& { return monitor_; }

 signals:
  void ItemReady(assetlens::RecordRef ref);
  void ThumbnailReady(assetlens::RecordRef ref);
  void FolderCountReady(assetlens::RecordRef ref);
  void DatasetEnriched(assetlens::CollectionRef collection);
  void DatasetSorted(assetlens::CollectionRef collection);
  void StatusTextChanged(const QString& text);

 private slots:
  void OnDatasetFullyLoaded(assetlens::CollectionRef collection);

 private:
  void                                Wire();

  EnrichConfig                        config_;
  std::shared_ptr<SidecarStore>       sidecar_;
  std::shared_ptr<ThumbnailGenerator> generator_;
  std::shared_ptr<ImageCache>         image_cache_;

  InfoWorker*                         info_worker_       = nullptr;
  BackgroundInfoWorker*               background_worker_ = nullptr;
  ThumbnailWorker*                    thumbnail_worker_  = nullptr;
  FolderCountWorker*                  folder_worker_     = nullptr;

  std::unique_ptr<WorkerThread>       info_thread_;
  std::unique_ptr<WorkerThread>       background_thread_;
  std::unique_ptr<WorkerThread>       thumbnail_thread_;
  std::unique_ptr<WorkerThread>       folder_thread_;

  ProgressMonitor                     monitor_;
  bool                                running_ = false;
  bool                                stopped_ = false;
};
};  // namespace assetlens
