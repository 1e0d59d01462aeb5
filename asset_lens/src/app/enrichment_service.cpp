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

#include "app/enrichment_service.hpp"

#include <QCoreApplication>

#include <utility>

#include "utils/log/log_category.hpp"

namespace assetlens {
EnrichmentService::EnrichmentService(EnrichConfig config, std::shared_ptr<SidecarStore> sidecar,
                                     std::shared_ptr<ThumbnailGenerator> generator,
                                     QObject*                            parent)
    : QObject(parent),
      config_(std::move(config)),
      sidecar_(std::move(sidecar)),
      generator_(std::move(generator)),
      image_cache_(std::make_shared<ImageCache>(config_.image_cache_size_)),
      monitor_(config_.monitor_interval_) {
  auto info        = std::make_unique<InfoWorker>(sidecar_, config_);
  auto background  = std::make_unique<BackgroundInfoWorker>(sidecar_, config_);
  auto thumbnail   = std::make_unique<ThumbnailWorker>(generator_, image_cache_, config_);
  auto folder      = std::make_unique<FolderCountWorker>(config_);

  info_worker_       = info.get();
  background_worker_ = background.get();
  thumbnail_worker_  = thumbnail.get();
  folder_worker_     = folder.get();

  info_thread_       = std::make_unique<WorkerThread>(std::move(info), config_.info_interval_);
  background_thread_ =
      std::make_unique<WorkerThread>(std::move(background), config_.background_interval_);
  thumbnail_thread_ =
      std::make_unique<WorkerThread>(std::move(thumbnail), config_.thumbnail_interval_);
  folder_thread_ =
      std::make_unique<WorkerThread>(std::move(folder), config_.folder_count_interval_);

  Wire();
}

EnrichmentService::EnrichmentService(EnrichConfig config, QObject* parent)
    : EnrichmentService(config, std::make_shared<JsonSidecarStore>(config.sidecar_path_),
                        std::make_shared<OpenCvThumbnailGenerator>(), parent) {}

EnrichmentService::~EnrichmentService() { Shutdown(); }

void EnrichmentService::Wire() {
  connect(info_worker_, &Worker::ItemReady, this, &EnrichmentService::ItemReady,
          Qt::QueuedConnection);
  connect(thumbnail_worker_, &Worker::ItemReady, this, &EnrichmentService::ThumbnailReady,
          Qt::QueuedConnection);
  connect(folder_worker_, &Worker::ItemReady, this, &EnrichmentService::FolderCountReady,
          Qt::QueuedConnection);
  connect(background_worker_, &BackgroundInfoWorker::DatasetEnriched, this,
          &EnrichmentService::DatasetEnriched, Qt::QueuedConnection);
  connect(background_worker_, &BackgroundInfoWorker::DatasetFullyLoaded, this,
          &EnrichmentService::OnDatasetFullyLoaded, Qt::QueuedConnection);

  monitor_.Register(info_worker_->QueueHandle());
  monitor_.Register(thumbnail_worker_->QueueHandle());
  monitor_.Register(folder_worker_->QueueHandle());
  connect(&monitor_, &ProgressMonitor::TextChanged, this, &EnrichmentService::StatusTextChanged);

  if (auto* app = QCoreApplication::instance()) {
    connect(app, &QCoreApplication::aboutToQuit, this, &EnrichmentService::Shutdown);
  }
}

auto EnrichmentService::Start() -> bool {
  if (running_) {
    return true;
  }
  if (stopped_) {
    qCWarning(lcService) << "Enrichment service was shut down and cannot be restarted";
    return false;
  }
  info_thread_->Start();
  background_thread_->Start();
  thumbnail_thread_->Start();
  folder_thread_->Start();
  monitor_.Start();
  running_ = true;
  qCDebug(lcService) << "Enrichment threads started";
  return true;
}

void EnrichmentService::Shutdown() {
  if (!running_) {
    return;
  }
  running_ = false;
  stopped_ = true;
  monitor_.Stop();
  info_thread_->Shutdown();
  background_thread_->Shutdown();
  thumbnail_thread_->Shutdown();
  folder_thread_->Shutdown();
  qCDebug(lcService) << "Enrichment threads stopped";
}

void EnrichmentService::SetCollection(const std::shared_ptr<RecordCollection>& collection) {
  ResetQueues();
  background_worker_->SetCollection(collection);
}

auto EnrichmentService::RequestInfo(const RecordRef& ref, bool force) -> bool {
  return info_thread_->Put(ref, force);
}

auto EnrichmentService::RequestThumbnail(const RecordRef& ref, bool force) -> bool {
  return thumbnail_thread_->Put(ref, force);
}

auto EnrichmentService::RequestFolderCount(const RecordRef& ref, bool force) -> bool {
  return folder_thread_->Put(ref, force);
}

void EnrichmentService::ResetQueues() {
  info_worker_->RequestReset();
  background_worker_->RequestReset();
  thumbnail_worker_->RequestReset();
  folder_worker_->RequestReset();
}

void EnrichmentService::OnDatasetFullyLoaded(assetlens::CollectionRef collection) {
  auto owned = collection.lock();
  if (!owned) {
    return;
  }
  owned->Sort(SortRole::NAME);
  emit DatasetSorted(collection);
}
};  // namespace assetlens
