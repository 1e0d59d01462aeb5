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

#include <chrono>
#include <memory>
#include <mutex>

#include "record/record_collection.hpp"
#include "workers/info_worker.hpp"

namespace assetlens {
/**
 * @brief Level-triggered variant of InfoWorker. Instead of draining a queue it periodically
 * sweeps the whole collection and loads whatever is still missing, until a pass finds nothing
 * left to do.
 */
class BackgroundInfoWorker : public InfoWorker {
  Q_OBJECT

 public:
  BackgroundInfoWorker(std::shared_ptr<SidecarStore> sidecar, const EnrichConfig& config,
                       QObject* parent = nullptr);

  void SetCollection(CollectionRef collection);
  auto Collection() const -> CollectionRef;

  /**
   * @brief One pass over the current collection
   *
   * @return true if at least one record was loaded during the pass
   */
  auto Sweep() -> bool;

 public slots:
  void Begin() override;

 signals:
  void DatasetEnriched(assetlens::CollectionRef collection);
  void DatasetFullyLoaded(assetlens::CollectionRef collection);

 private:
  mutable std::mutex        collection_mtx_;
  CollectionRef             collection_;
  std::chrono::milliseconds sweep_interval_;
};
};  // namespace assetlens
