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

#include "workers/background_info_worker.hpp"

#include <exception>
#include <utility>

#include "utils/log/log_category.hpp"

namespace assetlens {
BackgroundInfoWorker::BackgroundInfoWorker(std::shared_ptr<SidecarStore> sidecar,
                                           const EnrichConfig& config, QObject* parent)
    : InfoWorker(std::move(sidecar), config, parent), sweep_interval_(config.background_sweep_) {}

void BackgroundInfoWorker::SetCollection(CollectionRef collection) {
  std::lock_guard<std::mutex> lock(collection_mtx_);
  collection_ = std::move(collection);
}

auto BackgroundInfoWorker::Collection() const -> CollectionRef {
  std::lock_guard<std::mutex> lock(collection_mtx_);
  return collection_;
}

void BackgroundInfoWorker::Begin() {
  qCDebug(lcInfo) << "Background sweep loop started";
  while (!IsShuttingDown()) {
    SleepFor(sweep_interval_);
    if (IsShuttingDown()) {
      break;
    }
    // A reset only cancels the pass that was running
    ClearInterrupt();
    Sweep();
  }
  qCDebug(lcInfo) << "Background sweep loop stopped";
}

auto BackgroundInfoWorker::Sweep() -> bool {
  CollectionRef collection_ref = Collection();
  auto          collection     = collection_ref.lock();
  if (!collection || collection->IsFullyLoaded()) {
    return false;
  }

  const uint64_t generation = collection->Generation();
  bool           changed    = false;
  for (const auto& ref : collection->Snapshot()) {
    if (interrupt_.load() || IsShuttingDown()) {
      return changed;
    }
    {
      auto record = ref.Lock();
      if (!record || record->info_loaded_.load()) {
        continue;
      }
    }
    try {
      if (ProcessFileInformation(ref).has_value()) {
        changed = true;
      }
    } catch (const std::exception& e) {
      qCWarning(lcInfo) << "Sweep skipped record" << ref.Id() << ":" << e.what();
    }
  }

  if (changed) {
    emit DatasetEnriched(collection_ref);
    return true;
  }
  // The listing was swapped out while we walked the old one
  if (collection->Generation() != generation) {
    return false;
  }
  collection->SetFullyLoaded(true);
  emit DatasetFullyLoaded(collection_ref);
  return false;
}
};  // namespace assetlens
