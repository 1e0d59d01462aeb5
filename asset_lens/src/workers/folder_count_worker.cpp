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

#include "workers/folder_count_worker.hpp"

#include <algorithm>
#include <memory>
#include <system_error>
#include <vector>

namespace assetlens {
namespace {
auto IsHidden(const std::filesystem::path& path) -> bool {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}
}  // namespace

FolderCountWorker::FolderCountWorker(const EnrichConfig& config, QObject* parent)
    : Worker(parent), cap_(config.folder_count_cap_) {}

auto FolderCountWorker::CountEntries(const std::filesystem::path& root, const Record& parent,
                                     const Record& child) -> std::optional<item_count_t> {
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return item_count_t{0};
  }

  item_count_t                                        count = 0;
  const std::filesystem::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (interrupt_.load() || parent.IsDiscarded() || child.IsDiscarded()) {
      return std::nullopt;
    }
    if (IsHidden(it->path())) {
      it.disable_recursion_pending();
      continue;
    }
    ++count;
    if (count > cap_) {
      break;
    }
  }
  return std::min(count, cap_);
}

auto FolderCountWorker::Step(const RecordRef& ref) -> std::optional<RecordRef> {
  auto parent = ref.Lock();
  if (!parent || interrupt_.load()) {
    return std::nullopt;
  }

  std::vector<std::shared_ptr<Record>> children;
  {
    std::lock_guard<std::mutex> lock(parent->mutex_);
    children = parent->children_;
  }

  for (const auto& child : children) {
    if (interrupt_.load() || parent->IsDiscarded()) {
      return std::nullopt;
    }
    if (!child || child->IsDiscarded()) {
      continue;
    }

    std::filesystem::path root;
    {
      std::lock_guard<std::mutex> lock(child->mutex_);
      root = child->path_;
    }
    auto count = CountEntries(root, *parent, *child);
    if (!count.has_value()) {
      return std::nullopt;
    }
    {
      std::lock_guard<std::mutex> lock(child->mutex_);
      child->item_count_ = *count;
    }
    emit ItemReady(RecordRef(child));
  }
  return std::nullopt;
}
};  // namespace assetlens
