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

#include <concepts>
#include <cstdint>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace assetlens {
template <typename K>
concept Hashable = std::copy_constructible<K> && std::equality_comparable<K> && requires(K key) {
  { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Least-recently-used map. Not synchronised, callers hold their own lock.
 */
template <Hashable K, typename V>
class LRUCache {
  using ListIterator = typename std::list<std::pair<K, V>>::iterator;

 public:
  static constexpr uint32_t default_capacity_ = 256;

  explicit LRUCache() : capacity_(default_capacity_) {}
  explicit LRUCache(uint32_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  auto Contains(const K& key) const -> bool { return cache_map_.contains(key); }

  auto AccessElement(const K& key) -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->second;
  }

  /**
   * @brief Insert or refresh an entry, evicting the least recently used one when full
   *
   * @return the key that was evicted, if any
   */
  auto RecordAccess(const K& key, V val) -> std::optional<K> {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      it->second->second = std::move(val);
      cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
      return std::nullopt;
    }

    std::optional<K> evicted;
    if (cache_list_.size() >= capacity_) {
      evicted = Evict();
    }
    cache_list_.emplace_front(key, std::move(val));
    cache_map_[key] = cache_list_.begin();
    return evicted;
  }

  void RemoveRecord(const K& key) {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      cache_list_.erase(it->second);
      cache_map_.erase(it);
    }
  }

  auto Evict() -> std::optional<K> {
    if (cache_list_.empty()) {
      return std::nullopt;
    }
    auto last = std::prev(cache_list_.end());
    K    evicted_key = last->first;
    cache_map_.erase(last->first);
    cache_list_.pop_back();
    return evicted_key;
  }

  auto Size() const -> size_t { return cache_list_.size(); }

  void Flush() {
    cache_map_.clear();
    cache_list_.clear();
  }

 private:
  std::unordered_map<K, ListIterator> cache_map_;
  std::list<std::pair<K, V>>          cache_list_;
  uint32_t                            capacity_;
};
};  // namespace assetlens
