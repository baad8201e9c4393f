// Copyright 2024 The Armada Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// SharedLruCache is a LRU cache whose values are shared pointers, so a Get never
// copies the value and the value stays valid after eviction for as long as the
// caller holds it.
//
// ThreadSafeSharedLruCache adds a mutex and `GetOrCreate`, which runs a fallible
// factory on a miss. Concurrent misses on one key wait for the first caller's
// factory instead of running their own.
//
// Example usage:
// ThreadSafeSharedLruCache<std::string, int64_t> cache(/*max_entries=*/100);
// auto val = cache.GetOrCreate("key", [](const std::string &key)
//     -> StatusOr<std::shared_ptr<int64_t>> { return std::make_shared<int64_t>(1); });

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status_or.h"
#include "armada/util/logging.h"

namespace armada {

template <typename Key, typename Val>
class SharedLruCache final {
 public:
  using key_type = Key;
  using mapped_type = Val;

  // A `max_entries` of 0 means that there is no limit on the number of entries
  // in the cache.
  explicit SharedLruCache(size_t max_entries) : max_entries_(max_entries) {}

  SharedLruCache(const SharedLruCache &) = delete;
  SharedLruCache &operator=(const SharedLruCache &) = delete;

  // Insert `value` with key `key`, replacing any previous entry with the same key.
  // Evicts the least recently used entry when the cache is full.
  void Put(const Key &key, std::shared_ptr<Val> value) {
    ARMADA_CHECK(value != nullptr);
    auto iter = cache_.find(key);
    if (iter != cache_.end()) {
      lru_list_.splice(lru_list_.begin(), lru_list_, iter->second);
      iter->second->second = std::move(value);
      return;
    }

    lru_list_.emplace_front(key, std::move(value));
    cache_.emplace(key, lru_list_.begin());

    if (max_entries_ > 0 && lru_list_.size() > max_entries_) {
      cache_.erase(lru_list_.back().first);
      lru_list_.pop_back();
    }
    ARMADA_CHECK_EQ(lru_list_.size(), cache_.size());
  }

  // Return true if an entry was removed.
  bool Delete(const Key &key) {
    auto it = cache_.find(key);
    if (it == cache_.end()) {
      return false;
    }
    lru_list_.erase(it->second);
    cache_.erase(it);
    return true;
  }

  // Look up the entry with key `key` and mark it most recently used.
  // Return nullptr if the key doesn't exist.
  std::shared_ptr<Val> Get(const Key &key) {
    const auto cache_iter = cache_.find(key);
    if (cache_iter == cache_.end()) {
      return nullptr;
    }
    lru_list_.splice(lru_list_.begin(), lru_list_, cache_iter->second);
    return cache_iter->second->second;
  }

  void Clear() {
    cache_.clear();
    lru_list_.clear();
  }

  size_t size() const { return lru_list_.size(); }
  size_t max_entries() const { return max_entries_; }

 private:
  using EntryList = std::list<std::pair<Key, std::shared_ptr<Val>>>;

  // The maximum number of entries in the cache. A value of 0 means there is no
  // limit on entry count.
  const size_t max_entries_;

  // Key to position in the LRU list.
  absl::flat_hash_map<Key, typename EntryList::iterator> cache_;

  // The front of the list is the most recently accessed entry.
  EntryList lru_list_;
};

template <typename Key, typename Val>
class ThreadSafeSharedLruCache final {
 public:
  using key_type = Key;
  using mapped_type = Val;
  using Factory = std::function<StatusOr<std::shared_ptr<Val>>(const Key &)>;

  explicit ThreadSafeSharedLruCache(size_t max_entries) : cache_(max_entries) {}

  ThreadSafeSharedLruCache(const ThreadSafeSharedLruCache &) = delete;
  ThreadSafeSharedLruCache &operator=(const ThreadSafeSharedLruCache &) = delete;

  void Put(const Key &key, std::shared_ptr<Val> value) {
    std::lock_guard lck(mu_);
    cache_.Put(key, std::move(value));
  }

  bool Delete(const Key &key) {
    std::lock_guard lck(mu_);
    return cache_.Delete(key);
  }

  std::shared_ptr<Val> Get(const Key &key) {
    std::lock_guard lck(mu_);
    return cache_.Get(key);
  }

  // Get the cached value or run `factory` to create it. Only one factory runs per
  // key at a time; other callers missing on the same key block until it finishes
  // and receive its result, error included. Errors are not cached.
  StatusOr<std::shared_ptr<Val>> GetOrCreate(const Key &key, const Factory &factory) {
    std::shared_ptr<CreationToken> creation_token;

    {
      std::unique_lock lck(mu_);
      auto cached_val = cache_.Get(key);
      if (cached_val != nullptr) {
        return cached_val;
      }

      auto creation_iter = ongoing_creation_.find(key);
      // Another thread is already creating this key, wait for its result.
      if (creation_iter != ongoing_creation_.end()) {
        creation_token = creation_iter->second;
        creation_token->cv.wait(lck, [token = creation_token.get()]() { return token->done; });
        if (!creation_token->status.ok()) {
          return creation_token->status;
        }
        return creation_token->val;
      }

      creation_token = std::make_shared<CreationToken>();
      ongoing_creation_.emplace(key, creation_token);
    }

    // Place factory out of critical section.
    auto result = factory(key);

    std::lock_guard lck(mu_);
    if (result.ok()) {
      cache_.Put(key, *result);
      creation_token->val = *result;
    } else {
      creation_token->status = result.status();
    }
    creation_token->done = true;
    ongoing_creation_.erase(key);
    creation_token->cv.notify_all();
    return result;
  }

  void Clear() {
    std::lock_guard lck(mu_);
    cache_.Clear();
  }

  size_t size() {
    std::lock_guard lck(mu_);
    return cache_.size();
  }

  size_t max_entries() const { return cache_.max_entries(); }

 private:
  struct CreationToken {
    std::condition_variable cv;
    bool done = false;
    Status status;
    std::shared_ptr<Val> val;
  };

  std::mutex mu_;
  SharedLruCache<Key, Val> cache_;

  // Keys whose factory is running.
  absl::flat_hash_map<Key, std::shared_ptr<CreationToken>> ongoing_creation_;
};

}  // namespace armada
