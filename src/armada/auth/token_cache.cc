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

#include "armada/auth/token_cache.h"

#include <utility>

namespace armada {

std::optional<TokenCacheEntry> TokenCache::Get(const std::string &token) {
  absl::MutexLock lock(&mutex_);
  auto it = entries_.find(token);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at_ms <= clock_()) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.entry;
}

void TokenCache::Put(const std::string &token, TokenCacheEntry entry, int64_t ttl_ms) {
  if (ttl_ms <= 0) {
    return;
  }
  absl::MutexLock lock(&mutex_);
  Slot &slot = entries_[token];
  slot.entry = std::move(entry);
  slot.expires_at_ms = clock_() + ttl_ms;
}

void TokenCache::PutValid(const std::string &token, std::string name, int64_t ttl_ms) {
  Put(token, TokenCacheEntry{TokenCacheEntry::Kind::kValid, std::move(name)}, ttl_ms);
}

void TokenCache::PutInvalid(const std::string &token, int64_t ttl_ms) {
  Put(token, TokenCacheEntry{TokenCacheEntry::Kind::kInvalid, ""}, ttl_ms);
}

bool TokenCache::Evict(const std::string &token) {
  absl::MutexLock lock(&mutex_);
  return entries_.erase(token) > 0;
}

size_t TokenCache::Sweep() {
  absl::MutexLock lock(&mutex_);
  const int64_t now = clock_();
  size_t num_removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at_ms <= now) {
      entries_.erase(it++);
      ++num_removed;
    } else {
      ++it;
    }
  }
  return num_removed;
}

size_t TokenCache::size() const {
  absl::MutexLock lock(&mutex_);
  return entries_.size();
}

}  // namespace armada
