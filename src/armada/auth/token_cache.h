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

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/util/macros.h"
#include "armada/util/time.h"

namespace armada {

/// What is known about a token.
struct TokenCacheEntry {
  enum class Kind {
    /// The token was reviewed and accepted for `name`.
    kValid,
    /// The token was rejected.
    kInvalid,
  };

  Kind kind = Kind::kInvalid;
  std::string name;
};

/// \class TokenCache
///
/// Concurrent token -> entry store where each entry carries its own expiry.
/// Valid and invalid entries are put with independent TTLs. Expired entries are
/// never returned; `Get` drops the one it finds and `Sweep` drops all of them.
class TokenCache {
 public:
  explicit TokenCache(ClockFn clock = current_sys_time_ms) : clock_(std::move(clock)) {}

  std::optional<TokenCacheEntry> Get(const std::string &token) ABSL_LOCKS_EXCLUDED(mutex_);

  void PutValid(const std::string &token, std::string name, int64_t ttl_ms)
      ABSL_LOCKS_EXCLUDED(mutex_);

  void PutInvalid(const std::string &token, int64_t ttl_ms) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Return true if an entry was removed.
  bool Evict(const std::string &token) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Remove every expired entry. Returns how many were removed.
  size_t Sweep() ABSL_LOCKS_EXCLUDED(mutex_);

  size_t size() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  struct Slot {
    TokenCacheEntry entry;
    int64_t expires_at_ms = 0;
  };

  void Put(const std::string &token, TokenCacheEntry entry, int64_t ttl_ms)
      ABSL_LOCKS_EXCLUDED(mutex_);

  ClockFn clock_;
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, Slot> entries_ ABSL_GUARDED_BY(mutex_);

  ARMADA_DISALLOW_COPY_AND_ASSIGN(TokenCache);
};

}  // namespace armada
