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

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/common/status.h"

namespace armada {

/// \class SessionRegistry
///
/// At most one streaming session per (cluster, pool). The first session to
/// register keeps the slot until it unregisters; later ones are rejected.
/// This class is thread safe.
class SessionRegistry {
 public:
  SessionRegistry() = default;

  uint64_t NextSessionId() { return next_session_id_.fetch_add(1) + 1; }

  /// AlreadyExists if another session holds the slot.
  Status Register(const std::string &cluster_id,
                  const std::string &pool,
                  uint64_t session_id) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Free the slot if `session_id` holds it.
  void Unregister(const std::string &cluster_id,
                  const std::string &pool,
                  uint64_t session_id) ABSL_LOCKS_EXCLUDED(mutex_);

  /// The session holding the slot, 0 if free.
  uint64_t Owner(const std::string &cluster_id, const std::string &pool) const
      ABSL_LOCKS_EXCLUDED(mutex_);

  size_t NumSessions() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  std::atomic<uint64_t> next_session_id_{0};
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::pair<std::string, std::string>, uint64_t> owners_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace armada
