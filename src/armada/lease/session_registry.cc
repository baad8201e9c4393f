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

#include "armada/lease/session_registry.h"

#include "absl/strings/str_cat.h"

namespace armada {

Status SessionRegistry::Register(const std::string &cluster_id,
                                 const std::string &pool,
                                 uint64_t session_id) {
  absl::MutexLock lock(&mutex_);
  auto [it, inserted] = owners_.emplace(std::make_pair(cluster_id, pool), session_id);
  if (!inserted && it->second != session_id) {
    return Status::AlreadyExists(absl::StrCat("cluster ", cluster_id, " pool \"", pool,
                                              "\" already has a lease session"));
  }
  return Status::OK();
}

void SessionRegistry::Unregister(const std::string &cluster_id,
                                 const std::string &pool,
                                 uint64_t session_id) {
  absl::MutexLock lock(&mutex_);
  auto it = owners_.find(std::make_pair(cluster_id, pool));
  if (it != owners_.end() && it->second == session_id) {
    owners_.erase(it);
  }
}

uint64_t SessionRegistry::Owner(const std::string &cluster_id,
                                const std::string &pool) const {
  absl::MutexLock lock(&mutex_);
  auto it = owners_.find(std::make_pair(cluster_id, pool));
  return it == owners_.end() ? 0 : it->second;
}

size_t SessionRegistry::NumSessions() const {
  absl::MutexLock lock(&mutex_);
  return owners_.size();
}

}  // namespace armada
