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

#include "armada/scheduling/priority_resource_accountant.h"

#include "armada/util/logging.h"

namespace armada {

PriorityResourceAccountant::PriorityResourceAccountant(std::string cluster_id,
                                                       std::string pool)
    : cluster_id_(std::move(cluster_id)), pool_(std::move(pool)) {}

void PriorityResourceAccountant::UpdateCapacity(
    ResourceSet total, std::map<int32_t, ResourceSet> reported_allocated) {
  absl::MutexLock lock(&mutex_);
  total_ = std::move(total);
  baseline_ = std::move(reported_allocated);
}

ResourceSet PriorityResourceAccountant::CumulativeLocked(int32_t priority) const {
  return CumulativeAllocation(baseline_, committed_, priority);
}

bool PriorityResourceAccountant::CanAdmitLocked(int32_t priority,
                                                const ResourceSet &request) const {
  // Bands above `priority` are unaffected by the request and their cumulative sums
  // are no larger than the one at `priority`, so this band is the binding one.
  return CumulativeLocked(priority) + request <= total_;
}

bool PriorityResourceAccountant::CanAdmit(int32_t priority,
                                          const ResourceSet &request) const {
  absl::ReaderMutexLock lock(&mutex_);
  return CanAdmitLocked(priority, request);
}

bool PriorityResourceAccountant::TryCommit(int32_t priority, const ResourceSet &request) {
  absl::MutexLock lock(&mutex_);
  if (!CanAdmitLocked(priority, request)) {
    return false;
  }
  committed_[priority] += request;
  return true;
}

void PriorityResourceAccountant::Commit(int32_t priority, const ResourceSet &request) {
  absl::MutexLock lock(&mutex_);
  committed_[priority] += request;
}

void PriorityResourceAccountant::Release(int32_t priority, const ResourceSet &request) {
  absl::MutexLock lock(&mutex_);
  auto &committed = committed_[priority];
  committed -= request;
  if (committed.ClampNegative()) {
    ARMADA_LOG(ERROR).WithField(kLogKeyClusterID, cluster_id_).WithField(kLogKeyPool, pool_)
        << "Released more than was committed at priority " << priority << ": "
        << request << ". Clamped to zero.";
  }
  if (committed.IsEmpty()) {
    committed_.erase(priority);
  }
}

ResourceSet PriorityResourceAccountant::Headroom(int32_t priority) const {
  absl::ReaderMutexLock lock(&mutex_);
  return total_ - CumulativeLocked(priority);
}

ResourceSet PriorityResourceAccountant::Allocated(int32_t priority) const {
  absl::ReaderMutexLock lock(&mutex_);
  ResourceSet allocated;
  if (auto it = baseline_.find(priority); it != baseline_.end()) {
    allocated = it->second;
  }
  if (auto it = committed_.find(priority); it != committed_.end()) {
    allocated = allocated.Max(it->second);
  }
  return allocated;
}

ResourceSet PriorityResourceAccountant::Committed(int32_t priority) const {
  absl::ReaderMutexLock lock(&mutex_);
  auto it = committed_.find(priority);
  return it == committed_.end() ? ResourceSet() : it->second;
}

ResourceSet PriorityResourceAccountant::Total() const {
  absl::ReaderMutexLock lock(&mutex_);
  return total_;
}

std::shared_ptr<PriorityResourceAccountant> AccountantRegistry::GetOrCreate(
    const std::string &cluster_id, const std::string &pool) {
  absl::MutexLock lock(&mutex_);
  auto &accountant = accountants_[std::make_pair(cluster_id, pool)];
  if (accountant == nullptr) {
    accountant = std::make_shared<PriorityResourceAccountant>(cluster_id, pool);
  }
  return accountant;
}

std::shared_ptr<PriorityResourceAccountant> AccountantRegistry::Get(
    const std::string &cluster_id, const std::string &pool) const {
  absl::MutexLock lock(&mutex_);
  auto it = accountants_.find(std::make_pair(cluster_id, pool));
  return it == accountants_.end() ? nullptr : it->second;
}

}  // namespace armada
