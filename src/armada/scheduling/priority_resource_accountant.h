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
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/scheduling/resource_set.h"
#include "armada/util/macros.h"

namespace armada {

/// Resource accounting of one cluster pool, by priority class.
///
/// Priorities follow Kubernetes: a pod of priority P may preempt pods of any
/// priority below P. A band P is therefore only constrained by what is allocated at
/// P and above, and lower bands may be oversubscribed.
///
/// Allocation at a band is the larger, per resource, of the executor-reported
/// baseline and what this server holds committed for live leases. The report
/// already contains the pods of leases that started running, and the commit
/// covers the leases that did not yet. All mutation goes through
/// Commit/Release/TryCommit, and every method is thread safe.
class PriorityResourceAccountant {
 public:
  PriorityResourceAccountant(std::string cluster_id, std::string pool);

  /// Replace the executor-reported capacity and allocation wholesale.
  void UpdateCapacity(ResourceSet total, std::map<int32_t, ResourceSet> reported_allocated)
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Whether `request` at `priority` keeps every band at or above `priority` within
  /// the total.
  bool CanAdmit(int32_t priority, const ResourceSet &request) const
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// CanAdmit and Commit as one atomic step.
  bool TryCommit(int32_t priority, const ResourceSet &request) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Unconditionally add `request` at `priority`.
  void Commit(int32_t priority, const ResourceSet &request) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Remove `request` from `priority`. A release below zero is clamped and logged.
  void Release(int32_t priority, const ResourceSet &request) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Total minus everything allocated at `priority` and above.
  ResourceSet Headroom(int32_t priority) const ABSL_LOCKS_EXCLUDED(mutex_);

  /// Everything allocated exactly at `priority`: the larger of baseline and commit.
  ResourceSet Allocated(int32_t priority) const ABSL_LOCKS_EXCLUDED(mutex_);

  /// Resources committed by this server at `priority`, excluding the baseline.
  ResourceSet Committed(int32_t priority) const ABSL_LOCKS_EXCLUDED(mutex_);

  ResourceSet Total() const ABSL_LOCKS_EXCLUDED(mutex_);

  const std::string &ClusterId() const { return cluster_id_; }
  const std::string &Pool() const { return pool_; }

 private:
  ResourceSet CumulativeLocked(int32_t priority) const ABSL_SHARED_LOCKS_REQUIRED(mutex_);
  bool CanAdmitLocked(int32_t priority, const ResourceSet &request) const
      ABSL_SHARED_LOCKS_REQUIRED(mutex_);

  const std::string cluster_id_;
  const std::string pool_;

  mutable absl::Mutex mutex_;
  ResourceSet total_ ABSL_GUARDED_BY(mutex_);
  std::map<int32_t, ResourceSet> baseline_ ABSL_GUARDED_BY(mutex_);
  std::map<int32_t, ResourceSet> committed_ ABSL_GUARDED_BY(mutex_);

  ARMADA_DISALLOW_COPY_AND_ASSIGN(PriorityResourceAccountant);
};

/// Owns one accountant per (cluster, pool), created on first use.
class AccountantRegistry {
 public:
  AccountantRegistry() = default;

  std::shared_ptr<PriorityResourceAccountant> GetOrCreate(const std::string &cluster_id,
                                                          const std::string &pool)
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Return nullptr if no accountant exists yet.
  std::shared_ptr<PriorityResourceAccountant> Get(const std::string &cluster_id,
                                                  const std::string &pool) const
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::pair<std::string, std::string>,
                      std::shared_ptr<PriorityResourceAccountant>>
      accountants_ ABSL_GUARDED_BY(mutex_);

  ARMADA_DISALLOW_COPY_AND_ASSIGN(AccountantRegistry);
};

}  // namespace armada
