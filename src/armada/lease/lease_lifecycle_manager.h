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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/common/status.h"
#include "armada/common/status_or.h"
#include "armada/lease/lease.h"
#include "armada/scheduling/priority_resource_accountant.h"
#include "armada/store/store_tables.h"
#include "armada/util/macros.h"
#include "armada/util/time.h"

namespace armada {

/// The most recent batch streamed to a (cluster, pool), in selection order.
struct LeaseBatch {
  uint64_t seq = 0;
  std::vector<std::string> job_ids;
};

/// \class LeaseLifecycleManager
///
/// Owns every lease, independent of the connection that delivered it. Leases are
/// sharded by cluster; each shard has its own mutex. Resources of a lease are
/// committed to the accountant of its (cluster, pool) by the admission step
/// before `Issue`, and released here on the way to a terminal state.
///
/// Listeners and the accountant are called after the shard lock is dropped.
/// This class is thread safe.
class LeaseLifecycleManager {
 public:
  using LeaseListener = std::function<void(const Lease &)>;

  /// \param accountants Accountants to release resources to.
  /// \param storage Live leases are persisted in its lease table.
  /// \param lease_timeout_ms Renewal deadline of a lease, on `clock`.
  /// \param clock Monotonic clock for deadlines.
  /// \param wall_clock Wall clock for the times recorded on leases.
  LeaseLifecycleManager(AccountantRegistry &accountants,
                        LeaseTableStorage &storage,
                        int64_t lease_timeout_ms,
                        ClockFn clock = current_time_ms,
                        ClockFn wall_clock = current_sys_time_ms);

  /// Issue one lease per grant to `cluster_id`/`pool`. The grants' resources must
  /// already be committed. Either every lease is persisted and issued, or none is
  /// and the error is returned; the caller then still owns the commits.
  /// AlreadyExists if a job already has a live lease.
  Status Issue(const std::string &cluster_id,
               const std::string &pool,
               const std::vector<LeaseGrant> &grants) ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Record that the given leases were written to the executor.
  void MarkSent(const std::string &cluster_id, const std::vector<std::string> &job_ids);

  /// Record that the executor holds the given jobs. Returns the ids that name a
  /// non-terminal lease of `cluster_id`.
  std::vector<std::string> MarkAcked(const std::string &cluster_id,
                                     const std::vector<std::string> &job_ids);

  /// Live leases of `cluster_id`/`pool` not acked by the executor that were never
  /// sent, or last sent at least `older_than_ms` ago. In issue order.
  std::vector<Lease> PendingDelivery(const std::string &cluster_id,
                                     const std::string &pool,
                                     int64_t older_than_ms) const;

  /// Remember the batch just selected for `cluster_id`/`pool`. Returns its sequence
  /// number.
  uint64_t RecordBatch(const std::string &cluster_id,
                       const std::string &pool,
                       std::vector<std::string> job_ids);

  std::optional<LeaseBatch> LastBatch(const std::string &cluster_id,
                                      const std::string &pool) const;

  /// Extend the deadline of each live lease of `cluster_id`. Returns the ids renewed.
  /// A lease already past its deadline expires instead and is not returned.
  std::vector<std::string> Renew(const std::string &cluster_id,
                                 const std::vector<std::string> &job_ids);

  /// Hand a lease back. `avoid_node_labels` are kept for the next attempt of the
  /// job. A job `cluster_id` holds no live lease for is logged and ignored.
  /// Fails only when the store cannot be updated.
  Status Return(const std::string &cluster_id,
                const std::string &job_id,
                LabelPairs avoid_node_labels,
                const std::string &reason);

  /// Mark leases done. Returns the ids that are done after the call; ids already
  /// done are included again, nothing is released twice.
  std::vector<std::string> ReportDone(const std::vector<std::string> &job_ids)
      ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Expire every live lease whose deadline has passed. Returns how many expired.
  size_t ExpireLeases();

  /// Forget terminal leases that finished more than `retention_ms` ago.
  size_t PruneTerminal(int64_t retention_ms) ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Reload live leases from storage and recommit their resources. Whether a
  /// recovered lease reached its executor is unknown, so it is unsent until acked.
  /// Each gets a fresh deadline. Returns how many were loaded.
  StatusOr<size_t> Recover() ABSL_LOCKS_EXCLUDED(index_mutex_);

  std::optional<Lease> Get(const std::string &job_id) const
      ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Labels the executor asked to avoid when it last returned `job_id`.
  LabelPairs AvoidNodeLabels(const std::string &job_id) const
      ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Issued or renewed leases of `cluster_id`/`pool`, in no particular order.
  std::vector<Lease> LiveLeases(const std::string &cluster_id, const std::string &pool) const;

  size_t NumLiveLeases(const std::string &cluster_id) const;

  /// Called with each newly issued or recovered lease.
  void AddLeaseIssuedListener(LeaseListener listener) {
    ARMADA_CHECK(listener);
    issued_listeners_.emplace_back(std::move(listener));
  }

  /// Called with each lease that reached Done, Returned or Expired.
  void AddLeaseFinishedListener(LeaseListener listener) {
    ARMADA_CHECK(listener);
    finished_listeners_.emplace_back(std::move(listener));
  }

 private:
  struct Shard {
    mutable absl::Mutex mutex;
    absl::flat_hash_map<std::string, Lease> leases ABSL_GUARDED_BY(mutex);
    absl::flat_hash_map<std::string, LeaseBatch> last_batch ABSL_GUARDED_BY(mutex);
  };

  Shard &GetOrCreateShard(const std::string &cluster_id) ABSL_LOCKS_EXCLUDED(shards_mutex_);
  Shard *GetShard(const std::string &cluster_id) const ABSL_LOCKS_EXCLUDED(shards_mutex_);

  /// Persist the removal of the live leases among `job_ids` and move them to
  /// `state`. On a store error nothing changes. Appends the finished leases to
  /// `finished`.
  Status FinishLocked(Shard &shard,
                      const std::vector<std::string> &job_ids,
                      LeaseState state,
                      std::vector<Lease> *finished)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(shard.mutex) ABSL_LOCKS_EXCLUDED(index_mutex_);

  /// Release resources of finished leases and notify listeners. Called without locks.
  void OnLeasesFinished(const std::vector<Lease> &finished);

  void ReleaseResources(const Lease &lease);

  static rpc::LeaseRecord ToRecord(const Lease &lease);
  static StatusOr<Lease> FromRecord(const rpc::LeaseRecord &record);

  AccountantRegistry &accountants_;
  LeaseTableStorage &storage_;
  const int64_t lease_timeout_ms_;
  ClockFn clock_;
  ClockFn wall_clock_;

  mutable absl::Mutex shards_mutex_;
  absl::flat_hash_map<std::string, std::unique_ptr<Shard>> shards_
      ABSL_GUARDED_BY(shards_mutex_);

  struct IndexEntry {
    std::string cluster_id;
    /// Live, or being issued.
    bool live = false;
  };

  /// Job id to its latest lease. Lock order: shard, then index.
  mutable absl::Mutex index_mutex_;
  absl::flat_hash_map<std::string, IndexEntry> job_index_ ABSL_GUARDED_BY(index_mutex_);
  absl::flat_hash_map<std::string, LabelPairs> avoid_labels_ ABSL_GUARDED_BY(index_mutex_);
  uint64_t next_issue_seq_ ABSL_GUARDED_BY(index_mutex_) = 1;

  /// Registered at startup, before any lease is issued.
  std::vector<LeaseListener> issued_listeners_;
  std::vector<LeaseListener> finished_listeners_;

  ARMADA_DISALLOW_COPY_AND_ASSIGN(LeaseLifecycleManager);
};

}  // namespace armada
