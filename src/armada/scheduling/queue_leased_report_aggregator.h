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

#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/common/status_or.h"
#include "armada/scheduling/resource_set.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

/// Rolls per-queue resource usage up across clusters for fairness accounting.
///
/// Each cluster contributes its latest ClusterLeasedReport plus the leases issued to
/// it since that report. A newer report replaces the previous one wholesale and
/// absorbs those leases. A report that is not strictly newer is dropped, so a
/// repeated report does not forget leases issued after it. Reports are never merged.
class QueueLeasedReportAggregator {
 public:
  QueueLeasedReportAggregator() = default;

  /// Record `report` for `cluster_id`.
  ///
  /// \return true if the report became the cluster's latest, false if it was
  /// not newer than the stored one. Invalid if a quantity cannot be parsed or the
  /// report names another cluster.
  StatusOr<bool> Report(const std::string &cluster_id, const rpc::ClusterLeasedReport &report)
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Count a lease issued after the cluster's latest report.
  void RecordLeased(const std::string &cluster_id, const std::string &job_id,
                    const std::string &queue, const ResourceSet &resources)
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Stop counting a lease that reached a terminal state.
  void RecordReleased(const std::string &cluster_id, const std::string &job_id)
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Usage of `queue` summed over every cluster.
  ResourceSet QueueUsage(const std::string &queue) const ABSL_LOCKS_EXCLUDED(mutex_);

  /// Usage of every queue summed over every cluster.
  absl::flat_hash_map<std::string, ResourceSet> UsageByQueue() const
      ABSL_LOCKS_EXCLUDED(mutex_);

  /// Usage of every queue on one cluster.
  absl::flat_hash_map<std::string, ResourceSet> ClusterUsage(
      const std::string &cluster_id) const ABSL_LOCKS_EXCLUDED(mutex_);

  void RemoveCluster(const std::string &cluster_id) ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  struct PendingLease {
    std::string queue;
    ResourceSet resources;
  };

  struct ClusterState {
    int64_t report_seconds = 0;
    int32_t report_nanos = 0;
    bool has_report = false;
    absl::flat_hash_map<std::string, ResourceSet> reported;
    absl::flat_hash_map<std::string, PendingLease> leased_since_report;
  };

  static void AddClusterUsage(const ClusterState &cluster,
                              absl::flat_hash_map<std::string, ResourceSet> *usage);

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, ClusterState> clusters_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace armada
