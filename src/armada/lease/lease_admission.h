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
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/common/status_or.h"
#include "armada/lease/fairness_oracle.h"
#include "armada/lease/lease_lifecycle_manager.h"
#include "armada/scheduling/node_type.h"
#include "armada/scheduling/priority_resource_accountant.h"
#include "armada/scheduling/queue_leased_report_aggregator.h"
#include "armada/store/store_tables.h"
#include "armada/util/time.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

/// Capacity and per-priority allocation derived from classified nodes. Nodes that
/// do not break allocation down by priority count their used resources at the
/// highest band.
void SummarizeCapacity(const NodeTypeMap &node_types,
                       ResourceSet *total,
                       std::map<int32_t, ResourceSet> *allocated_by_priority);

/// \class LeaseAdmission
///
/// Turns an executor's capacity report into issued leases. Work on one
/// (cluster, pool) is serialized by a per-pool mutex; different pools proceed
/// concurrently. This class is thread safe.
class LeaseAdmission {
 public:
  LeaseAdmission(AccountantRegistry &accountants,
                 QueueLeasedReportAggregator &aggregator,
                 LeaseLifecycleManager &lifecycle,
                 FairnessOracleInterface &oracle,
                 LeaseTableStorage &storage,
                 ClockFn wall_clock = current_sys_time_ms);

  /// Classify the reported nodes, replace the accountant's capacity, feed the
  /// leased report to the aggregator and persist the scheduling info.
  /// Invalid on a missing cluster id or an unparseable quantity.
  Status ApplyCapacityReport(const rpc::LeaseRequest &request);

  /// Select up to `max_jobs` jobs that fit the last applied capacity report of
  /// the request's pool, commit their resources and issue their leases. Nodes
  /// holding live leases of the pool keep that room across batches.
  /// Returns the leased jobs in selection order. On a store or oracle failure
  /// nothing is committed and Unavailable is returned.
  StatusOr<std::vector<std::shared_ptr<const rpc::Job>>> AdmitBatch(
      const rpc::LeaseRequest &request, size_t max_jobs);

 private:
  struct PoolState {
    absl::Mutex mutex;
    NodeTypeMap node_types ABSL_GUARDED_BY(mutex);
  };

  PoolState &GetPoolState(const std::string &cluster_id, const std::string &pool)
      ABSL_LOCKS_EXCLUDED(pools_mutex_);

  /// The node type a job should go to and the node index within it, or nullptr.
  /// Types carrying one of `avoid_labels` are only used when nothing else fits.
  static NodeTypeStats *FindNodeType(const std::vector<NodeTypeStats *> &node_types,
                                     const rpc::Job &job,
                                     const ResourceSet &request,
                                     const LabelPairs &avoid_labels,
                                     size_t *node_index);

  AccountantRegistry &accountants_;
  QueueLeasedReportAggregator &aggregator_;
  LeaseLifecycleManager &lifecycle_;
  FairnessOracleInterface &oracle_;
  LeaseTableStorage &storage_;
  ClockFn wall_clock_;

  absl::Mutex pools_mutex_;
  absl::flat_hash_map<std::pair<std::string, std::string>, std::unique_ptr<PoolState>>
      pools_ ABSL_GUARDED_BY(pools_mutex_);
};

}  // namespace armada
