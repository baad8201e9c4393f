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

#include "armada/lease/lease_admission.h"

#include <limits>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "armada/common/armada_config.h"
#include "armada/util/logging.h"

namespace armada {

void SummarizeCapacity(const NodeTypeMap &node_types,
                       ResourceSet *total,
                       std::map<int32_t, ResourceSet> *allocated_by_priority) {
  for (const auto &[key, stats] : node_types) {
    for (const auto &node : stats.Nodes()) {
      *total += node.base;
      if (!node.allocated_by_priority.empty()) {
        for (const auto &[priority, allocated] : node.allocated_by_priority) {
          (*allocated_by_priority)[priority] += allocated;
        }
        continue;
      }
      ResourceSet used = node.base - node.reported_available;
      used.ClampNegative();
      if (!used.IsEmpty()) {
        (*allocated_by_priority)[std::numeric_limits<int32_t>::max()] += used;
      }
    }
  }
}

LeaseAdmission::LeaseAdmission(AccountantRegistry &accountants,
                               QueueLeasedReportAggregator &aggregator,
                               LeaseLifecycleManager &lifecycle,
                               FairnessOracleInterface &oracle,
                               LeaseTableStorage &storage,
                               ClockFn wall_clock)
    : accountants_(accountants),
      aggregator_(aggregator),
      lifecycle_(lifecycle),
      oracle_(oracle),
      storage_(storage),
      wall_clock_(std::move(wall_clock)) {}

LeaseAdmission::PoolState &LeaseAdmission::GetPoolState(const std::string &cluster_id,
                                                        const std::string &pool) {
  absl::MutexLock lock(&pools_mutex_);
  auto &state = pools_[std::make_pair(cluster_id, pool)];
  if (state == nullptr) {
    state = std::make_unique<PoolState>();
  }
  return *state;
}

Status LeaseAdmission::ApplyCapacityReport(const rpc::LeaseRequest &request) {
  if (request.cluster_id().empty()) {
    return Status::Invalid("lease request has no cluster_id");
  }
  const std::string &cluster_id = request.cluster_id();
  const std::string &pool = request.pool();
  ARMADA_ASSIGN_OR_RETURN(ResourceSet reported_total,
                          ResourceSet::FromQuantityMap(request.resources()));
  ARMADA_ASSIGN_OR_RETURN(ResourceSet minimum_job_size,
                          ResourceSet::FromQuantityMap(request.minimum_job_size()));
  std::vector<rpc::NodeInfo> nodes(request.nodes().begin(), request.nodes().end());
  ARMADA_ASSIGN_OR_RETURN(NodeTypeMap node_types, ClassifyNodes(nodes));

  if (request.has_cluster_leased_report()) {
    rpc::ClusterLeasedReport report = request.cluster_leased_report();
    if (report.cluster_id().empty()) {
      report.set_cluster_id(cluster_id);
    }
    ARMADA_ASSIGN_OR_RETURN(bool accepted, aggregator_.Report(cluster_id, report));
    if (!accepted) {
      ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id)
          << "Ignoring leased report that is not newer than the one already held";
    }
  }

  ResourceSet total;
  std::map<int32_t, ResourceSet> allocated_by_priority;
  SummarizeCapacity(node_types, &total, &allocated_by_priority);
  if (nodes.empty()) {
    total = reported_total;
  }

  rpc::ClusterSchedulingInfoReport info;
  info.set_cluster_id(cluster_id);
  info.set_pool(pool);
  const int64_t now_ms = wall_clock_();
  info.mutable_report_time()->set_seconds(now_ms / 1000);
  info.mutable_report_time()->set_nanos(static_cast<int32_t>((now_ms % 1000) * 1000000));
  for (auto *stats : SortedNodeTypes(&node_types)) {
    stats->key().ToProto(info.add_node_types());
  }
  minimum_job_size.ToQuantityMap(info.mutable_minimum_job_size());

  PoolState &state = GetPoolState(cluster_id, pool);
  absl::MutexLock lock(&state.mutex);
  Status status =
      storage_.SchedulingInfo().Put(SchedulingInfoTable::Key(cluster_id, pool), info);
  if (!status.ok()) {
    return Status::Unavailable(
        absl::StrCat("failed to persist scheduling info: ", status.message()));
  }
  accountants_.GetOrCreate(cluster_id, pool)
      ->UpdateCapacity(std::move(total), std::move(allocated_by_priority));
  ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyPool, pool)
      << "Capacity report with " << nodes.size() << " nodes in " << node_types.size()
      << " node types";
  state.node_types = std::move(node_types);
  return Status::OK();
}

NodeTypeStats *LeaseAdmission::FindNodeType(const std::vector<NodeTypeStats *> &node_types,
                                            const rpc::Job &job,
                                            const ResourceSet &request,
                                            const LabelPairs &avoid_labels,
                                            size_t *node_index) {
  for (const bool avoided_pass : {false, true}) {
    for (NodeTypeStats *stats : node_types) {
      if (stats->HasAnyLabel(avoid_labels) != avoided_pass) {
        continue;
      }
      if (!stats->MatchesLabels(job.required_node_labels()) ||
          !stats->ToleratedBy(job.tolerations())) {
        continue;
      }
      auto index = stats->FindNode(job.priority_class(), request);
      if (index.has_value()) {
        *node_index = *index;
        return stats;
      }
    }
  }
  return nullptr;
}

StatusOr<std::vector<std::shared_ptr<const rpc::Job>>> LeaseAdmission::AdmitBatch(
    const rpc::LeaseRequest &request, size_t max_jobs) {
  std::vector<std::shared_ptr<const rpc::Job>> leased;
  if (max_jobs == 0) {
    return leased;
  }
  const std::string &cluster_id = request.cluster_id();
  const std::string &pool = request.pool();
  ARMADA_ASSIGN_OR_RETURN(ResourceSet minimum_job_size,
                          ResourceSet::FromQuantityMap(request.minimum_job_size()));

  PoolState &state = GetPoolState(cluster_id, pool);
  absl::MutexLock lock(&state.mutex);
  auto accountant = accountants_.GetOrCreate(cluster_id, pool);
  NodeTypeMap working = state.node_types;
  std::vector<NodeTypeStats *> node_types = SortedNodeTypes(&working);
  if (node_types.empty()) {
    return leased;
  }
  // Nodes keep the room of the pool's live leases until they finish.
  for (const auto &lease : lifecycle_.LiveLeases(cluster_id, pool)) {
    if (lease.node_name.empty()) {
      continue;
    }
    for (NodeTypeStats *stats : node_types) {
      if (stats->ReserveOnNode(lease.node_name, lease.priority_class, lease.resources)) {
        break;
      }
    }
  }

  CandidateRequest candidate_request;
  candidate_request.cluster_id = cluster_id;
  candidate_request.pool = pool;
  candidate_request.max_candidates =
      max_jobs * ArmadaConfig::instance().oracle_candidate_multiplier();
  candidate_request.capacity = accountant->Total();
  auto candidates = oracle_.Candidates(candidate_request);
  if (!candidates.ok()) {
    return Status::Unavailable(
        absl::StrCat("fairness oracle failed: ", candidates.status().message()));
  }

  std::vector<LeaseGrant> admitted;
  for (const auto &job : *candidates) {
    if (admitted.size() >= max_jobs) {
      break;
    }
    auto job_request = ResourceSet::FromQuantityMap(job->resource_requirements());
    if (!job_request.ok()) {
      ARMADA_LOG_EVERY_MS(WARNING, 10000).WithField(kLogKeyJobID, job->id())
          << "Skipping job with unparseable resources: " << job_request.status();
      continue;
    }
    if (!minimum_job_size.IsEmpty() && !(*job_request >= minimum_job_size)) {
      continue;
    }
    const int32_t priority = job->priority_class();
    size_t node_index = 0;
    NodeTypeStats *stats = FindNodeType(node_types, *job, *job_request,
                                        lifecycle_.AvoidNodeLabels(job->id()), &node_index);
    if (stats == nullptr) {
      continue;
    }
    if (!accountant->TryCommit(priority, *job_request)) {
      continue;
    }
    stats->Reserve(node_index, priority, *job_request);
    admitted.push_back(LeaseGrant{job, priority, std::move(job_request).value(),
                                  stats->Nodes()[node_index].name});
  }
  if (admitted.empty()) {
    return leased;
  }

  auto release = [&accountant](const std::vector<LeaseGrant> &grants) {
    for (const auto &grant : grants) {
      accountant->Release(grant.priority_class, grant.resources);
    }
  };

  std::vector<std::string> admitted_ids;
  admitted_ids.reserve(admitted.size());
  for (const auto &grant : admitted) {
    admitted_ids.push_back(grant.job->id());
  }
  auto claimed = oracle_.MarkLeased(cluster_id, admitted_ids);
  if (!claimed.ok()) {
    release(admitted);
    return Status::Unavailable(
        absl::StrCat("fairness oracle failed to claim jobs: ", claimed.status().message()));
  }
  absl::flat_hash_set<std::string> claimed_ids(claimed->begin(), claimed->end());
  std::vector<LeaseGrant> grants;
  std::vector<LeaseGrant> lost;
  for (auto &grant : admitted) {
    (claimed_ids.contains(grant.job->id()) ? grants : lost).push_back(std::move(grant));
  }
  release(lost);

  Status status = lifecycle_.Issue(cluster_id, pool, grants);
  if (!status.ok()) {
    release(grants);
    for (const auto &grant : grants) {
      oracle_.Requeue(grant.job->id());
    }
    return Status::Unavailable(absl::StrCat("failed to issue leases: ", status.message()));
  }
  for (const auto &grant : grants) {
    leased.push_back(grant.job);
  }
  ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyPool, pool)
      << "Admitted " << leased.size() << " of " << candidates->size() << " candidates";
  return leased;
}

}  // namespace armada
