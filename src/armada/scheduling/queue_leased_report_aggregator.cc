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

#include "armada/scheduling/queue_leased_report_aggregator.h"

#include <tuple>

#include "absl/strings/str_cat.h"
#include "armada/util/logging.h"

namespace armada {

StatusOr<bool> QueueLeasedReportAggregator::Report(const std::string &cluster_id,
                                                   const rpc::ClusterLeasedReport &report) {
  if (!report.cluster_id().empty() && report.cluster_id() != cluster_id) {
    return Status::Invalid(absl::StrCat("leased report of cluster ", report.cluster_id(),
                                        " sent by cluster ", cluster_id));
  }
  absl::flat_hash_map<std::string, ResourceSet> reported;
  for (const auto &queue : report.queues()) {
    auto leased = ResourceSet::FromQuantityMap(queue.resources_leased());
    if (!leased.ok()) {
      return Status::Invalid(
          absl::StrCat("queue ", queue.name(), ": ", leased.status().message()));
    }
    reported[queue.name()] += *leased;
  }

  absl::MutexLock lock(&mutex_);
  auto &state = clusters_[cluster_id];
  const auto incoming =
      std::make_tuple(report.report_time().seconds(), report.report_time().nanos());
  if (state.has_report &&
      incoming <= std::make_tuple(state.report_seconds, state.report_nanos)) {
    ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id)
        << "Dropping leased report that is not newer than the latest one.";
    return false;
  }
  state.has_report = true;
  state.report_seconds = report.report_time().seconds();
  state.report_nanos = report.report_time().nanos();
  state.reported = std::move(reported);
  state.leased_since_report.clear();
  return true;
}

void QueueLeasedReportAggregator::RecordLeased(const std::string &cluster_id,
                                               const std::string &job_id,
                                               const std::string &queue,
                                               const ResourceSet &resources) {
  absl::MutexLock lock(&mutex_);
  clusters_[cluster_id].leased_since_report[job_id] = PendingLease{queue, resources};
}

void QueueLeasedReportAggregator::RecordReleased(const std::string &cluster_id,
                                                 const std::string &job_id) {
  absl::MutexLock lock(&mutex_);
  auto it = clusters_.find(cluster_id);
  if (it != clusters_.end()) {
    it->second.leased_since_report.erase(job_id);
  }
}

void QueueLeasedReportAggregator::AddClusterUsage(
    const ClusterState &cluster, absl::flat_hash_map<std::string, ResourceSet> *usage) {
  for (const auto &[queue, resources] : cluster.reported) {
    (*usage)[queue] += resources;
  }
  for (const auto &entry : cluster.leased_since_report) {
    (*usage)[entry.second.queue] += entry.second.resources;
  }
}

ResourceSet QueueLeasedReportAggregator::QueueUsage(const std::string &queue) const {
  auto usage = UsageByQueue();
  auto it = usage.find(queue);
  return it == usage.end() ? ResourceSet() : it->second;
}

absl::flat_hash_map<std::string, ResourceSet> QueueLeasedReportAggregator::UsageByQueue()
    const {
  absl::flat_hash_map<std::string, ResourceSet> usage;
  absl::MutexLock lock(&mutex_);
  for (const auto &entry : clusters_) {
    AddClusterUsage(entry.second, &usage);
  }
  return usage;
}

absl::flat_hash_map<std::string, ResourceSet> QueueLeasedReportAggregator::ClusterUsage(
    const std::string &cluster_id) const {
  absl::flat_hash_map<std::string, ResourceSet> usage;
  absl::MutexLock lock(&mutex_);
  auto it = clusters_.find(cluster_id);
  if (it != clusters_.end()) {
    AddClusterUsage(it->second, &usage);
  }
  return usage;
}

void QueueLeasedReportAggregator::RemoveCluster(const std::string &cluster_id) {
  absl::MutexLock lock(&mutex_);
  clusters_.erase(cluster_id);
}

}  // namespace armada
