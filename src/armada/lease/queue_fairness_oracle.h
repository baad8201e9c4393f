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

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/lease/fairness_oracle.h"
#include "armada/scheduling/queue_leased_report_aggregator.h"
#include "armada/store/store_tables.h"

namespace armada {

/// Strict "more urgent than" order on jobs of one queue.
using JobOrder = std::function<bool(const rpc::Job &, const rpc::Job &)>;

/// Lower `priority` value first. Armada queues treat priority as a niceness.
bool LowerPriorityValueFirst(const rpc::Job &a, const rpc::Job &b);

/// \class QueueFairnessOracle
///
/// In-memory backlog of submitted jobs, one ordered list per queue. Candidates
/// are drawn one at a time from the queue whose usage, weighted by the pool
/// capacity, is smallest after counting the candidates already drawn. Queue usage
/// comes from the leased-report aggregator.
///
/// This class is thread safe.
class QueueFairnessOracle : public FairnessOracleInterface {
 public:
  /// \param scheduler_name Jobs tagged for another scheduler are never offered.
  QueueFairnessOracle(const QueueLeasedReportAggregator &aggregator,
                      LeaseTableStorage &storage,
                      JobOrder order,
                      std::string scheduler_name = "");

  /// Add a job to its queue and persist it. Invalid if id or queue is missing,
  /// AlreadyExists if the id is known.
  Status Submit(rpc::Job job) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Reload persisted jobs into their queues. Jobs with a recovered lease are
  /// claimed again through `MarkLeased`.
  StatusOr<size_t> Recover() ABSL_LOCKS_EXCLUDED(mutex_);

  StatusOr<std::vector<std::shared_ptr<const rpc::Job>>> Candidates(
      const CandidateRequest &request) override;

  StatusOr<std::vector<std::string>> MarkLeased(
      const std::string &cluster_id, const std::vector<std::string> &job_ids) override;

  void Requeue(const std::string &job_id) override;

  void Remove(const std::string &job_id) override;

  /// Number of jobs waiting in `queue`, claimed ones excluded.
  size_t QueuedJobs(const std::string &queue) const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  /// Orders a queue's jobs by `order`, then by creation time, then by id.
  class JobLess {
   public:
    explicit JobLess(const JobOrder *order) : order_(order) {}
    bool operator()(const std::shared_ptr<const rpc::Job> &a,
                    const std::shared_ptr<const rpc::Job> &b) const;

   private:
    const JobOrder *order_;
  };

  using Backlog = std::set<std::shared_ptr<const rpc::Job>, JobLess>;

  struct JobEntry {
    std::shared_ptr<const rpc::Job> job;
    /// Cluster that claimed the job, empty while queued.
    std::string leased_to;
  };

  void EnqueueLocked(std::shared_ptr<const rpc::Job> job)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  bool IsForThisScheduler(const rpc::Job &job) const;

  static double WeightedUsage(const ResourceSet &usage, const ResourceSet &capacity);

  const QueueLeasedReportAggregator &aggregator_;
  LeaseTableStorage &storage_;
  const JobOrder order_;
  const std::string scheduler_name_;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, JobEntry> jobs_ ABSL_GUARDED_BY(mutex_);
  /// Unclaimed jobs per queue.
  absl::flat_hash_map<std::string, Backlog> queues_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace armada
