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

#include "armada/lease/queue_fairness_oracle.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "absl/strings/str_cat.h"
#include "armada/util/logging.h"

namespace armada {

bool LowerPriorityValueFirst(const rpc::Job &a, const rpc::Job &b) {
  return a.priority() < b.priority();
}

bool QueueFairnessOracle::JobLess::operator()(const std::shared_ptr<const rpc::Job> &a,
                                              const std::shared_ptr<const rpc::Job> &b) const {
  if ((*order_)(*a, *b)) {
    return true;
  }
  if ((*order_)(*b, *a)) {
    return false;
  }
  const auto &ca = a->created();
  const auto &cb = b->created();
  if (ca.seconds() != cb.seconds()) {
    return ca.seconds() < cb.seconds();
  }
  if (ca.nanos() != cb.nanos()) {
    return ca.nanos() < cb.nanos();
  }
  return a->id() < b->id();
}

QueueFairnessOracle::QueueFairnessOracle(const QueueLeasedReportAggregator &aggregator,
                                         LeaseTableStorage &storage,
                                         JobOrder order,
                                         std::string scheduler_name)
    : aggregator_(aggregator),
      storage_(storage),
      order_(std::move(order)),
      scheduler_name_(std::move(scheduler_name)) {
  ARMADA_CHECK(order_);
}

bool QueueFairnessOracle::IsForThisScheduler(const rpc::Job &job) const {
  return job.scheduler().empty() || job.scheduler() == scheduler_name_;
}

double QueueFairnessOracle::WeightedUsage(const ResourceSet &usage,
                                          const ResourceSet &capacity) {
  double share = 0;
  for (const auto &[name, amount] : usage.Resources()) {
    const FixedPoint total = capacity.Get(name);
    if (total > FixedPoint(0)) {
      share = std::max(share, amount.Double() / total.Double());
    } else if (capacity.IsEmpty()) {
      share += amount.Double();
    }
  }
  return share;
}

void QueueFairnessOracle::EnqueueLocked(std::shared_ptr<const rpc::Job> job) {
  auto it = queues_.find(job->queue());
  if (it == queues_.end()) {
    it = queues_.emplace(job->queue(), Backlog(JobLess(&order_))).first;
  }
  it->second.insert(std::move(job));
}

Status QueueFairnessOracle::Submit(rpc::Job job) {
  if (job.id().empty()) {
    return Status::Invalid("job has no id");
  }
  if (job.queue().empty()) {
    return Status::Invalid(absl::StrCat("job ", job.id(), " has no queue"));
  }
  absl::MutexLock lock(&mutex_);
  if (jobs_.contains(job.id())) {
    return Status::AlreadyExists(absl::StrCat("job ", job.id(), " already submitted"));
  }
  ARMADA_RETURN_NOT_OK(storage_.Jobs().Put(job.id(), job));
  auto shared = std::make_shared<const rpc::Job>(std::move(job));
  jobs_.emplace(shared->id(), JobEntry{shared, ""});
  EnqueueLocked(std::move(shared));
  return Status::OK();
}

StatusOr<size_t> QueueFairnessOracle::Recover() {
  ARMADA_ASSIGN_OR_RETURN(auto stored, storage_.Jobs().GetAll());
  absl::MutexLock lock(&mutex_);
  size_t num_loaded = 0;
  for (auto &[job_id, job] : stored) {
    if (jobs_.contains(job_id)) {
      continue;
    }
    auto shared = std::make_shared<const rpc::Job>(std::move(job));
    jobs_.emplace(job_id, JobEntry{shared, ""});
    EnqueueLocked(std::move(shared));
    ++num_loaded;
  }
  ARMADA_LOG(INFO) << "Recovered " << num_loaded << " queued jobs";
  return num_loaded;
}

StatusOr<std::vector<std::shared_ptr<const rpc::Job>>> QueueFairnessOracle::Candidates(
    const CandidateRequest &request) {
  auto usage_by_queue = aggregator_.UsageByQueue();

  struct Cursor {
    const std::string *queue;
    Backlog::const_iterator next;
    Backlog::const_iterator end;
    ResourceSet usage;
    double share;
  };

  std::vector<std::shared_ptr<const rpc::Job>> candidates;
  absl::MutexLock lock(&mutex_);
  std::vector<Cursor> cursors;
  for (const auto &[queue, backlog] : queues_) {
    if (backlog.empty()) {
      continue;
    }
    ResourceSet usage = usage_by_queue[queue];
    const double share = WeightedUsage(usage, request.capacity);
    cursors.push_back(Cursor{&queue, backlog.begin(), backlog.end(), std::move(usage), share});
  }

  while (candidates.size() < request.max_candidates) {
    Cursor *best = nullptr;
    for (auto &cursor : cursors) {
      if (cursor.next == cursor.end) {
        continue;
      }
      if (best == nullptr || cursor.share < best->share ||
          (cursor.share == best->share && *cursor.queue < *best->queue)) {
        best = &cursor;
      }
    }
    if (best == nullptr) {
      break;
    }
    const auto &job = *best->next;
    ++best->next;
    if (!IsForThisScheduler(*job)) {
      continue;
    }
    candidates.push_back(job);
    auto requested = ResourceSet::FromQuantityMap(job->resource_requirements());
    if (requested.ok()) {
      best->usage += *requested;
      best->share = WeightedUsage(best->usage, request.capacity);
    }
  }
  return candidates;
}

StatusOr<std::vector<std::string>> QueueFairnessOracle::MarkLeased(
    const std::string &cluster_id, const std::vector<std::string> &job_ids) {
  std::vector<std::string> claimed;
  absl::MutexLock lock(&mutex_);
  for (const auto &job_id : job_ids) {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || !it->second.leased_to.empty()) {
      continue;
    }
    auto queue_it = queues_.find(it->second.job->queue());
    if (queue_it != queues_.end()) {
      queue_it->second.erase(it->second.job);
    }
    it->second.leased_to = cluster_id;
    claimed.push_back(job_id);
  }
  return claimed;
}

void QueueFairnessOracle::Requeue(const std::string &job_id) {
  absl::MutexLock lock(&mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end() || it->second.leased_to.empty()) {
    return;
  }
  it->second.leased_to.clear();
  EnqueueLocked(it->second.job);
}

void QueueFairnessOracle::Remove(const std::string &job_id) {
  absl::MutexLock lock(&mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return;
  }
  auto queue_it = queues_.find(it->second.job->queue());
  if (queue_it != queues_.end()) {
    queue_it->second.erase(it->second.job);
  }
  jobs_.erase(it);
  Status status = storage_.Jobs().Delete(job_id);
  if (!status.ok()) {
    ARMADA_LOG(WARNING).WithField(kLogKeyJobID, job_id)
        << "Failed to delete finished job: " << status;
  }
}

size_t QueueFairnessOracle::QueuedJobs(const std::string &queue) const {
  absl::MutexLock lock(&mutex_);
  auto it = queues_.find(queue);
  return it == queues_.end() ? 0 : it->second.size();
}

}  // namespace armada
