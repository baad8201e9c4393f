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

#include "armada/lease/lease_lifecycle_manager.h"

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "armada/util/logging.h"

namespace armada {

namespace {

rpc::LeaseRecord::State ToRecordState(LeaseState state) {
  return static_cast<rpc::LeaseRecord::State>(static_cast<int>(state));
}

}  // namespace

LeaseLifecycleManager::LeaseLifecycleManager(AccountantRegistry &accountants,
                                             LeaseTableStorage &storage,
                                             int64_t lease_timeout_ms,
                                             ClockFn clock,
                                             ClockFn wall_clock)
    : accountants_(accountants),
      storage_(storage),
      lease_timeout_ms_(lease_timeout_ms),
      clock_(std::move(clock)),
      wall_clock_(std::move(wall_clock)) {
  ARMADA_CHECK_GT(lease_timeout_ms_, 0);
}

LeaseLifecycleManager::Shard &LeaseLifecycleManager::GetOrCreateShard(
    const std::string &cluster_id) {
  absl::MutexLock lock(&shards_mutex_);
  auto &shard = shards_[cluster_id];
  if (shard == nullptr) {
    shard = std::make_unique<Shard>();
  }
  return *shard;
}

LeaseLifecycleManager::Shard *LeaseLifecycleManager::GetShard(
    const std::string &cluster_id) const {
  absl::MutexLock lock(&shards_mutex_);
  auto it = shards_.find(cluster_id);
  return it == shards_.end() ? nullptr : it->second.get();
}

rpc::LeaseRecord LeaseLifecycleManager::ToRecord(const Lease &lease) {
  rpc::LeaseRecord record;
  if (lease.job != nullptr) {
    record.mutable_job()->CopyFrom(*lease.job);
  }
  record.set_cluster_id(lease.cluster_id);
  record.set_pool(lease.pool);
  record.set_priority_class(lease.priority_class);
  lease.resources.ToQuantityMap(record.mutable_resources());
  record.set_state(ToRecordState(lease.state));
  record.set_issue_seq(lease.issue_seq);
  record.set_issued_at_ms(lease.issued_at_ms);
  record.set_node_name(lease.node_name);
  return record;
}

StatusOr<Lease> LeaseLifecycleManager::FromRecord(const rpc::LeaseRecord &record) {
  Lease lease;
  ARMADA_ASSIGN_OR_RETURN(lease.resources, ResourceSet::FromQuantityMap(record.resources()));
  lease.job = std::make_shared<const rpc::Job>(record.job());
  lease.job_id = record.job().id();
  lease.cluster_id = record.cluster_id();
  lease.pool = record.pool();
  lease.priority_class = record.priority_class();
  lease.state = static_cast<LeaseState>(static_cast<int>(record.state()));
  lease.issue_seq = record.issue_seq();
  lease.issued_at_ms = record.issued_at_ms();
  lease.node_name = record.node_name();
  return lease;
}

Status LeaseLifecycleManager::Issue(const std::string &cluster_id,
                                    const std::string &pool,
                                    const std::vector<LeaseGrant> &grants) {
  if (grants.empty()) {
    return Status::OK();
  }
  Shard &shard = GetOrCreateShard(cluster_id);
  std::vector<Lease> issued;
  {
    absl::MutexLock lock(&shard.mutex);
    const int64_t now = clock_();
    const int64_t wall_now = wall_clock_();

    // Reserve the job ids in the index so that no other cluster can issue them
    // while the batch is being persisted.
    absl::flat_hash_map<std::string, std::optional<IndexEntry>> previous;
    {
      absl::MutexLock index_lock(&index_mutex_);
      for (const auto &grant : grants) {
        const std::string &job_id = grant.job->id();
        auto it = job_index_.find(job_id);
        Status conflict;
        if (previous.contains(job_id)) {
          conflict = Status::AlreadyExists(absl::StrCat("job ", job_id, " granted twice"));
        } else if (it != job_index_.end() && it->second.live) {
          conflict = Status::AlreadyExists(absl::StrCat(
              "job ", job_id, " already leased to cluster ", it->second.cluster_id));
        }
        if (!conflict.ok()) {
          for (auto &[id, entry] : previous) {
            if (entry.has_value()) {
              job_index_[id] = *entry;
            } else {
              job_index_.erase(id);
            }
          }
          return conflict;
        }
        previous.emplace(job_id,
                         it == job_index_.end() ? std::nullopt
                                                : std::optional<IndexEntry>(it->second));
        job_index_[job_id] = IndexEntry{cluster_id, true};
      }
      for (const auto &grant : grants) {
        Lease lease;
        lease.job_id = grant.job->id();
        lease.cluster_id = cluster_id;
        lease.pool = pool;
        lease.job = grant.job;
        lease.priority_class = grant.priority_class;
        lease.resources = grant.resources;
        lease.node_name = grant.node_name;
        lease.state = LeaseState::kIssued;
        lease.delivery = DeliveryState::kUnsent;
        lease.issue_seq = next_issue_seq_++;
        lease.deadline_ms = now + lease_timeout_ms_;
        lease.issued_at_ms = wall_now;
        issued.push_back(std::move(lease));
      }
    }

    std::vector<rpc::LeaseRecord> records;
    records.reserve(issued.size());
    std::vector<std::pair<std::string, const rpc::LeaseRecord *>> rows;
    for (const auto &lease : issued) {
      records.push_back(ToRecord(lease));
    }
    for (size_t i = 0; i < issued.size(); ++i) {
      rows.emplace_back(issued[i].job_id, &records[i]);
    }
    Status status = storage_.Leases().BatchPut(rows);
    if (!status.ok()) {
      absl::MutexLock index_lock(&index_mutex_);
      for (auto &[id, entry] : previous) {
        if (entry.has_value()) {
          job_index_[id] = *entry;
        } else {
          job_index_.erase(id);
        }
      }
      ARMADA_LOG(WARNING).WithField(kLogKeyClusterID, cluster_id)
          << "Failed to persist " << issued.size() << " leases: " << status;
      return status;
    }
    for (const auto &lease : issued) {
      shard.leases[lease.job_id] = lease;
    }
  }

  ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyPool, pool)
      << "Issued " << issued.size() << " leases";
  for (const auto &lease : issued) {
    for (const auto &listener : issued_listeners_) {
      listener(lease);
    }
  }
  return Status::OK();
}

void LeaseLifecycleManager::MarkSent(const std::string &cluster_id,
                                     const std::vector<std::string> &job_ids) {
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return;
  }
  absl::MutexLock lock(&shard->mutex);
  const int64_t now = clock_();
  for (const auto &job_id : job_ids) {
    auto it = shard->leases.find(job_id);
    if (it == shard->leases.end() || !it->second.IsLive()) {
      continue;
    }
    if (it->second.delivery != DeliveryState::kAcked) {
      it->second.delivery = DeliveryState::kSent;
    }
    it->second.last_sent_ms = now;
  }
}

std::vector<std::string> LeaseLifecycleManager::MarkAcked(
    const std::string &cluster_id, const std::vector<std::string> &job_ids) {
  std::vector<std::string> acked;
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return acked;
  }
  absl::MutexLock lock(&shard->mutex);
  for (const auto &job_id : job_ids) {
    auto it = shard->leases.find(job_id);
    if (it == shard->leases.end() || it->second.IsTerminal()) {
      continue;
    }
    it->second.delivery = DeliveryState::kAcked;
    acked.push_back(job_id);
  }
  return acked;
}

std::vector<Lease> LeaseLifecycleManager::PendingDelivery(const std::string &cluster_id,
                                                          const std::string &pool,
                                                          int64_t older_than_ms) const {
  std::vector<Lease> pending;
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return pending;
  }
  absl::MutexLock lock(&shard->mutex);
  const int64_t now = clock_();
  for (const auto &[job_id, lease] : shard->leases) {
    if (!lease.IsLive() || lease.pool != pool || lease.delivery == DeliveryState::kAcked) {
      continue;
    }
    if (lease.delivery == DeliveryState::kUnsent ||
        now - lease.last_sent_ms >= older_than_ms) {
      pending.push_back(lease);
    }
  }
  std::sort(pending.begin(), pending.end(), [](const Lease &a, const Lease &b) {
    return a.issue_seq < b.issue_seq;
  });
  return pending;
}

uint64_t LeaseLifecycleManager::RecordBatch(const std::string &cluster_id,
                                            const std::string &pool,
                                            std::vector<std::string> job_ids) {
  Shard &shard = GetOrCreateShard(cluster_id);
  absl::MutexLock lock(&shard.mutex);
  LeaseBatch &batch = shard.last_batch[pool];
  ++batch.seq;
  batch.job_ids = std::move(job_ids);
  return batch.seq;
}

std::optional<LeaseBatch> LeaseLifecycleManager::LastBatch(const std::string &cluster_id,
                                                           const std::string &pool) const {
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return std::nullopt;
  }
  absl::MutexLock lock(&shard->mutex);
  auto it = shard->last_batch.find(pool);
  if (it == shard->last_batch.end()) {
    return std::nullopt;
  }
  return it->second;
}

Status LeaseLifecycleManager::FinishLocked(Shard &shard,
                                           const std::vector<std::string> &job_ids,
                                           LeaseState state,
                                           std::vector<Lease> *finished) {
  std::vector<std::string> live_ids;
  for (const auto &job_id : job_ids) {
    auto it = shard.leases.find(job_id);
    if (it != shard.leases.end() && it->second.IsLive()) {
      live_ids.push_back(job_id);
    }
  }
  if (live_ids.empty()) {
    return Status::OK();
  }
  ARMADA_RETURN_NOT_OK(storage_.Leases().BatchDelete(live_ids));

  const int64_t wall_now = wall_clock_();
  absl::MutexLock index_lock(&index_mutex_);
  for (const auto &job_id : live_ids) {
    Lease &lease = shard.leases[job_id];
    lease.state = state;
    lease.finished_at_ms = wall_now;
    auto index_it = job_index_.find(job_id);
    if (index_it != job_index_.end() && index_it->second.cluster_id == lease.cluster_id) {
      index_it->second.live = false;
    }
    if (state == LeaseState::kDone) {
      avoid_labels_.erase(job_id);
    }
    finished->push_back(lease);
  }
  return Status::OK();
}

void LeaseLifecycleManager::ReleaseResources(const Lease &lease) {
  auto accountant = accountants_.Get(lease.cluster_id, lease.pool);
  if (accountant == nullptr) {
    ARMADA_LOG(ERROR).WithField(kLogKeyClusterID, lease.cluster_id)
            .WithField(kLogKeyPool, lease.pool)
        << "No accountant to release lease " << lease.job_id << " to";
    return;
  }
  accountant->Release(lease.priority_class, lease.resources);
}

void LeaseLifecycleManager::OnLeasesFinished(const std::vector<Lease> &finished) {
  for (const auto &lease : finished) {
    ReleaseResources(lease);
    ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, lease.cluster_id)
            .WithField(kLogKeyJobID, lease.job_id)
        << "Lease finished as " << LeaseStateName(lease.state);
    for (const auto &listener : finished_listeners_) {
      listener(lease);
    }
  }
}

std::vector<std::string> LeaseLifecycleManager::Renew(
    const std::string &cluster_id, const std::vector<std::string> &job_ids) {
  std::vector<std::string> renewed;
  std::vector<Lease> expired;
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return renewed;
  }
  {
    absl::MutexLock lock(&shard->mutex);
    const int64_t now = clock_();
    std::vector<std::string> overdue;
    for (const auto &job_id : job_ids) {
      auto it = shard->leases.find(job_id);
      if (it == shard->leases.end() || !it->second.IsLive()) {
        continue;
      }
      Lease &lease = it->second;
      if (lease.deadline_ms <= now) {
        overdue.push_back(job_id);
        continue;
      }
      lease.deadline_ms = now + lease_timeout_ms_;
      lease.state = LeaseState::kRenewed;
      renewed.push_back(job_id);
    }
    Status status = FinishLocked(*shard, overdue, LeaseState::kExpired, &expired);
    if (!status.ok()) {
      ARMADA_LOG(WARNING).WithField(kLogKeyClusterID, cluster_id)
          << "Failed to expire " << overdue.size() << " overdue leases: " << status;
    }
  }
  OnLeasesFinished(expired);
  return renewed;
}

Status LeaseLifecycleManager::Return(const std::string &cluster_id,
                                     const std::string &job_id,
                                     LabelPairs avoid_node_labels,
                                     const std::string &reason) {
  std::vector<Lease> returned;
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    ARMADA_LOG(WARNING).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyJobID, job_id)
        << "Ignoring return of a job the cluster holds no lease for.";
    return Status::OK();
  }
  {
    absl::MutexLock lock(&shard->mutex);
    auto it = shard->leases.find(job_id);
    if (it == shard->leases.end()) {
      ARMADA_LOG(WARNING).WithField(kLogKeyClusterID, cluster_id)
              .WithField(kLogKeyJobID, job_id)
          << "Ignoring return of a job the cluster holds no lease for.";
      return Status::OK();
    }
    if (!it->second.IsLive()) {
      ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyJobID, job_id)
          << "Ignoring return of a lease that is already "
          << LeaseStateName(it->second.state);
      return Status::OK();
    }
    ARMADA_RETURN_NOT_OK(
        FinishLocked(*shard, {job_id}, LeaseState::kReturned, &returned));
    Lease &lease = it->second;
    lease.reason = reason;
    lease.avoid_node_labels = avoid_node_labels;
    returned.back().reason = reason;
    returned.back().avoid_node_labels = avoid_node_labels;
    if (!avoid_node_labels.empty()) {
      absl::MutexLock index_lock(&index_mutex_);
      avoid_labels_[job_id] = std::move(avoid_node_labels);
    }
  }
  ARMADA_LOG(INFO).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyJobID, job_id)
      << "Lease returned: " << reason;
  OnLeasesFinished(returned);
  return Status::OK();
}

std::vector<std::string> LeaseLifecycleManager::ReportDone(
    const std::vector<std::string> &job_ids) {
  absl::flat_hash_map<std::string, std::vector<std::string>> ids_by_cluster;
  {
    absl::MutexLock index_lock(&index_mutex_);
    for (const auto &job_id : job_ids) {
      auto it = job_index_.find(job_id);
      if (it != job_index_.end()) {
        ids_by_cluster[it->second.cluster_id].push_back(job_id);
      }
    }
  }

  absl::flat_hash_set<std::string> done;
  std::vector<Lease> finished;
  for (const auto &[cluster_id, ids] : ids_by_cluster) {
    Shard *shard = GetShard(cluster_id);
    if (shard == nullptr) {
      continue;
    }
    absl::MutexLock lock(&shard->mutex);
    const size_t first_new = finished.size();
    Status status = FinishLocked(*shard, ids, LeaseState::kDone, &finished);
    if (!status.ok()) {
      ARMADA_LOG(WARNING).WithField(kLogKeyClusterID, cluster_id)
          << "Failed to mark " << ids.size() << " leases done: " << status;
    }
    for (size_t i = first_new; i < finished.size(); ++i) {
      done.insert(finished[i].job_id);
    }
    for (const auto &job_id : ids) {
      auto it = shard->leases.find(job_id);
      if (it != shard->leases.end() && it->second.state == LeaseState::kDone) {
        done.insert(job_id);
      }
    }
  }
  OnLeasesFinished(finished);

  std::vector<std::string> result;
  absl::flat_hash_set<std::string> seen;
  for (const auto &job_id : job_ids) {
    if (done.contains(job_id) && seen.insert(job_id).second) {
      result.push_back(job_id);
    }
  }
  return result;
}

size_t LeaseLifecycleManager::ExpireLeases() {
  std::vector<Shard *> shards;
  {
    absl::MutexLock lock(&shards_mutex_);
    for (auto &[cluster_id, shard] : shards_) {
      shards.push_back(shard.get());
    }
  }
  std::vector<Lease> expired;
  for (Shard *shard : shards) {
    absl::MutexLock lock(&shard->mutex);
    const int64_t now = clock_();
    std::vector<std::string> overdue;
    for (const auto &[job_id, lease] : shard->leases) {
      if (lease.IsLive() && lease.deadline_ms <= now) {
        overdue.push_back(job_id);
      }
    }
    Status status = FinishLocked(*shard, overdue, LeaseState::kExpired, &expired);
    if (!status.ok()) {
      ARMADA_LOG(WARNING) << "Failed to expire " << overdue.size()
                          << " leases, will retry: " << status;
    }
  }
  if (!expired.empty()) {
    ARMADA_LOG(INFO) << "Expired " << expired.size() << " leases";
  }
  OnLeasesFinished(expired);
  return expired.size();
}

size_t LeaseLifecycleManager::PruneTerminal(int64_t retention_ms) {
  std::vector<Shard *> shards;
  {
    absl::MutexLock lock(&shards_mutex_);
    for (auto &[cluster_id, shard] : shards_) {
      shards.push_back(shard.get());
    }
  }
  size_t num_pruned = 0;
  const int64_t wall_now = wall_clock_();
  for (Shard *shard : shards) {
    absl::MutexLock lock(&shard->mutex);
    std::vector<std::string> pruned;
    for (const auto &[job_id, lease] : shard->leases) {
      if (lease.IsTerminal() && wall_now - lease.finished_at_ms > retention_ms) {
        pruned.push_back(job_id);
      }
    }
    absl::MutexLock index_lock(&index_mutex_);
    for (const auto &job_id : pruned) {
      const Lease &lease = shard->leases[job_id];
      auto index_it = job_index_.find(job_id);
      if (index_it != job_index_.end() && !index_it->second.live &&
          index_it->second.cluster_id == lease.cluster_id) {
        job_index_.erase(index_it);
      }
      shard->leases.erase(job_id);
    }
    num_pruned += pruned.size();
  }
  return num_pruned;
}

StatusOr<size_t> LeaseLifecycleManager::Recover() {
  ARMADA_ASSIGN_OR_RETURN(auto records, storage_.Leases().GetAll());
  std::vector<Lease> recovered;
  for (const auto &[job_id, record] : records) {
    auto lease = FromRecord(record);
    if (!lease.ok()) {
      ARMADA_LOG(ERROR).WithField(kLogKeyJobID, job_id)
          << "Skipping unreadable lease record: " << lease.status();
      continue;
    }
    if (!lease->IsLive() || lease->job_id != job_id) {
      ARMADA_LOG(WARNING).WithField(kLogKeyJobID, job_id)
          << "Skipping lease record in state " << LeaseStateName(lease->state);
      continue;
    }
    recovered.push_back(std::move(lease).value());
  }
  std::sort(recovered.begin(), recovered.end(), [](const Lease &a, const Lease &b) {
    return a.issue_seq < b.issue_seq;
  });

  const int64_t now = clock_();
  for (auto &lease : recovered) {
    lease.delivery = DeliveryState::kUnsent;
    lease.deadline_ms = now + lease_timeout_ms_;
    accountants_.GetOrCreate(lease.cluster_id, lease.pool)
        ->Commit(lease.priority_class, lease.resources);
    Shard &shard = GetOrCreateShard(lease.cluster_id);
    absl::MutexLock lock(&shard.mutex);
    shard.leases[lease.job_id] = lease;
    absl::MutexLock index_lock(&index_mutex_);
    job_index_[lease.job_id] = IndexEntry{lease.cluster_id, true};
    next_issue_seq_ = std::max(next_issue_seq_, lease.issue_seq + 1);
  }
  for (const auto &lease : recovered) {
    for (const auto &listener : issued_listeners_) {
      listener(lease);
    }
  }
  ARMADA_LOG(INFO) << "Recovered " << recovered.size() << " leases";
  return recovered.size();
}

std::optional<Lease> LeaseLifecycleManager::Get(const std::string &job_id) const {
  std::string cluster_id;
  {
    absl::MutexLock index_lock(&index_mutex_);
    auto it = job_index_.find(job_id);
    if (it == job_index_.end()) {
      return std::nullopt;
    }
    cluster_id = it->second.cluster_id;
  }
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return std::nullopt;
  }
  absl::MutexLock lock(&shard->mutex);
  auto it = shard->leases.find(job_id);
  if (it == shard->leases.end()) {
    return std::nullopt;
  }
  return it->second;
}

LabelPairs LeaseLifecycleManager::AvoidNodeLabels(const std::string &job_id) const {
  absl::MutexLock index_lock(&index_mutex_);
  auto it = avoid_labels_.find(job_id);
  return it == avoid_labels_.end() ? LabelPairs() : it->second;
}

std::vector<Lease> LeaseLifecycleManager::LiveLeases(const std::string &cluster_id,
                                                    const std::string &pool) const {
  std::vector<Lease> live;
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return live;
  }
  absl::MutexLock lock(&shard->mutex);
  for (const auto &[job_id, lease] : shard->leases) {
    if (lease.IsLive() && lease.pool == pool) {
      live.push_back(lease);
    }
  }
  return live;
}

size_t LeaseLifecycleManager::NumLiveLeases(const std::string &cluster_id) const {
  Shard *shard = GetShard(cluster_id);
  if (shard == nullptr) {
    return 0;
  }
  absl::MutexLock lock(&shard->mutex);
  return std::count_if(shard->leases.begin(), shard->leases.end(),
                       [](const auto &entry) { return entry.second.IsLive(); });
}

}  // namespace armada
