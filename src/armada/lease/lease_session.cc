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

#include "armada/lease/lease_session.h"

#include <algorithm>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "armada/common/armada_config.h"
#include "armada/util/logging.h"

namespace armada {

const char *SessionStateName(SessionState state) {
  switch (state) {
  case SessionState::kHandshake:
    return "HANDSHAKE";
  case SessionState::kStreaming:
    return "STREAMING";
  case SessionState::kAwaitingAcks:
    return "AWAITING_ACKS";
  case SessionState::kDraining:
    return "DRAINING";
  case SessionState::kClosed:
    return "CLOSED";
  }
  return "UNKNOWN";
}

LeaseSession::LeaseSession(LeaseAdmission &admission,
                           LeaseLifecycleManager &lifecycle,
                           SessionRegistry &registry)
    : admission_(admission), lifecycle_(lifecycle), registry_(registry) {}

LeaseSession::~LeaseSession() { Close(); }

Status LeaseSession::Merge(const rpc::StreamingLeaseRequest &request) {
  if (state_ == SessionState::kHandshake) {
    if (request.cluster_id().empty()) {
      return Status::Invalid("first message of a lease stream must carry cluster_id");
    }
    merged_.set_cluster_id(request.cluster_id());
    merged_.set_pool(request.pool());
    session_id_ = registry_.NextSessionId();
    ARMADA_RETURN_NOT_OK(registry_.Register(merged_.cluster_id(), merged_.pool(), session_id_));
    registered_ = true;
    ARMADA_LOG(INFO).WithField(kLogKeyClusterID, merged_.cluster_id())
            .WithField(kLogKeyPool, merged_.pool())
        << "Lease session " << session_id_ << " started";
  } else {
    if (!request.cluster_id().empty() && request.cluster_id() != merged_.cluster_id()) {
      return Status::Invalid(absl::StrCat("cluster_id changed from ", merged_.cluster_id(),
                                          " to ", request.cluster_id(), " mid-stream"));
    }
    if (!request.pool().empty() && request.pool() != merged_.pool()) {
      return Status::Invalid(absl::StrCat("pool changed from \"", merged_.pool(),
                                          "\" to \"", request.pool(), "\" mid-stream"));
    }
  }
  if (!request.resources().empty()) {
    *merged_.mutable_resources() = request.resources();
  }
  if (request.has_cluster_leased_report()) {
    *merged_.mutable_cluster_leased_report() = request.cluster_leased_report();
  }
  if (!request.minimum_job_size().empty()) {
    *merged_.mutable_minimum_job_size() = request.minimum_job_size();
  }
  if (!request.nodes().empty()) {
    *merged_.mutable_nodes() = request.nodes();
  }
  return Status::OK();
}

std::vector<std::string> LeaseSession::CarriedBatch() const {
  std::vector<std::string> carried;
  auto last = lifecycle_.LastBatch(merged_.cluster_id(), merged_.pool());
  if (!last.has_value()) {
    return carried;
  }
  bool fully_acked = true;
  for (const auto &job_id : last->job_ids) {
    auto lease = lifecycle_.Get(job_id);
    if (!lease.has_value() || lease->cluster_id != merged_.cluster_id() ||
        !lease->IsLive()) {
      continue;
    }
    if (lease->delivery != DeliveryState::kAcked) {
      fully_acked = false;
    }
    carried.push_back(job_id);
  }
  if (fully_acked) {
    carried.clear();
  }
  return carried;
}

Status LeaseSession::OnRequest(const rpc::StreamingLeaseRequest &request,
                               std::vector<rpc::StreamingJobLease> *out) {
  if (state_ == SessionState::kDraining || state_ == SessionState::kClosed) {
    return Status::Invalid("lease session is closed");
  }
  const bool first_message = state_ == SessionState::kHandshake;
  ARMADA_RETURN_NOT_OK(Merge(request));
  const std::string &cluster_id = merged_.cluster_id();
  const std::string &pool = merged_.pool();

  ARMADA_RETURN_NOT_OK(admission_.ApplyCapacityReport(merged_));

  std::vector<std::string> received(request.receivedjobids().begin(),
                                    request.receivedjobids().end());
  lifecycle_.MarkAcked(cluster_id, received);

  std::vector<std::string> batch_ids;
  absl::flat_hash_set<std::string> in_batch;
  auto add = [&batch_ids, &in_batch](const std::string &job_id) {
    if (in_batch.insert(job_id).second) {
      batch_ids.push_back(job_id);
    }
  };
  if (first_message) {
    for (const auto &job_id : CarriedBatch()) {
      add(job_id);
    }
  }
  const int64_t resend_after_ms =
      first_message ? 0 : ArmadaConfig::instance().lease_resend_after_ms();
  for (const auto &lease : lifecycle_.PendingDelivery(cluster_id, pool, resend_after_ms)) {
    add(lease.job_id);
  }

  const size_t max_jobs = ArmadaConfig::instance().max_jobs_per_batch();
  const size_t max_new = batch_ids.size() >= max_jobs ? 0 : max_jobs - batch_ids.size();
  ARMADA_ASSIGN_OR_RETURN(auto new_jobs, admission_.AdmitBatch(merged_, max_new));
  for (const auto &job : new_jobs) {
    add(job->id());
  }

  if (batch_ids.empty()) {
    state_ = SessionState::kAwaitingAcks;
    return Status::OK();
  }

  std::vector<Lease> to_send;
  uint32_t num_acked = 0;
  for (const auto &job_id : batch_ids) {
    auto lease = lifecycle_.Get(job_id);
    if (!lease.has_value() || !lease->IsLive()) {
      continue;
    }
    if (lease->delivery == DeliveryState::kAcked) {
      ++num_acked;
    } else {
      to_send.push_back(std::move(*lease));
    }
  }
  const uint32_t num_jobs = static_cast<uint32_t>(to_send.size()) + num_acked;
  lifecycle_.RecordBatch(cluster_id, pool, batch_ids);
  for (const auto &lease : to_send) {
    rpc::StreamingJobLease message;
    message.mutable_job()->CopyFrom(*lease.job);
    message.set_numjobs(num_jobs);
    message.set_numacked(num_acked);
    out->push_back(std::move(message));
  }
  ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, cluster_id).WithField(kLogKeyPool, pool)
      << "Batch of " << num_jobs << " jobs, " << num_acked << " acked, " << new_jobs.size()
      << " new";
  state_ = to_send.empty() ? SessionState::kAwaitingAcks : SessionState::kStreaming;
  return Status::OK();
}

void LeaseSession::OnJobSent(const std::string &job_id) {
  lifecycle_.MarkSent(merged_.cluster_id(), {job_id});
}

void LeaseSession::OnBatchDelivered() {
  if (state_ == SessionState::kStreaming) {
    state_ = SessionState::kAwaitingAcks;
  }
}

void LeaseSession::Close() {
  if (state_ == SessionState::kClosed) {
    return;
  }
  state_ = SessionState::kDraining;
  if (registered_) {
    registry_.Unregister(merged_.cluster_id(), merged_.pool(), session_id_);
    registered_ = false;
    ARMADA_LOG(INFO).WithField(kLogKeyClusterID, merged_.cluster_id())
            .WithField(kLogKeyPool, merged_.pool())
        << "Lease session " << session_id_ << " closed";
  }
  state_ = SessionState::kClosed;
}

Status LeaseSession::LeaseOnce(LeaseAdmission &admission,
                               LeaseLifecycleManager &lifecycle,
                               const rpc::LeaseRequest &request,
                               rpc::JobLease *reply) {
  ARMADA_RETURN_NOT_OK(admission.ApplyCapacityReport(request));
  ARMADA_ASSIGN_OR_RETURN(
      auto jobs,
      admission.AdmitBatch(request, ArmadaConfig::instance().max_jobs_per_batch()));
  std::vector<std::string> job_ids;
  job_ids.reserve(jobs.size());
  for (const auto &job : jobs) {
    job_ids.push_back(job->id());
    reply->add_job()->CopyFrom(*job);
  }
  lifecycle.MarkSent(request.cluster_id(), job_ids);
  lifecycle.MarkAcked(request.cluster_id(), job_ids);
  return Status::OK();
}

}  // namespace armada
