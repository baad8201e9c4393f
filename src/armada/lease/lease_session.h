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
#include <string>
#include <vector>

#include "armada/common/status.h"
#include "armada/lease/lease_admission.h"
#include "armada/lease/lease_lifecycle_manager.h"
#include "armada/lease/session_registry.h"
#include "armada/util/macros.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

enum class SessionState {
  kHandshake,
  kStreaming,
  kAwaitingAcks,
  kDraining,
  kClosed,
};

const char *SessionStateName(SessionState state);

/// \class LeaseSession
///
/// Protocol state of one StreamingLeaseJobs call. The transport feeds every
/// inbound message to `OnRequest`, writes the returned messages in order, and
/// reports each write with `OnJobSent`. Destroying a session never releases
/// leases: they stay with the lifecycle manager until returned, done or expired.
///
/// Not thread safe; a session is driven by one transport at a time.
class LeaseSession {
 public:
  LeaseSession(LeaseAdmission &admission,
               LeaseLifecycleManager &lifecycle,
               SessionRegistry &registry);

  ~LeaseSession();

  /// Process one inbound message and append the messages to write to `out`.
  ///
  /// The first message must name the cluster; its cluster and pool are fixed for
  /// the session. Other fields left empty in later messages keep their last value.
  /// \return Invalid on a protocol error, AlreadyExists if the pool has a session,
  /// Unavailable on a transient failure. The session must be closed after an error.
  Status OnRequest(const rpc::StreamingLeaseRequest &request,
                   std::vector<rpc::StreamingJobLease> *out);

  /// One message of the current batch was written to the executor.
  void OnJobSent(const std::string &job_id);

  /// Every message of the current batch was written.
  void OnBatchDelivered();

  /// Leave the pool to another session. Idempotent.
  void Close();

  SessionState state() const { return state_; }

  uint64_t session_id() const { return session_id_; }

  const std::string &cluster_id() const { return merged_.cluster_id(); }

  const std::string &pool() const { return merged_.pool(); }

  /// Single-shot lease call: one capacity report, one batch. The reply is the
  /// delivery, so the leases are acked when it is produced.
  static Status LeaseOnce(LeaseAdmission &admission,
                          LeaseLifecycleManager &lifecycle,
                          const rpc::LeaseRequest &request,
                          rpc::JobLease *reply);

 private:
  /// Fold `request` into the remembered view. Checks the handshake.
  Status Merge(const rpc::StreamingLeaseRequest &request);

  /// The pool's last batch if some of its leases are live and not yet acked,
  /// restricted to live leases and in the original order. Empty otherwise.
  std::vector<std::string> CarriedBatch() const;

  LeaseAdmission &admission_;
  LeaseLifecycleManager &lifecycle_;
  SessionRegistry &registry_;

  SessionState state_ = SessionState::kHandshake;
  uint64_t session_id_ = 0;
  bool registered_ = false;
  /// Last non-empty value of every field received so far.
  rpc::LeaseRequest merged_;

  ARMADA_DISALLOW_COPY_AND_ASSIGN(LeaseSession);
};

}  // namespace armada
