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
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "armada/scheduling/resource_set.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

/// Unissued -> Issued -> Renewed* -> {Done | Returned | Expired}.
enum class LeaseState {
  kUnissued = 0,
  kIssued = 1,
  kRenewed = 2,
  kDone = 3,
  kReturned = 4,
  kExpired = 5,
};

/// Whether the executor is known to hold the job.
enum class DeliveryState {
  kUnsent = 0,
  kSent = 1,
  kAcked = 2,
};

inline const char *LeaseStateName(LeaseState state) {
  switch (state) {
  case LeaseState::kUnissued:
    return "UNISSUED";
  case LeaseState::kIssued:
    return "ISSUED";
  case LeaseState::kRenewed:
    return "RENEWED";
  case LeaseState::kDone:
    return "DONE";
  case LeaseState::kReturned:
    return "RETURNED";
  case LeaseState::kExpired:
    return "EXPIRED";
  }
  return "UNKNOWN";
}

using LabelPairs = std::vector<std::pair<std::string, std::string>>;

/// A time-bounded grant of one job to one cluster.
struct Lease {
  std::string job_id;
  std::string cluster_id;
  std::string pool;
  std::shared_ptr<const rpc::Job> job;
  /// Priority class and resources committed to the accountant for this lease.
  int32_t priority_class = 0;
  ResourceSet resources;
  /// Node the job was fitted to at admission. Empty for leases recovered from
  /// records written without one.
  std::string node_name;
  LeaseState state = LeaseState::kUnissued;
  DeliveryState delivery = DeliveryState::kUnsent;
  /// Global issue order. Pending deliveries are resent in this order.
  uint64_t issue_seq = 0;
  /// Monotonic deadline after which the lease expires unless renewed.
  int64_t deadline_ms = 0;
  /// Monotonic time of the last send to an executor, 0 if never sent.
  int64_t last_sent_ms = 0;
  /// Wall clock times, for records.
  int64_t issued_at_ms = 0;
  int64_t finished_at_ms = 0;
  /// Set by ReturnLease.
  LabelPairs avoid_node_labels;
  std::string reason;

  /// Issued or Renewed: resources are committed.
  bool IsLive() const { return state == LeaseState::kIssued || state == LeaseState::kRenewed; }

  bool IsTerminal() const {
    return state == LeaseState::kDone || state == LeaseState::kReturned ||
           state == LeaseState::kExpired;
  }
};

/// An admitted job, before it becomes a Lease.
struct LeaseGrant {
  std::shared_ptr<const rpc::Job> job;
  int32_t priority_class = 0;
  ResourceSet resources;
  std::string node_name;
};

}  // namespace armada
