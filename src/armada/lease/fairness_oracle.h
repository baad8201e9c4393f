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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "armada/common/status_or.h"
#include "armada/scheduling/resource_set.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

struct CandidateRequest {
  std::string cluster_id;
  std::string pool;
  /// Upper bound on the number of candidates returned.
  size_t max_candidates = 0;
  /// Capacity of the requesting pool, used to weigh queue usage.
  ResourceSet capacity;
};

/// \class FairnessOracleInterface
///
/// Decides which queued jobs are offered next. The caller checks each candidate
/// against capacity and claims the ones it admits with `MarkLeased`.
class FairnessOracleInterface {
 public:
  virtual ~FairnessOracleInterface() = default;

  /// The next jobs to consider, most deserving first. Has no side effects, and
  /// never returns a job that is currently leased.
  virtual StatusOr<std::vector<std::shared_ptr<const rpc::Job>>> Candidates(
      const CandidateRequest &request) = 0;

  /// Claim jobs for `cluster_id`. Returns the ids claimed by this call; ids
  /// already claimed or unknown are left out.
  virtual StatusOr<std::vector<std::string>> MarkLeased(
      const std::string &cluster_id, const std::vector<std::string> &job_ids) = 0;

  /// Put a claimed job back in its queue.
  virtual void Requeue(const std::string &job_id) = 0;

  /// Forget a job that finished.
  virtual void Remove(const std::string &job_id) = 0;
};

}  // namespace armada
