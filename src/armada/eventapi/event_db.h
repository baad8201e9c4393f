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
#include "armada/common/status_or.h"

namespace armada {

struct JobSetRow {
  std::string queue;
  std::string job_set;
  int64_t job_set_id = 0;
  /// Wall clock time of creation, in milliseconds.
  int64_t created_ms = 0;
};

/// \class EventDbInterface
///
/// Storage of the (queue, job set) -> numeric id mapping used by run records.
class EventDbInterface {
 public:
  virtual ~EventDbInterface() = default;

  /// Return the id of (queue, job_set), allocating one if it does not exist yet.
  /// Repeated calls for the same pair return the same id.
  virtual StatusOr<int64_t> GetOrCreateJobSetId(const std::string &queue,
                                                const std::string &job_set) = 0;

  /// Job sets created at or after `since_ms`, for cache warm-up.
  virtual StatusOr<std::vector<JobSetRow>> LoadJobSets(int64_t since_ms) = 0;
};

}  // namespace armada
