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

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/eventapi/event_db.h"
#include "armada/util/time.h"

namespace armada {

/// Process-local EventDbInterface. Ids start at 1 and are never reused.
/// This class is thread safe.
class InMemoryEventDb : public EventDbInterface {
 public:
  explicit InMemoryEventDb(ClockFn wall_clock = current_sys_time_ms)
      : wall_clock_(std::move(wall_clock)) {}

  StatusOr<int64_t> GetOrCreateJobSetId(const std::string &queue,
                                        const std::string &job_set) override;

  StatusOr<std::vector<JobSetRow>> LoadJobSets(int64_t since_ms) override;

  /// Number of GetOrCreateJobSetId calls served.
  int64_t NumLookups() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  ClockFn wall_clock_;
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::pair<std::string, std::string>, JobSetRow> rows_
      ABSL_GUARDED_BY(mutex_);
  int64_t next_id_ ABSL_GUARDED_BY(mutex_) = 1;
  int64_t num_lookups_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace armada
