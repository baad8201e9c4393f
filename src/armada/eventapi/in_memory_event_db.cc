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

#include "armada/eventapi/in_memory_event_db.h"

#include <algorithm>

namespace armada {

StatusOr<int64_t> InMemoryEventDb::GetOrCreateJobSetId(const std::string &queue,
                                                       const std::string &job_set) {
  absl::MutexLock lock(&mutex_);
  ++num_lookups_;
  auto [it, inserted] = rows_.try_emplace(std::make_pair(queue, job_set));
  if (inserted) {
    it->second.queue = queue;
    it->second.job_set = job_set;
    it->second.job_set_id = next_id_++;
    it->second.created_ms = wall_clock_();
  }
  return it->second.job_set_id;
}

StatusOr<std::vector<JobSetRow>> InMemoryEventDb::LoadJobSets(int64_t since_ms) {
  absl::MutexLock lock(&mutex_);
  std::vector<JobSetRow> rows;
  for (const auto &[key, row] : rows_) {
    if (row.created_ms >= since_ms) {
      rows.push_back(row);
    }
  }
  std::sort(rows.begin(), rows.end(), [](const JobSetRow &a, const JobSetRow &b) {
    return a.job_set_id < b.job_set_id;
  });
  return rows;
}

int64_t InMemoryEventDb::NumLookups() const {
  absl::MutexLock lock(&mutex_);
  return num_lookups_;
}

}  // namespace armada
