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

#include "armada/eventapi/jobset_mapper.h"

#include "armada/util/logging.h"

namespace armada {

StatusOr<std::unique_ptr<JobSetMapper>> JobSetMapper::Create(EventDbInterface &event_db,
                                                             size_t cache_size,
                                                             int64_t initialise_since_ms,
                                                             int64_t now_ms) {
  if (cache_size == 0) {
    return Status::Invalid("jobset cache size must be positive");
  }
  ARMADA_ASSIGN_OR_RETURN(auto rows, event_db.LoadJobSets(now_ms - initialise_since_ms));
  auto mapper = std::make_unique<JobSetMapper>(event_db, cache_size);
  for (const auto &row : rows) {
    mapper->cache_.Put(Key(row.queue, row.job_set),
                       std::make_shared<const int64_t>(row.job_set_id));
  }
  ARMADA_LOG(INFO) << "Job set mapper initialised with " << rows.size() << " job sets";
  return mapper;
}

JobSetMapper::JobSetMapper(EventDbInterface &event_db, size_t cache_size)
    : event_db_(event_db), cache_(cache_size) {}

StatusOr<int64_t> JobSetMapper::Get(const std::string &queue, const std::string &job_set) {
  auto result = cache_.GetOrCreate(
      Key(queue, job_set),
      [this](const Key &key) -> StatusOr<std::shared_ptr<const int64_t>> {
        ARMADA_ASSIGN_OR_RETURN(int64_t id,
                                event_db_.GetOrCreateJobSetId(key.first, key.second));
        return std::make_shared<const int64_t>(id);
      });
  if (!result.ok()) {
    return result.status();
  }
  return **result;
}

}  // namespace armada
