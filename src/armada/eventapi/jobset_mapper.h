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

#include "armada/common/status_or.h"
#include "armada/eventapi/event_db.h"
#include "armada/util/shared_lru.h"

namespace armada {

/// \class JobSetMapper
///
/// Maps (queue, job set) to the numeric job-set id of the event database,
/// through a bounded LRU cache. Concurrent misses on the same key share one
/// database call. Failed lookups are not cached.
class JobSetMapper {
 public:
  /// Build a mapper and warm its cache with the job sets created in the last
  /// `initialise_since_ms` milliseconds.
  static StatusOr<std::unique_ptr<JobSetMapper>> Create(EventDbInterface &event_db,
                                                        size_t cache_size,
                                                        int64_t initialise_since_ms,
                                                        int64_t now_ms);

  JobSetMapper(EventDbInterface &event_db, size_t cache_size);

  StatusOr<int64_t> Get(const std::string &queue, const std::string &job_set);

  size_t CacheSize() { return cache_.size(); }

 private:
  using Key = std::pair<std::string, std::string>;

  EventDbInterface &event_db_;
  ThreadSafeSharedLruCache<Key, const int64_t> cache_;
};

}  // namespace armada
