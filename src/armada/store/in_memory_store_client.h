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
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/store/store_client.h"

namespace armada {

/// \class InMemoryStoreClient
/// Please refer to StoreClient for API semantics.
///
/// Failures can be injected so callers' rollback paths can be exercised.
/// This class is thread safe.
class InMemoryStoreClient : public StoreClient {
 public:
  InMemoryStoreClient() = default;

  Status Put(const std::string &table_name,
             const std::string &key,
             std::string data) override;

  Status BatchPut(const std::string &table_name,
                  absl::flat_hash_map<std::string, std::string> data) override;

  StatusOr<std::optional<std::string>> Get(const std::string &table_name,
                                           const std::string &key) override;

  StatusOr<absl::flat_hash_map<std::string, std::string>> GetAll(
      const std::string &table_name) override;

  Status Delete(const std::string &table_name, const std::string &key) override;

  StatusOr<int64_t> BatchDelete(const std::string &table_name,
                                const std::vector<std::string> &keys) override;

  /// Make the next `count` calls fail with `status`. Writes that fail leave
  /// the tables untouched.
  void FailNext(Status status, int count = 1) ABSL_LOCKS_EXCLUDED(mutex_);

  void ClearFailures() ABSL_LOCKS_EXCLUDED(mutex_);

  /// Number of calls made so far, failed or not.
  int64_t NumCalls() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  Status CheckInjectedFailure() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, absl::flat_hash_map<std::string, std::string>> tables_
      ABSL_GUARDED_BY(mutex_);
  Status injected_status_ ABSL_GUARDED_BY(mutex_);
  int injected_count_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t num_calls_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace armada
