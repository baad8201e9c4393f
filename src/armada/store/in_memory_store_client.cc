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

#include "armada/store/in_memory_store_client.h"

#include <utility>

namespace armada {

Status InMemoryStoreClient::CheckInjectedFailure() {
  ++num_calls_;
  if (injected_count_ > 0) {
    --injected_count_;
    return injected_status_;
  }
  return Status::OK();
}

Status InMemoryStoreClient::Put(const std::string &table_name,
                                const std::string &key,
                                std::string data) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  tables_[table_name][key] = std::move(data);
  return Status::OK();
}

Status InMemoryStoreClient::BatchPut(const std::string &table_name,
                                     absl::flat_hash_map<std::string, std::string> data) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  auto &table = tables_[table_name];
  for (auto &[key, value] : data) {
    table[key] = std::move(value);
  }
  return Status::OK();
}

StatusOr<std::optional<std::string>> InMemoryStoreClient::Get(
    const std::string &table_name, const std::string &key) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  auto table_it = tables_.find(table_name);
  if (table_it == tables_.end()) {
    return std::optional<std::string>();
  }
  auto it = table_it->second.find(key);
  if (it == table_it->second.end()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(it->second);
}

StatusOr<absl::flat_hash_map<std::string, std::string>> InMemoryStoreClient::GetAll(
    const std::string &table_name) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  auto table_it = tables_.find(table_name);
  if (table_it == tables_.end()) {
    return absl::flat_hash_map<std::string, std::string>();
  }
  return table_it->second;
}

Status InMemoryStoreClient::Delete(const std::string &table_name,
                                   const std::string &key) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  auto table_it = tables_.find(table_name);
  if (table_it != tables_.end()) {
    table_it->second.erase(key);
  }
  return Status::OK();
}

StatusOr<int64_t> InMemoryStoreClient::BatchDelete(const std::string &table_name,
                                                   const std::vector<std::string> &keys) {
  absl::MutexLock lock(&mutex_);
  ARMADA_RETURN_NOT_OK(CheckInjectedFailure());
  auto table_it = tables_.find(table_name);
  if (table_it == tables_.end()) {
    return int64_t{0};
  }
  int64_t num_deleted = 0;
  for (const auto &key : keys) {
    num_deleted += table_it->second.erase(key);
  }
  return num_deleted;
}

void InMemoryStoreClient::FailNext(Status status, int count) {
  absl::MutexLock lock(&mutex_);
  injected_status_ = std::move(status);
  injected_count_ = count;
}

void InMemoryStoreClient::ClearFailures() {
  absl::MutexLock lock(&mutex_);
  injected_count_ = 0;
}

int64_t InMemoryStoreClient::NumCalls() const {
  absl::MutexLock lock(&mutex_);
  return num_calls_;
}

}  // namespace armada
