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

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include "armada/store/store_client.h"
#include "src/armada/protobuf/lease_record.pb.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

/// \class StoreTable
///
/// Typed view of one table of a StoreClient. Values are protobuf messages
/// stored in their serialized form.
template <typename Data>
class StoreTable {
 public:
  StoreTable(std::shared_ptr<StoreClient> store_client, std::string table_name)
      : table_name_(std::move(table_name)), store_client_(std::move(store_client)) {}

  virtual ~StoreTable() = default;

  Status Put(const std::string &key, const Data &value) {
    return store_client_->Put(table_name_, key, value.SerializeAsString());
  }

  Status BatchPut(const std::vector<std::pair<std::string, const Data *>> &values) {
    absl::flat_hash_map<std::string, std::string> data;
    for (const auto &[key, value] : values) {
      data[key] = value->SerializeAsString();
    }
    return store_client_->BatchPut(table_name_, std::move(data));
  }

  StatusOr<std::optional<Data>> Get(const std::string &key) {
    ARMADA_ASSIGN_OR_RETURN(auto serialized, store_client_->Get(table_name_, key));
    if (!serialized.has_value()) {
      return std::optional<Data>();
    }
    Data value;
    if (!value.ParseFromString(*serialized)) {
      return Status::IOError(absl::StrCat("corrupt entry ", key, " in table ", table_name_));
    }
    return std::optional<Data>(std::move(value));
  }

  /// Entries that fail to parse are reported as an IOError.
  StatusOr<absl::flat_hash_map<std::string, Data>> GetAll() {
    ARMADA_ASSIGN_OR_RETURN(auto entries, store_client_->GetAll(table_name_));
    absl::flat_hash_map<std::string, Data> result;
    result.reserve(entries.size());
    for (const auto &[key, serialized] : entries) {
      Data value;
      if (!value.ParseFromString(serialized)) {
        return Status::IOError(
            absl::StrCat("corrupt entry ", key, " in table ", table_name_));
      }
      result.emplace(key, std::move(value));
    }
    return result;
  }

  Status Delete(const std::string &key) { return store_client_->Delete(table_name_, key); }

  Status BatchDelete(const std::vector<std::string> &keys) {
    return store_client_->BatchDelete(table_name_, keys).status();
  }

  const std::string &TableName() const { return table_name_; }

 protected:
  std::string table_name_;
  std::shared_ptr<StoreClient> store_client_;
};

class LeaseTable : public StoreTable<rpc::LeaseRecord> {
 public:
  explicit LeaseTable(std::shared_ptr<StoreClient> store_client)
      : StoreTable(std::move(store_client), "LEASE") {}
};

class JobTable : public StoreTable<rpc::Job> {
 public:
  explicit JobTable(std::shared_ptr<StoreClient> store_client)
      : StoreTable(std::move(store_client), "JOB") {}
};

/// Keyed by "<cluster_id>/<pool>".
class SchedulingInfoTable : public StoreTable<rpc::ClusterSchedulingInfoReport> {
 public:
  explicit SchedulingInfoTable(std::shared_ptr<StoreClient> store_client)
      : StoreTable(std::move(store_client), "SCHEDULING_INFO") {}

  static std::string Key(const std::string &cluster_id, const std::string &pool) {
    return absl::StrCat(cluster_id, "/", pool);
  }
};

/// \class LeaseTableStorage
///
/// All tables the lease server persists. Keys of the lease table are job ids.
class LeaseTableStorage {
 public:
  explicit LeaseTableStorage(std::shared_ptr<StoreClient> store_client)
      : store_client_(std::move(store_client)),
        lease_table_(store_client_),
        job_table_(store_client_),
        scheduling_info_table_(store_client_) {}

  LeaseTable &Leases() { return lease_table_; }
  JobTable &Jobs() { return job_table_; }
  SchedulingInfoTable &SchedulingInfo() { return scheduling_info_table_; }

 private:
  std::shared_ptr<StoreClient> store_client_;
  LeaseTable lease_table_;
  JobTable job_table_;
  SchedulingInfoTable scheduling_info_table_;
};

}  // namespace armada
