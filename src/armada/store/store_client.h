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

#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status.h"
#include "armada/common/status_or.h"

namespace armada {

/// \class StoreClient
/// Abstract interface of a table/key/value store. Values are opaque strings,
/// usually serialized protobufs.
///
/// Calls are synchronous. A returned error means nothing was written.
class StoreClient {
 public:
  virtual ~StoreClient() = default;

  /// Write data to the given table, replacing any existing value.
  virtual Status Put(const std::string &table_name,
                     const std::string &key,
                     std::string data) = 0;

  /// Write several key/value pairs to one table atomically.
  virtual Status BatchPut(const std::string &table_name,
                          absl::flat_hash_map<std::string, std::string> data) = 0;

  /// Get data from the given table. Returns nullopt if the key is absent.
  virtual StatusOr<std::optional<std::string>> Get(const std::string &table_name,
                                                   const std::string &key) = 0;

  /// Get all data from the given table.
  virtual StatusOr<absl::flat_hash_map<std::string, std::string>> GetAll(
      const std::string &table_name) = 0;

  /// Delete one key. Deleting a missing key is not an error.
  virtual Status Delete(const std::string &table_name, const std::string &key) = 0;

  /// Delete keys from one table atomically. Returns the number deleted.
  virtual StatusOr<int64_t> BatchDelete(const std::string &table_name,
                                        const std::vector<std::string> &keys) = 0;

 protected:
  StoreClient() = default;
};

}  // namespace armada
