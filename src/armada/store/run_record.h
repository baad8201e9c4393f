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
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "armada/common/status.h"
#include "armada/store/schema_registry.h"

namespace armada {

using RecordValue = std::variant<int64_t, double, bool, std::string>;

/// Column name and value pairs, in column order.
using RecordRow = std::vector<std::pair<std::string, RecordValue>>;

/// SQL literal form of a value: strings quoted with '' escaping.
std::string RecordValueToString(const RecordValue &value);

/// Check that `row` names exactly the columns of `schema`.
Status ValidateRow(const TableSchema &schema, const RecordRow &row);

/// Schema of the runs table, used when no schema directory is configured.
extern const char kRunsTableSql[];

/// One finished lease, as written to the runs table.
struct RunRecord {
  static constexpr std::string_view kTableName = "runs";

  std::string run_id;
  std::string job_id;
  int64_t job_set_id = 0;
  std::string queue;
  std::string cluster_id;
  std::string pool;
  std::string state;
  std::string reason;
  int32_t priority_class = 0;
  double priority = 0;
  int64_t issued_at_ms = 0;
  int64_t finished_at_ms = 0;
  bool succeeded = false;

  RecordRow NamesValues() const;
};

}  // namespace armada
