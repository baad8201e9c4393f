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

#include "armada/store/run_record.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"

namespace armada {

const char kRunsTableSql[] = R"sql(
CREATE TABLE runs (
    run_id text PRIMARY KEY,
    job_id text NOT NULL,
    job_set_id bigint NOT NULL,
    queue text NOT NULL,
    cluster_id text NOT NULL,
    pool text NOT NULL,
    state text NOT NULL,
    reason text,
    priority_class int NOT NULL,
    priority double precision NOT NULL,
    issued_at_ms bigint NOT NULL,
    finished_at_ms bigint NOT NULL,
    succeeded boolean NOT NULL
);
)sql";

namespace {

struct ValueFormatter {
  std::string operator()(int64_t v) const { return absl::StrCat(v); }
  std::string operator()(double v) const { return absl::StrCat(v); }
  std::string operator()(bool v) const { return v ? "true" : "false"; }
  std::string operator()(const std::string &v) const {
    return absl::StrCat("'", absl::StrReplaceAll(v, {{"'", "''"}}), "'");
  }
};

}  // namespace

std::string RecordValueToString(const RecordValue &value) {
  return std::visit(ValueFormatter(), value);
}

Status ValidateRow(const TableSchema &schema, const RecordRow &row) {
  absl::flat_hash_set<std::string> names;
  for (const auto &[name, value] : row) {
    if (!schema.HasColumn(name)) {
      return Status::Invalid(
          absl::StrCat("table ", schema.name, " has no column ", name));
    }
    if (!names.insert(name).second) {
      return Status::Invalid(absl::StrCat("column ", name, " given twice"));
    }
  }
  std::vector<std::string> missing;
  for (const auto &column : schema.columns) {
    if (!names.contains(column)) {
      missing.push_back(column);
    }
  }
  if (!missing.empty()) {
    return Status::Invalid(absl::StrCat("table ", schema.name, " columns not set: ",
                                        absl::StrJoin(missing, ", ")));
  }
  return Status::OK();
}

RecordRow RunRecord::NamesValues() const {
  return {
      {"run_id", run_id},
      {"job_id", job_id},
      {"job_set_id", job_set_id},
      {"queue", queue},
      {"cluster_id", cluster_id},
      {"pool", pool},
      {"state", state},
      {"reason", reason},
      {"priority_class", int64_t{priority_class}},
      {"priority", priority},
      {"issued_at_ms", issued_at_ms},
      {"finished_at_ms", finished_at_ms},
      {"succeeded", succeeded},
  };
}

}  // namespace armada
