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
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "armada/store/run_record.h"
#include "armada/store/schema_registry.h"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace armada {

/// Destination of persisted records.
class RecordSinkInterface {
 public:
  virtual ~RecordSinkInterface() = default;

  /// Write one row. `row` must already be valid for `schema`.
  virtual Status Write(const TableSchema &schema, const RecordRow &row) = 0;
};

/// Keeps rows in memory, per table. This class is thread safe.
class InMemoryRecordSink : public RecordSinkInterface {
 public:
  Status Write(const TableSchema &schema, const RecordRow &row) override;

  std::vector<RecordRow> Rows(const std::string &table_name) const;

 private:
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, std::vector<RecordRow>> rows_ ABSL_GUARDED_BY(mutex_);
};

/// Appends one JSON object per row to `<log_dir>/records_<table>.log`, rotating
/// the file once it grows past `rotate_max_file_size_mb`.
class FileRecordSink : public RecordSinkInterface {
 public:
  FileRecordSink(const std::string &log_dir,
                 bool force_flush = true,
                 int rotate_max_file_size_mb = 100,
                 int rotate_max_file_num = 20);

  ~FileRecordSink() override;

  Status Write(const TableSchema &schema, const RecordRow &row) override;

  /// One-line JSON form of a row, e.g. {"table":"runs","job_id":"j1",...}.
  static std::string RowToString(const TableSchema &schema, const RecordRow &row);

 private:
  std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &table_name)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  std::string log_dir_;
  bool force_flush_;
  int rotate_max_file_size_mb_;
  int rotate_max_file_num_;

  absl::Mutex mutex_;
  absl::flat_hash_map<std::string, std::shared_ptr<spdlog::logger>> loggers_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace armada
