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

#include "armada/store/record_sink.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "armada/util/logging.h"
#include "nlohmann/json.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/spdlog.h"

using json = nlohmann::json;

namespace armada {

Status InMemoryRecordSink::Write(const TableSchema &schema, const RecordRow &row) {
  absl::MutexLock lock(&mutex_);
  rows_[schema.name].push_back(row);
  return Status::OK();
}

std::vector<RecordRow> InMemoryRecordSink::Rows(const std::string &table_name) const {
  absl::MutexLock lock(&mutex_);
  auto it = rows_.find(table_name);
  if (it == rows_.end()) {
    return {};
  }
  return it->second;
}

FileRecordSink::FileRecordSink(const std::string &log_dir,
                               bool force_flush,
                               int rotate_max_file_size_mb,
                               int rotate_max_file_num)
    : log_dir_(log_dir),
      force_flush_(force_flush),
      rotate_max_file_size_mb_(rotate_max_file_size_mb),
      rotate_max_file_num_(rotate_max_file_num) {
  ARMADA_CHECK(!log_dir_.empty());
  if (log_dir_.back() != '/') {
    log_dir_ += '/';
  }
}

FileRecordSink::~FileRecordSink() {
  absl::MutexLock lock(&mutex_);
  for (auto &[table, logger] : loggers_) {
    logger->flush();
    spdlog::drop(logger->name());
  }
}

std::shared_ptr<spdlog::logger> FileRecordSink::GetOrCreateLogger(
    const std::string &table_name) {
  auto it = loggers_.find(table_name);
  if (it != loggers_.end()) {
    return it->second;
  }
  const std::string file_name = absl::StrCat(log_dir_, "records_", table_name, ".log");
  const std::string logger_key = absl::StrCat("record.sink.", file_name);
  auto logger = spdlog::get(logger_key);
  if (logger == nullptr) {
    logger = spdlog::rotating_logger_mt(logger_key,
                                        file_name,
                                        1048576 * rotate_max_file_size_mb_,
                                        rotate_max_file_num_);
  }
  logger->set_pattern("%v");
  loggers_.emplace(table_name, logger);
  return logger;
}

std::string FileRecordSink::RowToString(const TableSchema &schema, const RecordRow &row) {
  json j;
  j["table"] = schema.name;
  for (const auto &[name, value] : row) {
    std::visit([&j, &name = name](const auto &v) { j[name] = v; }, value);
  }
  return j.dump();
}

Status FileRecordSink::Write(const TableSchema &schema, const RecordRow &row) {
  std::shared_ptr<spdlog::logger> logger;
  {
    absl::MutexLock lock(&mutex_);
    try {
      logger = GetOrCreateLogger(schema.name);
    } catch (const spdlog::spdlog_ex &e) {
      return Status::IOError(
          absl::StrCat("failed to open record file for ", schema.name, ": ", e.what()));
    }
  }
  logger->info(RowToString(schema, row));
  if (force_flush_) {
    logger->flush();
  }
  return Status::OK();
}

}  // namespace armada
