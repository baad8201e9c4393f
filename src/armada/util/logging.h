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
//
// --------------------------------------------------------------
//
// ARMADA_LOG_EVERY_MS is adapted from
// https://github.com/google/glog/blob/master/src/glog/logging.h.in
//
// Copyright (c) 2008, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "armada/util/macros.h"

namespace armada {

inline constexpr std::string_view kLogKeyClusterID = "cluster_id";
inline constexpr std::string_view kLogKeyPool = "pool";
inline constexpr std::string_view kLogKeyJobID = "job_id";

enum class ArmadaLogLevel {
  TRACE = -2,
  DEBUG = -1,
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3
};

#define ARMADA_LOG_INTERNAL(level) ::armada::ArmadaLog(__FILE__, __LINE__, level)

#define ARMADA_LOG_ENABLED(level) \
  ::armada::ArmadaLog::IsLevelEnabled(::armada::ArmadaLogLevel::level)

#define ARMADA_LOG(level)                                                 \
  if (::armada::ArmadaLog::IsLevelEnabled(::armada::ArmadaLogLevel::level)) \
  ARMADA_LOG_INTERNAL(::armada::ArmadaLogLevel::level)

// `cond` is a `Status` class, could be `armada::Status`, or `grpc::Status`.
#define ARMADA_LOG_IF_ERROR(level, cond) \
  if (ARMADA_PREDICT_FALSE(!(cond).ok())) ARMADA_LOG(level)

#define ARMADA_IGNORE_EXPR(expr) ((void)(expr))

#define ARMADA_CHECK_WITH_DISPLAY(condition, display)                         \
  ARMADA_PREDICT_TRUE((condition))                                            \
  ? ARMADA_IGNORE_EXPR(0)                                                     \
  : ::armada::Voidify() &                                                     \
          ::armada::ArmadaLog(__FILE__, __LINE__, ::armada::ArmadaLogLevel::FATAL) \
              << " Check failed: " display " "

#define ARMADA_CHECK(condition) ARMADA_CHECK_WITH_DISPLAY(condition, #condition)

#ifdef NDEBUG

#define ARMADA_DCHECK(condition)                                              \
  ARMADA_PREDICT_TRUE((condition))                                            \
  ? ARMADA_IGNORE_EXPR(0)                                                     \
  : ::armada::Voidify() &                                                     \
          ::armada::ArmadaLog(__FILE__, __LINE__, ::armada::ArmadaLogLevel::ERROR) \
              << " Debug check failed: " #condition " "
#else

#define ARMADA_DCHECK(condition) ARMADA_CHECK(condition)

#endif  // NDEBUG

#define ARMADA_CHECK_OP(left, op, right)     \
  if (const auto &_left_ = (left); true)     \
    if (const auto &_right_ = (right); true) \
  ARMADA_CHECK(ARMADA_PREDICT_TRUE(_left_ op _right_)) << " " << _left_ << " vs " << _right_

#define ARMADA_CHECK_EQ(left, right) ARMADA_CHECK_OP(left, ==, right)
#define ARMADA_CHECK_NE(left, right) ARMADA_CHECK_OP(left, !=, right)
#define ARMADA_CHECK_LE(left, right) ARMADA_CHECK_OP(left, <=, right)
#define ARMADA_CHECK_LT(left, right) ARMADA_CHECK_OP(left, <, right)
#define ARMADA_CHECK_GE(left, right) ARMADA_CHECK_OP(left, >=, right)
#define ARMADA_CHECK_GT(left, right) ARMADA_CHECK_OP(left, >, right)

#define ARMADA_LOG_EVERY_N_VARNAME(base, line) ARMADA_LOG_EVERY_N_VARNAME_CONCAT(base, line)
#define ARMADA_LOG_EVERY_N_VARNAME_CONCAT(base, line) base##line

#define ARMADA_LOG_TIME_PERIOD ARMADA_LOG_EVERY_N_VARNAME(timePeriod_, __LINE__)
#define ARMADA_LOG_PREVIOUS_TIME_RAW ARMADA_LOG_EVERY_N_VARNAME(previousTimeRaw_, __LINE__)
#define ARMADA_LOG_TIME_DELTA ARMADA_LOG_EVERY_N_VARNAME(deltaTime_, __LINE__)
#define ARMADA_LOG_CURRENT_TIME ARMADA_LOG_EVERY_N_VARNAME(currentTime_, __LINE__)
#define ARMADA_LOG_PREVIOUS_TIME ARMADA_LOG_EVERY_N_VARNAME(previousTime_, __LINE__)

#define ARMADA_LOG_EVERY_MS(level, ms)                                                     \
  constexpr std::chrono::milliseconds ARMADA_LOG_TIME_PERIOD(ms);                          \
  static std::atomic<int64_t> ARMADA_LOG_PREVIOUS_TIME_RAW;                                \
  const auto ARMADA_LOG_CURRENT_TIME = std::chrono::steady_clock::now().time_since_epoch(); \
  const decltype(ARMADA_LOG_CURRENT_TIME) ARMADA_LOG_PREVIOUS_TIME(                        \
      ARMADA_LOG_PREVIOUS_TIME_RAW.load(std::memory_order_relaxed));                       \
  const auto ARMADA_LOG_TIME_DELTA = ARMADA_LOG_CURRENT_TIME - ARMADA_LOG_PREVIOUS_TIME;   \
  if (ARMADA_LOG_TIME_DELTA > ARMADA_LOG_TIME_PERIOD)                                      \
    ARMADA_LOG_PREVIOUS_TIME_RAW.store(ARMADA_LOG_CURRENT_TIME.count(),                    \
                                       std::memory_order_relaxed);                         \
  if (::armada::ArmadaLog::IsLevelEnabled(::armada::ArmadaLogLevel::level) &&              \
      ARMADA_LOG_TIME_DELTA > ARMADA_LOG_TIME_PERIOD)                                      \
  ARMADA_LOG_INTERNAL(::armada::ArmadaLogLevel::level)

// ArmadaLog is only a declaration here; logging.cc binds it to spdlog.
class ArmadaLog {
 public:
  ArmadaLog(const char *file_name, int line_number, ArmadaLogLevel severity);

  ~ArmadaLog();

  /// Return whether or not current logging instance is enabled.
  bool IsEnabled() const;

  bool IsFatal() const;

  /// Get filepath to dump log from [log_dir] and [app_name].
  /// If [log_dir] empty, return empty filepath.
  static std::string GetLogFilepathFromDirectory(const std::string &log_dir,
                                                 const std::string &app_name);

  /// The init function of armada log for a program which should be called only once.
  ///
  /// \param app_name The app name which starts the log.
  /// \param severity_threshold Logging threshold for the program. The environment
  /// variable ARMADA_LOG_LEVEL overrides it.
  /// \param log_filepath Logging output filepath. If empty, the log goes to stdout.
  /// \param log_rotation_max_size max bytes for of log rotation. 0 means no rotation.
  /// \param log_rotation_file_num max number of rotating log files.
  static void StartArmadaLog(const std::string &app_name,
                             ArmadaLogLevel severity_threshold = ArmadaLogLevel::INFO,
                             const std::string &log_filepath = "",
                             size_t log_rotation_max_size = 0,
                             size_t log_rotation_file_num = 1);

  /// The shutdown function which should be used with StartArmadaLog as a pair.
  /// If `StartArmadaLog` wasn't called before, it will be no-op.
  static void ShutDownArmadaLog();

  /// Install the failure signal handler to output call stack when crash.
  static void InstallFailureSignalHandler(const char *argv0);

  /// Return whether or not the log level is enabled in current setting.
  static bool IsLevelEnabled(ArmadaLogLevel log_level);

  /// Parse a level name such as "debug" or "WARNING". Returns false when unknown.
  static bool ParseLogLevel(std::string_view name, ArmadaLogLevel *level);

  static std::string GetLoggerName();

  template <typename T>
  ArmadaLog &operator<<(const T &t) {
    if (IsEnabled()) {
      msg_osstream_ << t;
    }
    return *this;
  }

  /// Add a key=value context pair to the log line.
  template <typename T>
  ArmadaLog &WithField(std::string_view key, const T &value) {
    if (IsEnabled()) {
      context_osstream_ << " " << key << "=" << value;
    }
    return *this;
  }

 private:
  static void InitSeverityThreshold(ArmadaLogLevel severity_threshold);

  /// True if log messages should be logged and false if they should be ignored.
  bool is_enabled_;
  ArmadaLogLevel severity_;
  bool is_fatal_ = false;
  std::ostringstream msg_osstream_;
  /// Key-value context appended after the message.
  std::ostringstream context_osstream_;

  static std::atomic<bool> initialized_;
  static ArmadaLogLevel severity_threshold_;
  static std::string app_name_;
  static bool is_failure_signal_handler_installed_;
  static std::string logger_name_;
};

// This class make ARMADA_CHECK compilation pass to change the << operator to void.
class Voidify {
 public:
  Voidify() {}
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(ArmadaLog &) {}
};

}  // namespace armada
