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

#include "armada/util/logging.h"

#include <execinfo.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace armada {

// Format pattern is [2020-08-21 17:00:00,000 I 100 1001] msg.
// %L is loglevel, %P is process id, %t for thread id.
constexpr char kLogFormatTextPattern[] = "[%Y-%m-%d %H:%M:%S,%e %L %P %t] %v";

ArmadaLogLevel ArmadaLog::severity_threshold_ = ArmadaLogLevel::INFO;
std::string ArmadaLog::app_name_ = "";                        // NOLINT
std::string ArmadaLog::logger_name_ = "armada_log_sink";      // NOLINT
bool ArmadaLog::is_failure_signal_handler_installed_ = false;
std::atomic<bool> ArmadaLog::initialized_ = false;

namespace {

std::string StackTrace() {
  static constexpr int kMaxNumFrames = 64;
  char buf[16 * 1024];
  void *frames[kMaxNumFrames];
  std::ostringstream os;
  const int num_frames = backtrace(frames, kMaxNumFrames);
  char **frame_symbols = backtrace_symbols(frames, num_frames);
  for (int i = 0; i < num_frames; ++i) {
    os << frame_symbols[i];
    if (absl::Symbolize(frames[i], buf, sizeof(buf))) {
      os << " " << buf;
    }
    os << "\n";
  }
  free(frame_symbols);
  return os.str();
}

inline const char *ConstBasename(const char *filepath) {
  const char *base = strrchr(filepath, '/');
  return base ? (base + 1) : filepath;
}

/// A logger that prints logs to stderr.
/// This is the default logger if logging is not initialized.
class DefaultStdErrLogger final {
 public:
  std::shared_ptr<spdlog::logger> GetDefaultLogger() { return default_stderr_logger_; }

  static DefaultStdErrLogger &Instance() {
    static DefaultStdErrLogger instance;
    return instance;
  }

 private:
  DefaultStdErrLogger() {
    default_stderr_logger_ = spdlog::stderr_color_mt("armada_stderr");
    default_stderr_logger_->set_pattern(kLogFormatTextPattern);
  }
  ~DefaultStdErrLogger() = default;
  DefaultStdErrLogger(DefaultStdErrLogger const &) = delete;
  DefaultStdErrLogger(DefaultStdErrLogger &&) = delete;
  std::shared_ptr<spdlog::logger> default_stderr_logger_;
};

spdlog::level::level_enum GetMappedSeverity(ArmadaLogLevel severity) {
  switch (severity) {
  case ArmadaLogLevel::TRACE:
    return spdlog::level::trace;
  case ArmadaLogLevel::DEBUG:
    return spdlog::level::debug;
  case ArmadaLogLevel::INFO:
    return spdlog::level::info;
  case ArmadaLogLevel::WARNING:
    return spdlog::level::warn;
  case ArmadaLogLevel::ERROR:
    return spdlog::level::err;
  case ArmadaLogLevel::FATAL:
    return spdlog::level::critical;
  }
  return spdlog::level::off;
}

void WriteFailureMessage(const char *data) {
  // The data represents one line failure message. Strip the trailing `\n`.
  if (nullptr != data) {
    ARMADA_LOG(ERROR) << std::string(data, strlen(data) - 1);
  }
  if (spdlog::default_logger()) {
    spdlog::default_logger()->flush();
  }
}

}  // namespace

bool ArmadaLog::ParseLogLevel(std::string_view name, ArmadaLogLevel *level) {
  const std::string data = absl::AsciiStrToLower(name);
  if (data == "trace") {
    *level = ArmadaLogLevel::TRACE;
  } else if (data == "debug") {
    *level = ArmadaLogLevel::DEBUG;
  } else if (data == "info") {
    *level = ArmadaLogLevel::INFO;
  } else if (data == "warning" || data == "warn") {
    *level = ArmadaLogLevel::WARNING;
  } else if (data == "error") {
    *level = ArmadaLogLevel::ERROR;
  } else if (data == "fatal") {
    *level = ArmadaLogLevel::FATAL;
  } else {
    return false;
  }
  return true;
}

void ArmadaLog::InitSeverityThreshold(ArmadaLogLevel severity_threshold) {
  const char *var_value = std::getenv("ARMADA_LOG_LEVEL");
  if (var_value != nullptr) {
    if (!ParseLogLevel(var_value, &severity_threshold)) {
      ARMADA_LOG(WARNING) << "Unrecognized setting of ARMADA_LOG_LEVEL=" << var_value;
    }
  }
  severity_threshold_ = severity_threshold;
}

/*static*/ std::string ArmadaLog::GetLogFilepathFromDirectory(
    const std::string &log_dir, const std::string &app_name) {
  if (log_dir.empty()) {
    return "";
  }
  return (std::filesystem::path(log_dir) /
          absl::StrFormat("%s_%d.log", app_name, static_cast<int>(getpid())))
      .string();
}

/*static*/ void ArmadaLog::StartArmadaLog(const std::string &app_name,
                                          ArmadaLogLevel severity_threshold,
                                          const std::string &log_filepath,
                                          size_t log_rotation_max_size,
                                          size_t log_rotation_file_num) {
  InitSeverityThreshold(severity_threshold);
  app_name_ = std::filesystem::path(app_name).filename().string();
  if (app_name_.empty()) {
    app_name_ = "armada";
  }

  std::array<spdlog::sink_ptr, 2> sinks;
  auto level = GetMappedSeverity(severity_threshold_);

  if (spdlog::get(GetLoggerName())) {
    // Drop the old logger first so a restart can reconfigure the sinks.
    spdlog::drop(GetLoggerName());
  }

  if (!log_filepath.empty()) {
    spdlog::sink_ptr file_sink;
    if (log_rotation_max_size == 0) {
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_filepath);
    } else {
      file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_filepath, log_rotation_max_size, log_rotation_file_num);
    }
    file_sink->set_level(level);
    sinks[0] = std::move(file_sink);
  } else {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks[0] = std::move(console_sink);
  }

  // Errors always reach stderr as well.
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_level(spdlog::level::err);
  sinks[1] = std::move(err_sink);

  auto logger = std::make_shared<spdlog::logger>(GetLoggerName(),
                                                 std::make_move_iterator(sinks.begin()),
                                                 std::make_move_iterator(sinks.end()));
  logger->set_level(level);
  logger->set_pattern(kLogFormatTextPattern);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
  initialized_ = true;
}

void ArmadaLog::ShutDownArmadaLog() {
  if (!initialized_) {
    return;
  }
  if (spdlog::default_logger()) {
    spdlog::default_logger()->flush();
  }
  spdlog::drop(GetLoggerName());
  initialized_ = false;
}

void ArmadaLog::InstallFailureSignalHandler(const char *argv0) {
  if (is_failure_signal_handler_installed_) {
    return;
  }
  absl::InitializeSymbolizer(argv0);
  absl::FailureSignalHandlerOptions options;
  options.writerfn = WriteFailureMessage;
  absl::InstallFailureSignalHandler(options);
  is_failure_signal_handler_installed_ = true;
}

bool ArmadaLog::IsLevelEnabled(ArmadaLogLevel log_level) {
  return log_level >= severity_threshold_;
}

std::string ArmadaLog::GetLoggerName() { return logger_name_; }

ArmadaLog::ArmadaLog(const char *file_name, int line_number, ArmadaLogLevel severity)
    : is_enabled_(severity >= severity_threshold_),
      severity_(severity),
      is_fatal_(severity == ArmadaLogLevel::FATAL) {
  if (is_enabled_) {
    msg_osstream_ << ConstBasename(file_name) << ":" << line_number << ": ";
  }
}

bool ArmadaLog::IsEnabled() const { return is_enabled_; }

bool ArmadaLog::IsFatal() const { return is_fatal_; }

ArmadaLog::~ArmadaLog() {
  if (IsFatal()) {
    msg_osstream_ << "\n*** StackTrace Information ***\n" << StackTrace();
  }
  if (is_enabled_) {
    auto logger = spdlog::get(GetLoggerName());
    if (!logger) {
      logger = DefaultStdErrLogger::Instance().GetDefaultLogger();
    }
    logger->log(GetMappedSeverity(severity_),
                /*fmt*/ "{}{}",
                msg_osstream_.str(),
                context_osstream_.str());
    logger->flush();
  }
  if (severity_ == ArmadaLogLevel::FATAL) {
    std::_Exit(EXIT_FAILURE);
  }
}

}  // namespace armada
