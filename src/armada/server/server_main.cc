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

#include <boost/asio.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "armada/common/armada_config.h"
#include "armada/server/lease_server.h"
#include "armada/util/logging.h"
#include "gflags/gflags.h"

DEFINE_int32(port, 50052, "The port of the lease server.");
DEFINE_string(config_list, "", "JSON object of config overrides.");
DEFINE_string(log_dir, "", "The path of the dir where log files are created.");
DEFINE_string(log_level, "info", "Minimum level that is logged.");
DEFINE_string(schema_dir, "", "Directory of the *.sql table schemas.");
DEFINE_string(record_dir, "", "Directory run records are written to.");
DEFINE_string(kid_mapping_dir, "", "Directory of kid -> cluster URL files.");
DEFINE_string(auth, "anonymous", "Authentication mode: anonymous or kubernetes.");
DEFINE_int32(handler_threads, 4, "Threads that handle calls.");

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  armada::ArmadaLogLevel log_level = armada::ArmadaLogLevel::INFO;
  if (!armada::ArmadaLog::ParseLogLevel(FLAGS_log_level, &log_level)) {
    std::fprintf(stderr, "Unknown log level %s\n", FLAGS_log_level.c_str());
    return EXIT_FAILURE;
  }
  const std::string app_name = "armada_lease_server";
  armada::ArmadaLog::StartArmadaLog(
      app_name,
      log_level,
      armada::ArmadaLog::GetLogFilepathFromDirectory(FLAGS_log_dir, app_name),
      /*log_rotation_max_size=*/100 * 1024 * 1024,
      /*log_rotation_file_num=*/10);
  armada::ArmadaLog::InstallFailureSignalHandler(argv[0]);

  ArmadaConfig::instance().initialize(FLAGS_config_list);

  armada::LeaseServerConfig config;
  config.grpc_server_port = static_cast<uint16_t>(FLAGS_port);
  config.handler_thread_num = static_cast<size_t>(FLAGS_handler_threads);
  config.auth = FLAGS_auth;
  config.kid_mapping_dir = FLAGS_kid_mapping_dir;
  config.schema_dir = FLAGS_schema_dir;
  config.record_dir = FLAGS_record_dir;
  gflags::ShutDownCommandLineFlags();

  // IO service for periodic work.
  boost::asio::io_context main_service;
  auto work = boost::asio::make_work_guard(main_service);

  armada::LeaseServer server(config, main_service);

  boost::asio::signal_set signals(main_service, SIGINT, SIGTERM);
  signals.async_wait([&main_service, &server, &work](const boost::system::error_code &error,
                                                     int signal_number) {
    if (error) {
      return;
    }
    ARMADA_LOG(INFO) << "Lease server received signal " << signal_number
                     << ", shutting down...";
    server.Stop();
    work.reset();
    main_service.stop();
  });

  armada::Status status = server.Start();
  if (!status.ok()) {
    ARMADA_LOG(ERROR) << "Failed to start lease server: " << status;
    armada::ArmadaLog::ShutDownArmadaLog();
    return EXIT_FAILURE;
  }

  main_service.run();
  armada::ArmadaLog::ShutDownArmadaLog();
  return EXIT_SUCCESS;
}
