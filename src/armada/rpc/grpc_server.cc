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

#include "armada/rpc/grpc_server.h"

#include <utility>

#include "armada/common/armada_config.h"
#include "armada/util/logging.h"

namespace armada {

GrpcCallbackServer::GrpcCallbackServer(std::string name,
                                       uint32_t port,
                                       int64_t shutdown_deadline_ms)
    : name_(std::move(name)), port_(port), shutdown_deadline_ms_(shutdown_deadline_ms) {}

void GrpcCallbackServer::Run() {
  const int specified_port = port_;
  const std::string server_address = "0.0.0.0:" + std::to_string(port_);
  grpc::ServerBuilder builder;
  // Two servers must never share a port.
  builder.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);
  builder.SetMaxSendMessageSize(
      static_cast<int>(ArmadaConfig::instance().max_grpc_message_size()));
  builder.SetMaxReceiveMessageSize(
      static_cast<int>(ArmadaConfig::instance().max_grpc_message_size()));
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &port_);
  if (services_.empty()) {
    ARMADA_LOG(WARNING) << "No service is registered with grpc server " << name_;
  }
  for (auto &entry : services_) {
    builder.RegisterService(&entry.get());
  }
  server_ = builder.BuildAndStart();

  ARMADA_CHECK(server_) << "Failed to start the grpc server " << name_ << " on port "
                        << specified_port
                        << ". If the port is already in use, run lsof -i :"
                        << specified_port << " to find the process holding it.";
  ARMADA_CHECK(port_ > 0);
  ARMADA_LOG(INFO) << name_ << " server started, listening on port " << port_ << ".";
  is_closed_ = false;
}

void GrpcCallbackServer::Shutdown() {
  if (is_closed_) {
    return;
  }
  auto deadline = gpr_time_add(gpr_now(GPR_CLOCK_REALTIME),
                               gpr_time_from_millis(shutdown_deadline_ms_, GPR_TIMESPAN));
  server_->Shutdown(deadline);
  is_closed_ = true;
  ARMADA_LOG(INFO) << "gRPC server of " << name_ << " shutdown.";
}

void GrpcCallbackServer::Wait() {
  if (server_) {
    server_->Wait();
  }
}

void GrpcCallbackServer::RegisterService(grpc::Service &service) {
  services_.emplace_back(service);
}

}  // namespace armada
