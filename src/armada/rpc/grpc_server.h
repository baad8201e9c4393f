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

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace armada {

/// \class GrpcCallbackServer
///
/// Hosts callback-API services on one TCP port. Register services, then `Run`.
class GrpcCallbackServer {
 public:
  /// \param name Used for logging.
  /// \param port Port to bind. 0 picks a free port; see `GetPort` after `Run`.
  /// \param shutdown_deadline_ms In-flight calls are cancelled once this deadline
  /// passes during shutdown.
  GrpcCallbackServer(std::string name, uint32_t port, int64_t shutdown_deadline_ms = 0);

  ~GrpcCallbackServer() { Shutdown(); }

  void Run();

  void Shutdown();

  /// Block until the server shuts down.
  void Wait();

  int GetPort() const { return port_; }

  /// Register a service. Multiple services can share the server. Must be called
  /// before `Run`.
  void RegisterService(grpc::Service &service);

 private:
  const std::string name_;
  int port_;
  bool is_closed_ = true;
  std::vector<std::reference_wrapper<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> server_;
  const int64_t shutdown_deadline_ms_;
};

}  // namespace armada
