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

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>

#include "armada/auth/authenticator.h"
#include "armada/auth/kubernetes_token_authenticator.h"
#include "armada/eventapi/in_memory_event_db.h"
#include "armada/eventapi/jobset_mapper.h"
#include "armada/lease/lease_admission.h"
#include "armada/lease/lease_lifecycle_manager.h"
#include "armada/lease/queue_fairness_oracle.h"
#include "armada/lease/run_recorder.h"
#include "armada/lease/session_registry.h"
#include "armada/rpc/aggregated_queue_server.h"
#include "armada/rpc/grpc_server.h"
#include "armada/scheduling/priority_resource_accountant.h"
#include "armada/scheduling/queue_leased_report_aggregator.h"
#include "armada/store/in_memory_store_client.h"
#include "armada/store/record_sink.h"
#include "armada/store/schema_registry.h"
#include "armada/store/store_tables.h"
#include "armada/util/io_service_pool.h"
#include "armada/util/periodical_runner.h"

namespace armada {

struct LeaseServerConfig {
  std::string grpc_server_name = "LeaseServer";
  uint16_t grpc_server_port = 0;
  /// Threads that authenticate and handle calls.
  size_t handler_thread_num = 4;
  /// `anonymous` or `kubernetes`.
  std::string auth = "anonymous";
  /// kid -> cluster URL files, for kubernetes auth.
  std::string kid_mapping_dir;
  /// Directory of `*.sql` table schemas. Run records are off when empty.
  std::string schema_dir;
  /// Directory run records are appended to. Run records are off when empty.
  std::string record_dir;
};

/// \class LeaseServer
///
/// Wires the lease components together and serves them over gRPC. Periodic work
/// (lease expiry, pruning, token cache sweeps) runs on `main_service`.
class LeaseServer {
 public:
  LeaseServer(const LeaseServerConfig &config, boost::asio::io_context &main_service);

  ~LeaseServer();

  /// Recover persisted state, then start serving.
  Status Start();

  void Stop();

  int GetPort() const { return grpc_server_.GetPort(); }

  QueueFairnessOracle &oracle() { return oracle_; }

  LeaseLifecycleManager &lifecycle() { return lifecycle_; }

 private:
  Status InitAuthenticator();

  /// Build the run recorder if run records are configured.
  Status InitRunRecorder();

  void InstallListeners();

  void StartPeriodicalTasks();

  void OnLeaseIssued(const Lease &lease);

  void OnLeaseFinished(const Lease &lease);

  const LeaseServerConfig config_;
  boost::asio::io_context &main_service_;
  bool is_started_ = false;
  bool is_stopped_ = false;

  std::shared_ptr<InMemoryStoreClient> store_client_;
  LeaseTableStorage storage_;
  AccountantRegistry accountants_;
  QueueLeasedReportAggregator aggregator_;
  LeaseLifecycleManager lifecycle_;
  QueueFairnessOracle oracle_;
  LeaseAdmission admission_;
  SessionRegistry sessions_;

  SchemaRegistry schemas_;
  InMemoryEventDb event_db_;
  std::unique_ptr<JobSetMapper> job_sets_;
  std::unique_ptr<RecordSinkInterface> record_sink_;
  std::unique_ptr<RunRecorder> run_recorder_;

  std::unique_ptr<AuthenticatorInterface> authenticator_;
  /// Same object as `authenticator_` when kubernetes auth is on.
  KubernetesTokenAuthenticator *token_authenticator_ = nullptr;

  AggregatedQueueHandler handler_;
  IOServicePool handler_io_service_pool_;
  std::unique_ptr<AggregatedQueueService> service_;
  GrpcCallbackServer grpc_server_;
  std::shared_ptr<PeriodicalRunner> periodical_runner_;
};

}  // namespace armada
