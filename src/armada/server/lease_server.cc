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

#include "armada/server/lease_server.h"

#include <utility>
#include <vector>

#include "armada/auth/token_reviewer.h"
#include "armada/common/armada_config.h"
#include "armada/util/logging.h"

namespace armada {

LeaseServer::LeaseServer(const LeaseServerConfig &config,
                         boost::asio::io_context &main_service)
    : config_(config),
      main_service_(main_service),
      store_client_(std::make_shared<InMemoryStoreClient>()),
      storage_(store_client_),
      lifecycle_(accountants_, storage_, ArmadaConfig::instance().lease_timeout_ms()),
      oracle_(aggregator_,
              storage_,
              LowerPriorityValueFirst,
              ArmadaConfig::instance().scheduler_name()),
      admission_(accountants_, aggregator_, lifecycle_, oracle_, storage_),
      handler_(admission_, lifecycle_, sessions_),
      handler_io_service_pool_(config.handler_thread_num),
      grpc_server_(config.grpc_server_name,
                   config.grpc_server_port,
                   ArmadaConfig::instance().grpc_shutdown_deadline_ms()),
      periodical_runner_(PeriodicalRunner::Create(main_service)) {}

LeaseServer::~LeaseServer() { Stop(); }

Status LeaseServer::InitAuthenticator() {
  if (config_.auth == "anonymous") {
    ARMADA_LOG(WARNING) << "Authentication is off, every caller is anonymous";
    authenticator_ = std::make_unique<AnonymousAuthenticator>();
    return Status::OK();
  }
  if (config_.auth == "kubernetes") {
    if (config_.kid_mapping_dir.empty()) {
      return Status::Invalid("kubernetes auth needs a kid mapping directory");
    }
    auto authenticator = std::make_unique<KubernetesTokenAuthenticator>(
        config_.kid_mapping_dir,
        std::make_shared<KubernetesTokenReviewer>(
            ArmadaConfig::instance().token_review_timeout_ms()),
        ArmadaConfig::instance().invalid_token_ttl_ms(),
        ArmadaConfig::instance().valid_token_max_ttl_ms());
    token_authenticator_ = authenticator.get();
    authenticator_ = std::move(authenticator);
    return Status::OK();
  }
  return Status::Invalid("unknown auth mode " + config_.auth);
}

Status LeaseServer::InitRunRecorder() {
  if (!ArmadaConfig::instance().record_runs() || config_.schema_dir.empty() ||
      config_.record_dir.empty()) {
    ARMADA_LOG(INFO) << "Run records are off";
    return Status::OK();
  }
  ARMADA_RETURN_NOT_OK(schemas_.LoadDirectory(config_.schema_dir));
  ARMADA_ASSIGN_OR_RETURN(
      job_sets_,
      JobSetMapper::Create(event_db_,
                           ArmadaConfig::instance().jobset_cache_size(),
                           ArmadaConfig::instance().jobset_cache_warmup_ms(),
                           current_sys_time_ms()));
  record_sink_ = std::make_unique<FileRecordSink>(config_.record_dir);
  ARMADA_ASSIGN_OR_RETURN(run_recorder_,
                          RunRecorder::Create(schemas_, *job_sets_, *record_sink_));
  ARMADA_LOG(INFO) << "Run records are written to " << config_.record_dir;
  return Status::OK();
}

void LeaseServer::OnLeaseIssued(const Lease &lease) {
  aggregator_.RecordLeased(lease.cluster_id, lease.job_id, lease.job->queue(),
                           lease.resources);
  // Leases issued by admission are claimed already; recovered ones are not.
  auto claimed = oracle_.MarkLeased(lease.cluster_id, {lease.job_id});
  ARMADA_LOG_IF_ERROR(WARNING, claimed.status())
          .WithField(kLogKeyJobID, lease.job_id)
      << "Failed to claim leased job: " << claimed.status();
}

void LeaseServer::OnLeaseFinished(const Lease &lease) {
  aggregator_.RecordReleased(lease.cluster_id, lease.job_id);
  if (lease.state == LeaseState::kDone) {
    oracle_.Remove(lease.job_id);
  } else {
    oracle_.Requeue(lease.job_id);
  }
  if (run_recorder_ != nullptr) {
    run_recorder_->OnLeaseFinished(lease);
  }
}

void LeaseServer::InstallListeners() {
  lifecycle_.AddLeaseIssuedListener([this](const Lease &lease) { OnLeaseIssued(lease); });
  lifecycle_.AddLeaseFinishedListener(
      [this](const Lease &lease) { OnLeaseFinished(lease); });
}

void LeaseServer::StartPeriodicalTasks() {
  periodical_runner_->RunFnPeriodically(
      [this] {
        size_t expired = lifecycle_.ExpireLeases();
        if (expired > 0) {
          ARMADA_LOG(INFO) << "Expired " << expired << " leases";
        }
        lifecycle_.PruneTerminal(ArmadaConfig::instance().terminal_lease_retention_ms());
      },
      ArmadaConfig::instance().lease_expiry_check_period_ms(),
      "LeaseServer.ExpireLeases");
  if (token_authenticator_ != nullptr) {
    periodical_runner_->RunFnPeriodically(
        [this] {
          size_t swept = token_authenticator_->SweepCache();
          ARMADA_LOG(DEBUG) << "Swept " << swept << " token cache entries";
        },
        ArmadaConfig::instance().token_cache_sweep_period_ms(),
        "LeaseServer.SweepTokenCache");
  }
}

Status LeaseServer::Start() {
  ARMADA_CHECK(!is_started_);
  ARMADA_RETURN_NOT_OK(InitAuthenticator());
  ARMADA_RETURN_NOT_OK(InitRunRecorder());
  InstallListeners();

  // Jobs first, so recovered leases can claim them.
  ARMADA_ASSIGN_OR_RETURN(size_t num_jobs, oracle_.Recover());
  ARMADA_ASSIGN_OR_RETURN(size_t num_leases, lifecycle_.Recover());
  ARMADA_LOG(INFO) << "Recovered " << num_jobs << " jobs and " << num_leases
                   << " leases";

  handler_io_service_pool_.Run();
  service_ = std::make_unique<AggregatedQueueService>(
      handler_io_service_pool_, handler_, *authenticator_);
  grpc_server_.RegisterService(*service_);
  grpc_server_.Run();
  StartPeriodicalTasks();
  is_started_ = true;
  return Status::OK();
}

void LeaseServer::Stop() {
  if (!is_started_ || is_stopped_) {
    return;
  }
  ARMADA_LOG(INFO) << "Stopping lease server";
  grpc_server_.Shutdown();
  handler_io_service_pool_.Stop();
  is_stopped_ = true;
}

}  // namespace armada
