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

#include <memory>
#include <string>

#include "armada/auth/authenticator.h"
#include "armada/common/status.h"
#include "armada/lease/lease_admission.h"
#include "armada/lease/lease_lifecycle_manager.h"
#include "armada/lease/lease_session.h"
#include "armada/lease/session_registry.h"
#include "armada/util/io_service_pool.h"
#include "armada/util/macros.h"
#include "src/armada/protobuf/queue.grpc.pb.h"

namespace armada {

/// Value of the metadata `key` sent by the client, empty if absent.
std::string GetClientMetadata(const grpc::CallbackServerContext &context,
                              const std::string &key);

/// \class AggregatedQueueHandler
///
/// Serves the AggregatedQueue calls of authenticated executors. Every method may
/// be called concurrently.
class AggregatedQueueHandler {
 public:
  AggregatedQueueHandler(LeaseAdmission &admission,
                         LeaseLifecycleManager &lifecycle,
                         SessionRegistry &sessions);

  Status HandleLeaseJobs(const Principal &principal,
                         const rpc::LeaseRequest &request,
                         rpc::JobLease *reply);

  /// Reply with the ids that were renewed.
  Status HandleRenewLease(const Principal &principal,
                          const rpc::RenewLeaseRequest &request,
                          rpc::IdList *reply);

  Status HandleReturnLease(const Principal &principal,
                           const rpc::ReturnLeaseRequest &request,
                           google::protobuf::Empty *reply);

  /// Reply with the ids that are done.
  Status HandleReportDone(const Principal &principal,
                          const rpc::IdList &request,
                          rpc::IdList *reply);

  /// A session for one StreamingLeaseJobs call of `principal`.
  std::unique_ptr<LeaseSession> NewSession(const Principal &principal);

 private:
  LeaseAdmission &admission_;
  LeaseLifecycleManager &lifecycle_;
  SessionRegistry &sessions_;

  ARMADA_DISALLOW_COPY_AND_ASSIGN(AggregatedQueueHandler);
};

/// \class AggregatedQueueService
///
/// gRPC binding of AggregatedQueueHandler. Each call is authenticated and then
/// handled on an io_context of the pool, never on a gRPC thread.
class AggregatedQueueService final : public rpc::AggregatedQueue::CallbackService {
 public:
  AggregatedQueueService(IOServicePool &io_service_pool,
                         AggregatedQueueHandler &handler,
                         AuthenticatorInterface &authenticator)
      : io_service_pool_(io_service_pool),
        handler_(handler),
        authenticator_(authenticator) {}

  grpc::ServerUnaryReactor *LeaseJobs(grpc::CallbackServerContext *context,
                                      const rpc::LeaseRequest *request,
                                      rpc::JobLease *reply) override;

  grpc::ServerBidiReactor<rpc::StreamingLeaseRequest, rpc::StreamingJobLease>
      *StreamingLeaseJobs(grpc::CallbackServerContext *context) override;

  grpc::ServerUnaryReactor *RenewLease(grpc::CallbackServerContext *context,
                                       const rpc::RenewLeaseRequest *request,
                                       rpc::IdList *reply) override;

  grpc::ServerUnaryReactor *ReturnLease(grpc::CallbackServerContext *context,
                                        const rpc::ReturnLeaseRequest *request,
                                        google::protobuf::Empty *reply) override;

  grpc::ServerUnaryReactor *ReportDone(grpc::CallbackServerContext *context,
                                       const rpc::IdList *request,
                                       rpc::IdList *reply) override;

 private:
  template <typename Request, typename Reply>
  using HandlerMethod = Status (AggregatedQueueHandler::*)(const Principal &,
                                                           const Request &,
                                                           Reply *);

  template <typename Request, typename Reply>
  grpc::ServerUnaryReactor *HandleUnary(const char *method,
                                        grpc::CallbackServerContext *context,
                                        const Request *request,
                                        Reply *reply,
                                        HandlerMethod<Request, Reply> handle);

  IOServicePool &io_service_pool_;
  AggregatedQueueHandler &handler_;
  AuthenticatorInterface &authenticator_;
};

}  // namespace armada
