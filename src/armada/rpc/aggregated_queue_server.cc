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

#include "armada/rpc/aggregated_queue_server.h"

#include <boost/asio/post.hpp>
#include <utility>
#include <vector>

#include "armada/common/grpc_util.h"
#include "armada/rpc/lease_stream_reactor.h"
#include "armada/util/logging.h"

namespace armada {

std::string GetClientMetadata(const grpc::CallbackServerContext &context,
                              const std::string &key) {
  const auto &metadata = context.client_metadata();
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return "";
  }
  return std::string(it->second.data(), it->second.length());
}

AggregatedQueueHandler::AggregatedQueueHandler(LeaseAdmission &admission,
                                               LeaseLifecycleManager &lifecycle,
                                               SessionRegistry &sessions)
    : admission_(admission), lifecycle_(lifecycle), sessions_(sessions) {}

Status AggregatedQueueHandler::HandleLeaseJobs(const Principal &principal,
                                               const rpc::LeaseRequest &request,
                                               rpc::JobLease *reply) {
  ARMADA_RETURN_NOT_OK(LeaseSession::LeaseOnce(admission_, lifecycle_, request, reply));
  ARMADA_LOG(DEBUG)
          .WithField(kLogKeyClusterID, request.cluster_id())
          .WithField(kLogKeyPool, request.pool())
      << "Leased " << reply->job_size() << " jobs to " << principal.name;
  return Status::OK();
}

Status AggregatedQueueHandler::HandleRenewLease(const Principal &principal,
                                                const rpc::RenewLeaseRequest &request,
                                                rpc::IdList *reply) {
  if (request.cluster_id().empty()) {
    return Status::Invalid("RenewLease without cluster_id");
  }
  std::vector<std::string> renewed =
      lifecycle_.Renew(request.cluster_id(), VectorFromProtobuf(request.ids()));
  if (renewed.size() != static_cast<size_t>(request.ids_size())) {
    ARMADA_LOG(INFO).WithField(kLogKeyClusterID, request.cluster_id())
        << "Renewed " << renewed.size() << " of " << request.ids_size()
        << " leases, the others are lost";
  }
  AddToProtobuf(renewed, reply->mutable_ids());
  return Status::OK();
}

Status AggregatedQueueHandler::HandleReturnLease(const Principal &principal,
                                                 const rpc::ReturnLeaseRequest &request,
                                                 google::protobuf::Empty *reply) {
  if (request.cluster_id().empty() || request.job_id().empty()) {
    return Status::Invalid("ReturnLease needs cluster_id and job_id");
  }
  LabelPairs avoid_node_labels;
  avoid_node_labels.reserve(request.avoid_node_labels().entries_size());
  for (const auto &entry : request.avoid_node_labels().entries()) {
    avoid_node_labels.emplace_back(entry.key(), entry.value());
  }
  return lifecycle_.Return(
      request.cluster_id(), request.job_id(), std::move(avoid_node_labels), request.reason());
}

Status AggregatedQueueHandler::HandleReportDone(const Principal &principal,
                                                const rpc::IdList &request,
                                                rpc::IdList *reply) {
  AddToProtobuf(lifecycle_.ReportDone(VectorFromProtobuf(request.ids())),
                reply->mutable_ids());
  return Status::OK();
}

std::unique_ptr<LeaseSession> AggregatedQueueHandler::NewSession(
    const Principal &principal) {
  ARMADA_LOG(DEBUG) << "Lease stream opened by " << principal.name;
  return std::make_unique<LeaseSession>(admission_, lifecycle_, sessions_);
}

template <typename Request, typename Reply>
grpc::ServerUnaryReactor *AggregatedQueueService::HandleUnary(
    const char *method,
    grpc::CallbackServerContext *context,
    const Request *request,
    Reply *reply,
    HandlerMethod<Request, Reply> handle) {
  auto reactor = context->DefaultReactor();
  auto &io_context = *io_service_pool_.Get();
  if (io_context.stopped()) {
    ARMADA_LOG(DEBUG) << "AggregatedQueue service closed, rejecting " << method;
    reactor->Finish(
        StatusToGrpcStatus(Status::Unavailable("AggregatedQueue service closed")));
    return reactor;
  }
  boost::asio::post(
      io_context,
      [this,
       method,
       authorization = GetClientMetadata(*context, kAuthorizationKey),
       request,
       reply,
       reactor,
       handle]() {
        auto principal = authenticator_.Authenticate(authorization);
        if (!principal.ok()) {
          ARMADA_LOG(INFO) << method << " rejected: " << principal.status();
          reactor->Finish(StatusToGrpcStatus(principal.status()));
          return;
        }
        Status status = (handler_.*handle)(*principal, *request, reply);
        ARMADA_LOG_IF_ERROR(DEBUG, status) << method << " failed: " << status;
        reactor->Finish(StatusToGrpcStatus(status));
      });
  return reactor;
}

grpc::ServerUnaryReactor *AggregatedQueueService::LeaseJobs(
    grpc::CallbackServerContext *context,
    const rpc::LeaseRequest *request,
    rpc::JobLease *reply) {
  return HandleUnary("LeaseJobs",
                     context,
                     request,
                     reply,
                     &AggregatedQueueHandler::HandleLeaseJobs);
}

grpc::ServerBidiReactor<rpc::StreamingLeaseRequest, rpc::StreamingJobLease>
    *AggregatedQueueService::StreamingLeaseJobs(grpc::CallbackServerContext *context) {
  return new LeaseStreamReactor(context, *io_service_pool_.Get(), handler_, authenticator_);
}

grpc::ServerUnaryReactor *AggregatedQueueService::RenewLease(
    grpc::CallbackServerContext *context,
    const rpc::RenewLeaseRequest *request,
    rpc::IdList *reply) {
  return HandleUnary("RenewLease",
                     context,
                     request,
                     reply,
                     &AggregatedQueueHandler::HandleRenewLease);
}

grpc::ServerUnaryReactor *AggregatedQueueService::ReturnLease(
    grpc::CallbackServerContext *context,
    const rpc::ReturnLeaseRequest *request,
    google::protobuf::Empty *reply) {
  return HandleUnary("ReturnLease",
                     context,
                     request,
                     reply,
                     &AggregatedQueueHandler::HandleReturnLease);
}

grpc::ServerUnaryReactor *AggregatedQueueService::ReportDone(
    grpc::CallbackServerContext *context,
    const rpc::IdList *request,
    rpc::IdList *reply) {
  return HandleUnary("ReportDone",
                     context,
                     request,
                     reply,
                     &AggregatedQueueHandler::HandleReportDone);
}

}  // namespace armada
