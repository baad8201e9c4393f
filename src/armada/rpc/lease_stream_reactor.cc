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

#include "armada/rpc/lease_stream_reactor.h"

#include <boost/asio/post.hpp>
#include <utility>

#include "armada/common/grpc_util.h"
#include "armada/util/logging.h"

namespace armada {

LeaseStreamReactor::LeaseStreamReactor(grpc::CallbackServerContext *server_context,
                                       boost::asio::io_context &io_context,
                                       AggregatedQueueHandler &handler,
                                       AuthenticatorInterface &authenticator)
    : io_context_(io_context), handler_(handler), authenticator_(authenticator) {
  boost::asio::post(io_context_,
                    [this, authorization = GetClientMetadata(*server_context,
                                                             kAuthorizationKey)]() {
                      Start(authorization);
                    });
}

void LeaseStreamReactor::Start(const std::string &authorization) {
  auto principal = authenticator_.Authenticate(authorization);
  if (!principal.ok()) {
    ARMADA_LOG(WARNING) << "Lease stream rejected: " << principal.status();
    Finish(StatusToGrpcStatus(principal.status()));
    return;
  }
  session_ = handler_.NewSession(*principal);
  StartPull();
}

void LeaseStreamReactor::StartPull() {
  request_.Clear();
  StartRead(&request_);
}

void LeaseStreamReactor::ProcessRequest() {
  sending_.clear();
  next_to_send_ = 0;
  Status status = session_->OnRequest(request_, &sending_);
  if (!status.ok()) {
    ARMADA_LOG(WARNING)
            .WithField(kLogKeyClusterID, session_->cluster_id())
            .WithField(kLogKeyPool, session_->pool())
        << "Lease stream failed: " << status;
    Finish(StatusToGrpcStatus(status));
    return;
  }
  if (sending_.empty()) {
    StartPull();
    return;
  }
  StartWrite(&sending_[next_to_send_]);
}

void LeaseStreamReactor::SendNext() {
  session_->OnJobSent(sending_[next_to_send_].job().id());
  ++next_to_send_;
  if (next_to_send_ < sending_.size()) {
    StartWrite(&sending_[next_to_send_]);
    return;
  }
  session_->OnBatchDelivered();
  sending_.clear();
  next_to_send_ = 0;
  StartPull();
}

void LeaseStreamReactor::Finish(grpc::Status status) {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (session_ != nullptr) {
    session_->Close();
  }
  LeaseBidiReactor::Finish(status);
}

void LeaseStreamReactor::OnReadDone(bool ok) {
  boost::asio::post(io_context_, [this, ok]() {
    if (finished_) {
      return;
    }
    if (!ok) {
      // The executor closed its side or went away.
      ARMADA_LOG(DEBUG).WithField(kLogKeyClusterID, session_->cluster_id())
          << "Lease stream closed by executor";
      Finish(grpc::Status::OK);
      return;
    }
    ProcessRequest();
  });
}

void LeaseStreamReactor::OnWriteDone(bool ok) {
  boost::asio::post(io_context_, [this, ok]() {
    if (finished_) {
      return;
    }
    if (!ok) {
      ARMADA_LOG_EVERY_MS(INFO, 1000)
          << "Failed to write to executor of cluster " << session_->cluster_id();
      Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "write failed"));
      return;
    }
    SendNext();
  });
}

void LeaseStreamReactor::OnCancel() {
  ARMADA_LOG(DEBUG) << "Lease stream cancelled";
}

void LeaseStreamReactor::OnDone() {
  boost::asio::post(io_context_, [this]() { delete this; });
}

}  // namespace armada
