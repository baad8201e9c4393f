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

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <vector>

#include "armada/auth/authenticator.h"
#include "armada/lease/lease_session.h"
#include "armada/rpc/aggregated_queue_server.h"
#include "src/armada/protobuf/queue.grpc.pb.h"

namespace armada {

using LeaseBidiReactor =
    grpc::ServerBidiReactor<rpc::StreamingLeaseRequest, rpc::StreamingJobLease>;

/// \class LeaseStreamReactor
///
/// Server side of one StreamingLeaseJobs call. Reads a request, writes the
/// batch it yields one message at a time, then reads the next request. All
/// callbacks are moved onto `io_context`, which must run on a single thread, so
/// the session is never entered concurrently.
///
/// The reactor owns itself and is deleted after `OnDone`. Ending the call closes
/// the session; the leases it delivered stay live.
class LeaseStreamReactor final : public LeaseBidiReactor {
 public:
  LeaseStreamReactor(grpc::CallbackServerContext *server_context,
                     boost::asio::io_context &io_context,
                     AggregatedQueueHandler &handler,
                     AuthenticatorInterface &authenticator);

  ~LeaseStreamReactor() override = default;

 private:
  void Start(const std::string &authorization);

  void StartPull();

  void ProcessRequest();

  void SendNext();

  void Finish(grpc::Status status);

  void OnReadDone(bool ok) override;

  void OnWriteDone(bool ok) override;

  void OnCancel() override;

  void OnDone() override;

  boost::asio::io_context &io_context_;
  AggregatedQueueHandler &handler_;
  AuthenticatorInterface &authenticator_;
  std::unique_ptr<LeaseSession> session_;

  rpc::StreamingLeaseRequest request_;
  /// Messages of the batch being written; `next_to_send_` indexes the one in flight.
  std::vector<rpc::StreamingJobLease> sending_;
  size_t next_to_send_ = 0;
  bool finished_ = false;
};

}  // namespace armada
