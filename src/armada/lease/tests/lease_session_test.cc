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

#include "armada/lease/lease_session.h"

#include <memory>
#include <string>
#include <vector>

#include "armada/common/armada_config.h"
#include "armada/common/test_util.h"
#include "armada/lease/queue_fairness_oracle.h"
#include "armada/store/in_memory_store_client.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace armada {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class LeaseSessionTest : public ::testing::Test {
 protected:
  LeaseSessionTest()
      : store_client_(std::make_shared<InMemoryStoreClient>()),
        storage_(store_client_),
        lifecycle_(accountants_, storage_, /*lease_timeout_ms=*/600000,
                   [this] { return now_ms_; }),
        oracle_(aggregator_, storage_, LowerPriorityValueFirst),
        admission_(accountants_, aggregator_, lifecycle_, oracle_, storage_) {}

  void SetUp() override {
    ArmadaConfig::instance().initialize(R"({"lease_resend_after_ms": 1000})");
  }

  void TearDown() override { ArmadaConfig::instance().initialize(""); }

  void SubmitJobs(const std::vector<std::string> &job_ids) {
    for (const auto &job_id : job_ids) {
      ASSERT_TRUE(oracle_.Submit(MakeJob(job_id, "a", {{"cpu", 1}})).ok());
    }
  }

  rpc::StreamingLeaseRequest Handshake(const std::vector<std::string> &received = {}) {
    rpc::StreamingLeaseRequest request;
    request.set_cluster_id("c1");
    request.set_pool("default");
    *request.add_nodes() = MakeNode("n1", {{"cpu", 10}});
    for (const auto &job_id : received) {
      request.add_receivedjobids(job_id);
    }
    return request;
  }

  rpc::StreamingLeaseRequest Acks(const std::vector<std::string> &received) {
    rpc::StreamingLeaseRequest request;
    for (const auto &job_id : received) {
      request.add_receivedjobids(job_id);
    }
    return request;
  }

  std::unique_ptr<LeaseSession> NewSession() {
    return std::make_unique<LeaseSession>(admission_, lifecycle_, registry_);
  }

  /// Deliver every message like the stream writer does.
  static std::vector<std::string> Deliver(LeaseSession &session,
                                          const std::vector<rpc::StreamingJobLease> &out) {
    std::vector<std::string> ids;
    for (const auto &message : out) {
      session.OnJobSent(message.job().id());
      ids.push_back(message.job().id());
    }
    session.OnBatchDelivered();
    return ids;
  }

  int64_t now_ms_ = 0;
  std::shared_ptr<InMemoryStoreClient> store_client_;
  LeaseTableStorage storage_;
  AccountantRegistry accountants_;
  QueueLeasedReportAggregator aggregator_;
  LeaseLifecycleManager lifecycle_;
  QueueFairnessOracle oracle_;
  LeaseAdmission admission_;
  SessionRegistry registry_;
};

TEST_F(LeaseSessionTest, TestHandshakeRequiresClusterId) {
  auto session = NewSession();
  auto request = Handshake();
  request.clear_cluster_id();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(request, &out).IsInvalid());
  ASSERT_EQ(registry_.NumSessions(), 0u);
  ASSERT_TRUE(out.empty());
}

TEST_F(LeaseSessionTest, TestFirstBatch) {
  SubmitJobs({"j1", "j2", "j3"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  ASSERT_EQ(session->state(), SessionState::kStreaming);
  ASSERT_EQ(registry_.Owner("c1", "default"), session->session_id());
  ASSERT_EQ(out.size(), 3u);
  for (const auto &message : out) {
    ASSERT_EQ(message.numjobs(), 3u);
    ASSERT_EQ(message.numacked(), 0u);
  }
  ASSERT_THAT(Deliver(*session, out), ElementsAre("j1", "j2", "j3"));
  ASSERT_EQ(session->state(), SessionState::kAwaitingAcks);
  ASSERT_EQ(lifecycle_.Get("j1")->delivery, DeliveryState::kSent);
}

TEST_F(LeaseSessionTest, TestSecondSessionForPoolIsRejected) {
  auto first = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(first->OnRequest(Handshake(), &out).ok());
  auto second = NewSession();
  ASSERT_TRUE(second->OnRequest(Handshake(), &out).IsAlreadyExists());
  second->Close();
  // The rejected session does not free the slot of the first one.
  ASSERT_EQ(registry_.Owner("c1", "default"), first->session_id());

  first.reset();
  ASSERT_EQ(registry_.NumSessions(), 0u);
  auto third = NewSession();
  ASSERT_TRUE(third->OnRequest(Handshake(), &out).ok());
}

TEST_F(LeaseSessionTest, TestIdentityCannotChangeMidStream) {
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  auto request = Acks({});
  request.set_cluster_id("c2");
  ASSERT_TRUE(session->OnRequest(request, &out).IsInvalid());
  request = Acks({});
  request.set_pool("gpu");
  ASSERT_TRUE(session->OnRequest(request, &out).IsInvalid());
  // Repeating the same identity is allowed.
  request = Acks({});
  request.set_cluster_id("c1");
  ASSERT_TRUE(session->OnRequest(request, &out).ok());
}

TEST_F(LeaseSessionTest, TestAcksAndNewJobs) {
  SubmitJobs({"j1", "j2"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  Deliver(*session, out);

  SubmitJobs({"j3"});
  out.clear();
  ASSERT_TRUE(session->OnRequest(Acks({"j1", "j2"}), &out).ok());
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].job().id(), "j3");
  ASSERT_EQ(out[0].numjobs(), 1u);
  ASSERT_EQ(lifecycle_.Get("j1")->delivery, DeliveryState::kAcked);

  // Nothing new and nothing overdue.
  Deliver(*session, out);
  out.clear();
  ASSERT_TRUE(session->OnRequest(Acks({}), &out).ok());
  ASSERT_TRUE(out.empty());
  ASSERT_EQ(session->state(), SessionState::kAwaitingAcks);
}

TEST_F(LeaseSessionTest, TestUnackedLeaseIsResent) {
  SubmitJobs({"j1"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  Deliver(*session, out);

  now_ms_ = 999;
  out.clear();
  ASSERT_TRUE(session->OnRequest(Acks({}), &out).ok());
  ASSERT_TRUE(out.empty());

  now_ms_ = 1000;
  ASSERT_TRUE(session->OnRequest(Acks({}), &out).ok());
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].job().id(), "j1");
}

TEST_F(LeaseSessionTest, TestReconnectResumesUnackedBatch) {
  SubmitJobs({"j1", "j2", "j3"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  ASSERT_EQ(out.size(), 3u);
  // The stream drops after two messages were written.
  session->OnJobSent("j1");
  session->OnJobSent("j2");
  session.reset();

  SubmitJobs({"j4"});
  auto resumed = NewSession();
  out.clear();
  ASSERT_TRUE(resumed->OnRequest(Handshake({"j1", "j2"}), &out).ok());
  std::vector<std::string> sent;
  for (const auto &message : out) {
    sent.push_back(message.job().id());
    ASSERT_EQ(message.numjobs(), 4u);
    ASSERT_EQ(message.numacked(), 2u);
  }
  ASSERT_THAT(sent, ElementsAre("j3", "j4"));
  auto batch = lifecycle_.LastBatch("c1", "default");
  ASSERT_THAT(batch->job_ids, ElementsAre("j1", "j2", "j3", "j4"));
}

TEST_F(LeaseSessionTest, TestReconnectAfterFullyAckedBatch) {
  SubmitJobs({"j1", "j2"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  Deliver(*session, out);
  session.reset();

  auto resumed = NewSession();
  out.clear();
  ASSERT_TRUE(resumed->OnRequest(Handshake({"j1", "j2"}), &out).ok());
  ASSERT_TRUE(out.empty());
}

TEST_F(LeaseSessionTest, TestBatchSizeIsBounded) {
  ArmadaConfig::instance().initialize(R"({"max_jobs_per_batch": 2})");
  SubmitJobs({"j1", "j2", "j3"});
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  ASSERT_THAT(Deliver(*session, out), ElementsAre("j1", "j2"));
  out.clear();
  ASSERT_TRUE(session->OnRequest(Acks({"j1", "j2"}), &out).ok());
  ASSERT_THAT(Deliver(*session, out), ElementsAre("j3"));
}

TEST_F(LeaseSessionTest, TestClosedSessionRejectsMessages) {
  auto session = NewSession();
  std::vector<rpc::StreamingJobLease> out;
  ASSERT_TRUE(session->OnRequest(Handshake(), &out).ok());
  session->Close();
  session->Close();
  ASSERT_EQ(session->state(), SessionState::kClosed);
  ASSERT_EQ(registry_.NumSessions(), 0u);
  ASSERT_TRUE(session->OnRequest(Acks({}), &out).IsInvalid());
}

TEST_F(LeaseSessionTest, TestLeaseOnce) {
  SubmitJobs({"j1", "j2"});
  rpc::LeaseRequest request;
  request.set_cluster_id("c1");
  *request.add_nodes() = MakeNode("n1", {{"cpu", 10}});
  rpc::JobLease reply;
  ASSERT_TRUE(LeaseSession::LeaseOnce(admission_, lifecycle_, request, &reply).ok());
  ASSERT_EQ(reply.job_size(), 2);
  ASSERT_EQ(lifecycle_.Get("j1")->delivery, DeliveryState::kAcked);
  // Acked leases are never sent again.
  ASSERT_THAT(lifecycle_.PendingDelivery("c1", "", 0), IsEmpty());

  request.clear_cluster_id();
  ASSERT_TRUE(LeaseSession::LeaseOnce(admission_, lifecycle_, request, &reply).IsInvalid());
}

}  // namespace armada
