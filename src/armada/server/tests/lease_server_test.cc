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

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "armada/common/armada_config.h"
#include "armada/common/test_util.h"
#include "gtest/gtest.h"
#include "src/armada/protobuf/queue.grpc.pb.h"

namespace armada {

namespace {

bool WaitForCondition(std::function<bool()> condition, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

}  // namespace

class LeaseServerTest : public ::testing::Test {
 public:
  void SetUp() override {
    ArmadaConfig::instance().initialize(
        R"({"lease_timeout_ms": 300, "lease_expiry_check_period_ms": 20})");
    record_dir_ = std::filesystem::path(::testing::TempDir()) /
                  ("records_" + std::string(::testing::UnitTest::GetInstance()
                                                ->current_test_info()
                                                ->name()));
    std::filesystem::create_directories(record_dir_);

    LeaseServerConfig config;
    config.handler_thread_num = 2;
    config.schema_dir = ARMADA_SCHEMA_DIR;
    config.record_dir = record_dir_.string();
    server_ = std::make_unique<LeaseServer>(config, main_service_);
    ASSERT_TRUE(server_->Start().ok());
    main_thread_ = std::thread([this] { main_service_.run(); });

    auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server_->GetPort()),
                                       grpc::InsecureChannelCredentials());
    stub_ = rpc::AggregatedQueue::NewStub(channel);
  }

  void TearDown() override {
    server_->Stop();
    work_.reset();
    main_service_.stop();
    if (main_thread_.joinable()) {
      main_thread_.join();
    }
    server_.reset();
    std::filesystem::remove_all(record_dir_);
    ArmadaConfig::instance().initialize("");
  }

 protected:
  std::vector<std::string> Lease(const std::string &cluster_id) {
    rpc::LeaseRequest request;
    request.set_cluster_id(cluster_id);
    request.set_pool("default");
    *request.add_nodes() = MakeNode("n1", {{"cpu", 10}});
    grpc::ClientContext context;
    rpc::JobLease reply;
    auto status = stub_->LeaseJobs(&context, request, &reply);
    EXPECT_TRUE(status.ok()) << status.error_message();
    std::vector<std::string> ids;
    for (const auto &job : reply.job()) {
      ids.push_back(job.id());
    }
    return ids;
  }

  std::string ReadRecords() {
    std::ifstream file(record_dir_ / "records_runs.log");
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  boost::asio::io_context main_service_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_ =
      boost::asio::make_work_guard(main_service_);
  std::thread main_thread_;
  std::filesystem::path record_dir_;
  std::unique_ptr<LeaseServer> server_;
  std::unique_ptr<rpc::AggregatedQueue::Stub> stub_;
};

TEST_F(LeaseServerTest, TestDoneJobLeavesTheBacklogAndIsRecorded) {
  ASSERT_TRUE(server_->oracle().Submit(MakeJob("j1", "a", {{"cpu", 1}})).ok());
  ASSERT_EQ(Lease("c1"), std::vector<std::string>{"j1"});
  ASSERT_EQ(server_->oracle().QueuedJobs("a"), 0u);

  grpc::ClientContext context;
  rpc::IdList request;
  request.add_ids("j1");
  rpc::IdList reply;
  ASSERT_TRUE(stub_->ReportDone(&context, request, &reply).ok());
  ASSERT_EQ(reply.ids_size(), 1);

  ASSERT_EQ(server_->oracle().QueuedJobs("a"), 0u);
  ASSERT_TRUE(Lease("c2").empty());
  const std::string records = ReadRecords();
  ASSERT_NE(records.find("j1"), std::string::npos) << records;
  ASSERT_NE(records.find("DONE"), std::string::npos) << records;
}

TEST_F(LeaseServerTest, TestReturnedJobIsLeasedAgain) {
  ASSERT_TRUE(server_->oracle().Submit(MakeJob("j1", "a", {{"cpu", 1}})).ok());
  ASSERT_EQ(Lease("c1"), std::vector<std::string>{"j1"});

  grpc::ClientContext context;
  rpc::ReturnLeaseRequest request;
  request.set_cluster_id("c1");
  request.set_job_id("j1");
  google::protobuf::Empty reply;
  ASSERT_TRUE(stub_->ReturnLease(&context, request, &reply).ok());

  ASSERT_EQ(server_->oracle().QueuedJobs("a"), 1u);
  ASSERT_EQ(Lease("c2"), std::vector<std::string>{"j1"});
}

TEST_F(LeaseServerTest, TestUnrenewedLeaseExpiresAndJobIsRequeued) {
  ASSERT_TRUE(server_->oracle().Submit(MakeJob("j1", "a", {{"cpu", 1}})).ok());
  ASSERT_EQ(Lease("c1"), std::vector<std::string>{"j1"});
  ASSERT_TRUE(WaitForCondition(
      [this] { return server_->lifecycle().NumLiveLeases("c1") == 0; }, 5000));
  ASSERT_EQ(server_->lifecycle().Get("j1")->state, LeaseState::kExpired);
  ASSERT_EQ(server_->oracle().QueuedJobs("a"), 1u);

  grpc::ClientContext context;
  rpc::RenewLeaseRequest request;
  request.set_cluster_id("c1");
  request.add_ids("j1");
  rpc::IdList reply;
  ASSERT_TRUE(stub_->RenewLease(&context, request, &reply).ok());
  ASSERT_EQ(reply.ids_size(), 0);
}

}  // namespace armada
