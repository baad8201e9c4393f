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

#include "armada/lease/lease_lifecycle_manager.h"

#include <memory>
#include <string>
#include <vector>

#include "armada/common/test_util.h"
#include "armada/store/in_memory_store_client.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace armada {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

constexpr int64_t kLeaseTimeoutMs = 1000;

class LeaseLifecycleManagerTest : public ::testing::Test {
 protected:
  LeaseLifecycleManagerTest()
      : store_client_(std::make_shared<InMemoryStoreClient>()), storage_(store_client_) {
    accountant_ = accountants_.GetOrCreate("c1", "default");
    accountant_->UpdateCapacity(MakeResources({{"cpu", 10}}), {});
    ResetManager();
  }

  void ResetManager() {
    lifecycle_ = std::make_unique<LeaseLifecycleManager>(
        accountants_, storage_, kLeaseTimeoutMs, [this] { return now_ms_; },
        [this] { return wall_ms_; });
    lifecycle_->AddLeaseFinishedListener(
        [this](const Lease &lease) { finished_.push_back(lease); });
  }

  LeaseGrant Grant(const std::string &job_id, double cpu, int32_t priority = 1) {
    auto job = std::make_shared<const rpc::Job>(MakeJob(job_id, "a", {{"cpu", cpu}}, priority));
    auto resources = MakeResources({{"cpu", cpu}});
    accountant_->Commit(priority, resources);
    return LeaseGrant{job, priority, resources};
  }

  Status IssueJobs(const std::vector<std::string> &job_ids, double cpu = 1) {
    std::vector<LeaseGrant> grants;
    for (const auto &job_id : job_ids) {
      grants.push_back(Grant(job_id, cpu));
    }
    return lifecycle_->Issue("c1", "default", grants);
  }

  int64_t now_ms_ = 0;
  int64_t wall_ms_ = 1700000000000;
  std::shared_ptr<InMemoryStoreClient> store_client_;
  LeaseTableStorage storage_;
  AccountantRegistry accountants_;
  std::shared_ptr<PriorityResourceAccountant> accountant_;
  std::unique_ptr<LeaseLifecycleManager> lifecycle_;
  std::vector<Lease> finished_;
};

TEST_F(LeaseLifecycleManagerTest, TestIssuePersistsLeases) {
  ASSERT_TRUE(IssueJobs({"j1", "j2"}).ok());
  ASSERT_EQ(lifecycle_->NumLiveLeases("c1"), 2u);
  ASSERT_EQ(storage_.Leases().GetAll()->size(), 2u);

  auto lease = lifecycle_->Get("j1");
  ASSERT_TRUE(lease.has_value());
  ASSERT_EQ(lease->state, LeaseState::kIssued);
  ASSERT_EQ(lease->delivery, DeliveryState::kUnsent);
  ASSERT_EQ(lease->deadline_ms, kLeaseTimeoutMs);
  ASSERT_EQ(lease->issued_at_ms, wall_ms_);
  ASSERT_LT(lease->issue_seq, lifecycle_->Get("j2")->issue_seq);
}

TEST_F(LeaseLifecycleManagerTest, TestIssueRejectsLiveJob) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  auto grant = Grant("j1", 1);
  auto status = lifecycle_->Issue("c2", "default", {grant});
  ASSERT_TRUE(status.IsAlreadyExists()) << status;
  ASSERT_EQ(lifecycle_->Get("j1")->cluster_id, "c1");

  // A duplicate inside one batch fails the whole batch.
  status = lifecycle_->Issue("c1", "default", {Grant("j2", 1), Grant("j2", 1)});
  ASSERT_TRUE(status.IsAlreadyExists()) << status;
  ASSERT_FALSE(lifecycle_->Get("j2").has_value());
}

TEST_F(LeaseLifecycleManagerTest, TestIssueStoreFailureLeavesNoLease) {
  store_client_->FailNext(Status::IOError("disk full"));
  auto status = IssueJobs({"j1", "j2"});
  ASSERT_TRUE(status.IsIOError()) << status;
  ASSERT_EQ(lifecycle_->NumLiveLeases("c1"), 0u);
  ASSERT_FALSE(lifecycle_->Get("j1").has_value());
  // The ids are free to be issued again.
  ASSERT_TRUE(IssueJobs({"j1", "j2"}).ok());
}

TEST_F(LeaseLifecycleManagerTest, TestReportDoneIsIdempotent) {
  ASSERT_TRUE(IssueJobs({"j1", "j2"}, 4).ok());
  ASSERT_EQ(accountant_->Committed(1), MakeResources({{"cpu", 16}}));

  auto first = lifecycle_->ReportDone({"j1", "unknown", "j1"});
  ASSERT_THAT(first, ElementsAre("j1"));
  auto second = lifecycle_->ReportDone({"j1", "unknown", "j1"});
  ASSERT_EQ(first, second);

  ASSERT_EQ(finished_.size(), 1u);
  ASSERT_EQ(finished_[0].state, LeaseState::kDone);
  ASSERT_EQ(accountant_->Committed(1), MakeResources({{"cpu", 12}}));
  ASSERT_EQ(storage_.Leases().GetAll()->size(), 1u);
}

TEST_F(LeaseLifecycleManagerTest, TestRenewExtendsDeadline) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  now_ms_ = 600;
  ASSERT_THAT(lifecycle_->Renew("c1", {"j1"}), ElementsAre("j1"));
  auto lease = lifecycle_->Get("j1");
  ASSERT_EQ(lease->state, LeaseState::kRenewed);
  ASSERT_EQ(lease->deadline_ms, 600 + kLeaseTimeoutMs);

  // Another cluster cannot renew it.
  ASSERT_THAT(lifecycle_->Renew("c2", {"j1"}), IsEmpty());
}

TEST_F(LeaseLifecycleManagerTest, TestRenewOfOverdueLeaseExpiresIt) {
  ASSERT_TRUE(IssueJobs({"j1", "j2"}).ok());
  now_ms_ = kLeaseTimeoutMs;
  ASSERT_THAT(lifecycle_->Renew("c1", {"j1"}), IsEmpty());
  ASSERT_EQ(lifecycle_->Get("j1")->state, LeaseState::kExpired);
  ASSERT_EQ(finished_.size(), 1u);
  ASSERT_EQ(finished_[0].job_id, "j1");

  // Renewing again does not bring it back.
  ASSERT_THAT(lifecycle_->Renew("c1", {"j1"}), IsEmpty());
  ASSERT_EQ(lifecycle_->Get("j1")->state, LeaseState::kExpired);
}

TEST_F(LeaseLifecycleManagerTest, TestExpireLeases) {
  ASSERT_TRUE(IssueJobs({"j1", "j2"}).ok());
  now_ms_ = 500;
  lifecycle_->Renew("c1", {"j2"});
  now_ms_ = kLeaseTimeoutMs;
  ASSERT_EQ(lifecycle_->ExpireLeases(), 1u);
  ASSERT_EQ(lifecycle_->Get("j1")->state, LeaseState::kExpired);
  ASSERT_EQ(lifecycle_->Get("j2")->state, LeaseState::kRenewed);
  ASSERT_EQ(accountant_->Committed(1), MakeResources({{"cpu", 1}}));
}

TEST_F(LeaseLifecycleManagerTest, TestExpiryRetriesAfterStoreFailure) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  now_ms_ = kLeaseTimeoutMs;
  store_client_->FailNext(Status::IOError("unreachable"));
  ASSERT_EQ(lifecycle_->ExpireLeases(), 0u);
  ASSERT_TRUE(lifecycle_->Get("j1")->IsLive());
  ASSERT_TRUE(finished_.empty());

  ASSERT_EQ(lifecycle_->ExpireLeases(), 1u);
  ASSERT_FALSE(lifecycle_->Get("j1")->IsLive());
}

TEST_F(LeaseLifecycleManagerTest, TestReportDoneStoreFailureChangesNothing) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  store_client_->FailNext(Status::IOError("unreachable"));
  ASSERT_THAT(lifecycle_->ReportDone({"j1"}), IsEmpty());
  ASSERT_TRUE(lifecycle_->Get("j1")->IsLive());
  ASSERT_EQ(accountant_->Committed(1), MakeResources({{"cpu", 1}}));
  ASSERT_THAT(lifecycle_->ReportDone({"j1"}), ElementsAre("j1"));
}

TEST_F(LeaseLifecycleManagerTest, TestReturnKeepsAvoidLabels) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  // Another cluster and an unknown job are ignored.
  ASSERT_TRUE(lifecycle_->Return("c2", "j1", {}, "").ok());
  ASSERT_TRUE(lifecycle_->Return("c1", "j9", {}, "").ok());
  ASSERT_TRUE(lifecycle_->Get("j1")->IsLive());
  ASSERT_TRUE(finished_.empty());

  LabelPairs avoid = {{"zone", "a"}};
  ASSERT_TRUE(lifecycle_->Return("c1", "j1", avoid, "node lost").ok());
  ASSERT_EQ(lifecycle_->Get("j1")->state, LeaseState::kReturned);
  ASSERT_EQ(lifecycle_->Get("j1")->reason, "node lost");
  ASSERT_EQ(lifecycle_->AvoidNodeLabels("j1"), avoid);
  ASSERT_EQ(finished_.size(), 1u);
  ASSERT_EQ(finished_[0].avoid_node_labels, avoid);

  // Returning twice is fine and releases nothing more.
  ASSERT_TRUE(lifecycle_->Return("c1", "j1", {}, "").ok());
  ASSERT_EQ(finished_.size(), 1u);
  ASSERT_TRUE(accountant_->Committed(1).IsEmpty());

  // A returned job can be leased again. Done forgets the avoided labels.
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  ASSERT_THAT(lifecycle_->ReportDone({"j1"}), ElementsAre("j1"));
  ASSERT_TRUE(lifecycle_->AvoidNodeLabels("j1").empty());
}

TEST_F(LeaseLifecycleManagerTest, TestReturnOfDoneLeaseIsIgnored) {
  ASSERT_TRUE(IssueJobs({"j1"}).ok());
  lifecycle_->ReportDone({"j1"});
  ASSERT_EQ(finished_.size(), 1u);
  ASSERT_TRUE(lifecycle_->Return("c1", "j1", {{"zone", "a"}}, "").ok());
  ASSERT_EQ(lifecycle_->Get("j1")->state, LeaseState::kDone);
  ASSERT_TRUE(lifecycle_->AvoidNodeLabels("j1").empty());
  ASSERT_EQ(finished_.size(), 1u);
}

TEST_F(LeaseLifecycleManagerTest, TestDelivery) {
  ASSERT_TRUE(IssueJobs({"j1", "j2", "j3"}).ok());
  auto pending = lifecycle_->PendingDelivery("c1", "default", 100);
  ASSERT_EQ(pending.size(), 3u);
  ASSERT_EQ(pending[0].job_id, "j1");

  lifecycle_->MarkSent("c1", {"j1", "j2", "j3"});
  ASSERT_THAT(lifecycle_->MarkAcked("c1", {"j1", "j9"}), ElementsAre("j1"));
  ASSERT_TRUE(lifecycle_->PendingDelivery("c1", "default", 100).empty());

  now_ms_ = 100;
  pending = lifecycle_->PendingDelivery("c1", "default", 100);
  ASSERT_EQ(pending.size(), 2u);
  ASSERT_EQ(pending[0].job_id, "j2");
  ASSERT_EQ(pending[1].job_id, "j3");
  ASSERT_TRUE(lifecycle_->PendingDelivery("c1", "other", 0).empty());
}

TEST_F(LeaseLifecycleManagerTest, TestRecordBatch) {
  ASSERT_FALSE(lifecycle_->LastBatch("c1", "default").has_value());
  ASSERT_EQ(lifecycle_->RecordBatch("c1", "default", {"j1", "j2"}), 1u);
  ASSERT_EQ(lifecycle_->RecordBatch("c1", "default", {"j3"}), 2u);
  auto batch = lifecycle_->LastBatch("c1", "default");
  ASSERT_TRUE(batch.has_value());
  ASSERT_EQ(batch->seq, 2u);
  ASSERT_THAT(batch->job_ids, ElementsAre("j3"));
}

TEST_F(LeaseLifecycleManagerTest, TestPruneTerminal) {
  ASSERT_TRUE(IssueJobs({"j1", "j2"}).ok());
  lifecycle_->ReportDone({"j1"});
  wall_ms_ += 1000;
  ASSERT_EQ(lifecycle_->PruneTerminal(5000), 0u);
  wall_ms_ += 5000;
  ASSERT_EQ(lifecycle_->PruneTerminal(5000), 1u);
  ASSERT_FALSE(lifecycle_->Get("j1").has_value());
  ASSERT_TRUE(lifecycle_->Get("j2").has_value());
  ASSERT_THAT(lifecycle_->ReportDone({"j1"}), IsEmpty());
}

TEST_F(LeaseLifecycleManagerTest, TestRecover) {
  ASSERT_TRUE(IssueJobs({"j1", "j2", "j3"}, 2).ok());
  lifecycle_->MarkSent("c1", {"j1", "j2", "j3"});
  lifecycle_->MarkAcked("c1", {"j1"});
  lifecycle_->ReportDone({"j3"});

  // A restart loses the in-memory state and the committed resources.
  accountant_->Release(1, MakeResources({{"cpu", 4}}));
  ASSERT_TRUE(accountant_->Committed(1).IsEmpty());
  std::vector<std::string> reissued;
  ResetManager();
  lifecycle_->AddLeaseIssuedListener(
      [&reissued](const Lease &lease) { reissued.push_back(lease.job_id); });
  now_ms_ = 5000;

  auto recovered = lifecycle_->Recover();
  ASSERT_TRUE(recovered.ok()) << recovered.status();
  ASSERT_EQ(*recovered, 2u);
  ASSERT_THAT(reissued, ElementsAre("j1", "j2"));
  ASSERT_EQ(accountant_->Committed(1), MakeResources({{"cpu", 4}}));
  ASSERT_FALSE(lifecycle_->Get("j3").has_value());

  auto lease = lifecycle_->Get("j1");
  ASSERT_TRUE(lease.has_value());
  ASSERT_EQ(lease->delivery, DeliveryState::kUnsent);
  ASSERT_EQ(lease->deadline_ms, 5000 + kLeaseTimeoutMs);
  ASSERT_EQ(lease->job->queue(), "a");

  // New leases sort after the recovered ones.
  ASSERT_TRUE(IssueJobs({"j4"}).ok());
  ASSERT_GT(lifecycle_->Get("j4")->issue_seq, lease->issue_seq);
}

TEST_F(LeaseLifecycleManagerTest, TestLiveLeasesKeepTheirNode) {
  auto placed = Grant("j1", 2);
  placed.node_name = "n1";
  ASSERT_TRUE(lifecycle_->Issue("c1", "default", {placed, Grant("j2", 1)}).ok());
  ASSERT_TRUE(lifecycle_->Issue("c1", "other", {Grant("j3", 1)}).ok());
  ASSERT_EQ(lifecycle_->LiveLeases("c1", "default").size(), 2u);
  ASSERT_TRUE(lifecycle_->LiveLeases("c2", "default").empty());

  lifecycle_->ReportDone({"j2"});
  auto live = lifecycle_->LiveLeases("c1", "default");
  ASSERT_EQ(live.size(), 1u);
  ASSERT_EQ(live[0].job_id, "j1");
  ASSERT_EQ(live[0].node_name, "n1");

  ResetManager();
  ASSERT_TRUE(lifecycle_->Recover().ok());
  ASSERT_EQ(lifecycle_->Get("j1")->node_name, "n1");
}

TEST_F(LeaseLifecycleManagerTest, TestListenersSeeEachTransitionOnce) {
  std::vector<std::string> issued;
  lifecycle_->AddLeaseIssuedListener(
      [&issued](const Lease &lease) { issued.push_back(lease.job_id); });
  ASSERT_TRUE(IssueJobs({"j1", "j2", "j3"}).ok());
  ASSERT_THAT(issued, ElementsAre("j1", "j2", "j3"));

  lifecycle_->ReportDone({"j1", "j1"});
  ASSERT_TRUE(lifecycle_->Return("c1", "j2", {}, "").ok());
  now_ms_ = kLeaseTimeoutMs;
  lifecycle_->ExpireLeases();
  lifecycle_->ExpireLeases();

  std::vector<std::string> finished_ids;
  for (const auto &lease : finished_) {
    finished_ids.push_back(lease.job_id + ":" + LeaseStateName(lease.state));
  }
  ASSERT_THAT(finished_ids,
              UnorderedElementsAre("j1:DONE", "j2:RETURNED", "j3:EXPIRED"));
}

}  // namespace armada
