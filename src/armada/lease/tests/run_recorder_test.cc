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

#include "armada/lease/run_recorder.h"

#include <memory>
#include <string>

#include "armada/common/test_util.h"
#include "armada/eventapi/in_memory_event_db.h"
#include "gtest/gtest.h"

namespace armada {

namespace {

std::string Column(const RecordRow &row, const std::string &name) {
  for (const auto &[column, value] : row) {
    if (column == name) {
      return RecordValueToString(value);
    }
  }
  return "";
}

}  // namespace

class RunRecorderTest : public ::testing::Test {
 protected:
  RunRecorderTest() : job_sets_(event_db_, /*cache_size=*/16) {
    ARMADA_CHECK_OK(schemas_.AddFromString(kRunsTableSql));
  }

  Lease FinishedLease(const std::string &job_id, LeaseState state) {
    auto job = MakeJob(job_id, "a", {{"cpu", 1}}, 3, 1.5);
    Lease lease;
    lease.job_id = job_id;
    lease.cluster_id = "c1";
    lease.pool = "default";
    lease.job = std::make_shared<const rpc::Job>(job);
    lease.priority_class = 3;
    lease.state = state;
    lease.issued_at_ms = 1000;
    lease.finished_at_ms = 2000;
    return lease;
  }

  InMemoryEventDb event_db_;
  JobSetMapper job_sets_;
  SchemaRegistry schemas_;
  InMemoryRecordSink sink_;
};

TEST_F(RunRecorderTest, TestRecordsFinishedLease) {
  auto recorder = RunRecorder::Create(schemas_, job_sets_, sink_);
  ASSERT_TRUE(recorder.ok()) << recorder.status();

  auto done = FinishedLease("j1", LeaseState::kDone);
  (*recorder)->OnLeaseFinished(done);
  auto returned = FinishedLease("j2", LeaseState::kReturned);
  returned.reason = "node's disk failed";
  (*recorder)->OnLeaseFinished(returned);

  auto rows = sink_.Rows("runs");
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_TRUE(ValidateRow(**schemas_.Get("runs"), rows[0]).ok());
  ASSERT_EQ(Column(rows[0], "run_id"), "'c1:j1:1000'");
  ASSERT_EQ(Column(rows[0], "state"), "'DONE'");
  ASSERT_EQ(Column(rows[0], "succeeded"), "true");
  ASSERT_EQ(Column(rows[0], "priority_class"), "3");
  ASSERT_EQ(Column(rows[0], "finished_at_ms"), "2000");
  ASSERT_EQ(Column(rows[1], "succeeded"), "false");
  ASSERT_EQ(Column(rows[1], "reason"), "'node''s disk failed'");
  // Both jobs are in the same job set.
  ASSERT_EQ(Column(rows[0], "job_set_id"), Column(rows[1], "job_set_id"));
  ASSERT_EQ(event_db_.NumLookups(), 1);
}

TEST_F(RunRecorderTest, TestLeaseWithoutJobIsRejected) {
  auto recorder = RunRecorder::Create(schemas_, job_sets_, sink_);
  ASSERT_TRUE(recorder.ok());
  auto lease = FinishedLease("j1", LeaseState::kExpired);
  lease.job = nullptr;
  ASSERT_TRUE((*recorder)->Record(lease).IsInvalid());
  ASSERT_TRUE(sink_.Rows("runs").empty());
}

TEST_F(RunRecorderTest, TestSchemaMustMatch) {
  SchemaRegistry empty;
  ASSERT_TRUE(RunRecorder::Create(empty, job_sets_, sink_).status().IsNotFound());

  SchemaRegistry narrow;
  ASSERT_TRUE(narrow.AddFromString("CREATE TABLE runs (run_id text, job_id text);").ok());
  ASSERT_TRUE(RunRecorder::Create(narrow, job_sets_, sink_).status().IsInvalid());
}

}  // namespace armada
