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


#include "absl/strings/str_cat.h"
#include "armada/util/logging.h"

namespace armada {

StatusOr<std::unique_ptr<RunRecorder>> RunRecorder::Create(const SchemaRegistry &schemas,
                                                           JobSetMapper &job_sets,
                                                           RecordSinkInterface &sink) {
  ARMADA_ASSIGN_OR_RETURN(const TableSchema *schema,
                          schemas.Get(RunRecord::kTableName));
  ARMADA_RETURN_NOT_OK(ValidateRow(*schema, RunRecord().NamesValues()));
  return std::make_unique<RunRecorder>(*schema, job_sets, sink);
}

RunRecorder::RunRecorder(const TableSchema &schema,
                         JobSetMapper &job_sets,
                         RecordSinkInterface &sink)
    : schema_(schema), job_sets_(job_sets), sink_(sink) {}

StatusOr<RunRecord> RunRecorder::ToRunRecord(const Lease &lease) {
  if (lease.job == nullptr) {
    return Status::Invalid(absl::StrCat("lease of job ", lease.job_id, " has no job"));
  }
  const rpc::Job &job = *lease.job;
  RunRecord record;
  ARMADA_ASSIGN_OR_RETURN(record.job_set_id,
                          job_sets_.Get(job.queue(), job.job_set_id()));
  record.run_id = absl::StrCat(lease.cluster_id, ":", lease.job_id, ":", lease.issued_at_ms);
  record.job_id = lease.job_id;
  record.queue = job.queue();
  record.cluster_id = lease.cluster_id;
  record.pool = lease.pool;
  record.state = LeaseStateName(lease.state);
  record.reason = lease.reason;
  record.priority_class = lease.priority_class;
  record.priority = job.priority();
  record.issued_at_ms = lease.issued_at_ms;
  record.finished_at_ms = lease.finished_at_ms;
  record.succeeded = lease.state == LeaseState::kDone;
  return record;
}

Status RunRecorder::Record(const Lease &lease) {
  ARMADA_ASSIGN_OR_RETURN(RunRecord record, ToRunRecord(lease));
  return sink_.Write(schema_, record.NamesValues());
}

void RunRecorder::OnLeaseFinished(const Lease &lease) {
  Status status = Record(lease);
  ARMADA_LOG_IF_ERROR(WARNING, status).WithField(kLogKeyClusterID, lease.cluster_id)
          .WithField(kLogKeyJobID, lease.job_id)
      << "Failed to record run: " << status;
}

}  // namespace armada
