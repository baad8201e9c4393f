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

#include <memory>

#include "armada/common/status_or.h"
#include "armada/eventapi/jobset_mapper.h"
#include "armada/lease/lease.h"
#include "armada/store/record_sink.h"
#include "armada/store/run_record.h"
#include "armada/store/schema_registry.h"

namespace armada {

/// \class RunRecorder
///
/// Writes one row of the runs table per lease that reached a terminal state.
class RunRecorder {
 public:
  /// Fails if the registry has no runs table or its columns differ from RunRecord's.
  static StatusOr<std::unique_ptr<RunRecorder>> Create(const SchemaRegistry &schemas,
                                                       JobSetMapper &job_sets,
                                                       RecordSinkInterface &sink);

  RunRecorder(const TableSchema &schema, JobSetMapper &job_sets, RecordSinkInterface &sink);

  /// Build the run record of a finished lease.
  StatusOr<RunRecord> ToRunRecord(const Lease &lease);

  Status Record(const Lease &lease);

  /// Lease finished listener. Failures are logged, the lease itself is unaffected.
  void OnLeaseFinished(const Lease &lease);

 private:
  const TableSchema &schema_;
  JobSetMapper &job_sets_;
  RecordSinkInterface &sink_;
};

}  // namespace armada
