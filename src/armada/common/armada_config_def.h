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

// This header file is used to avoid code duplication.
// It can be included multiple times in armada_config.h, and each inclusion
// could use a different definition of the ARMADA_CONFIG macro.
// Macro definition format: ARMADA_CONFIG(type, name, default_value).
// NOTE: This file should NOT be included in any file other than armada_config.h
// and armada_config.cc.

/// How long an issued lease stays valid without a RenewLease call.
ARMADA_CONFIG(int64_t, lease_timeout_ms, 5 * 60 * 1000)

/// Period of the background sweep that expires leases past their deadline.
ARMADA_CONFIG(uint64_t, lease_expiry_check_period_ms, 1000)

/// A lease delivered on a stream but still missing from the executor's
/// ReceivedJobIds after this long is sent again.
ARMADA_CONFIG(int64_t, lease_resend_after_ms, 60 * 1000)

/// Upper bound on the number of jobs handed out in one batch.
ARMADA_CONFIG(uint32_t, max_jobs_per_batch, 100)

/// Number of candidates requested from the fairness oracle per admitted slot.
/// Candidates that do not fit are skipped, so the oracle is asked for more than needed.
ARMADA_CONFIG(uint32_t, oracle_candidate_multiplier, 4)

/// Maximum gRPC message size in bytes.
ARMADA_CONFIG(int64_t, max_grpc_message_size, 100 * 1024 * 1024)

/// Deadline for gracefully shutting down the gRPC server.
ARMADA_CONFIG(int64_t, grpc_shutdown_deadline_ms, 5000)

/// How long a rejected token stays in the negative cache.
ARMADA_CONFIG(int64_t, invalid_token_ttl_ms, 60 * 1000)

/// Upper bound on how long an accepted token stays cached, independent of its expiry.
ARMADA_CONFIG(int64_t, valid_token_max_ttl_ms, 5 * 60 * 1000)

/// Deadline for a single TokenReview call to a cluster API server.
ARMADA_CONFIG(int64_t, token_review_timeout_ms, 10000)

/// Period of the token cache sweep.
ARMADA_CONFIG(uint64_t, token_cache_sweep_period_ms, 5 * 60 * 1000)

/// Capacity of the (queue, job set) -> id LRU cache.
ARMADA_CONFIG(uint64_t, jobset_cache_size, 10000)

/// Whether run records are written when a lease reaches a terminal state.
ARMADA_CONFIG(bool, record_runs, true)

/// Job sets created within this window are loaded into the cache at startup.
ARMADA_CONFIG(int64_t, jobset_cache_warmup_ms, 24 * 60 * 60 * 1000)

/// Terminal leases are kept in memory this long, so late ReportDone and
/// RenewLease calls still get a differential answer, then forgotten.
ARMADA_CONFIG(int64_t, terminal_lease_retention_ms, 10 * 60 * 1000)

/// Jobs tagged for another scheduler are never leased. Untagged jobs always are.
ARMADA_CONFIG(std::string, scheduler_name, "")
