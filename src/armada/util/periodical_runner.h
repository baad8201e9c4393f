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

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace armada {

/// \class PeriodicalRunner
/// A periodical runner attached with an io_context. It can run functions with
/// specified period. Each function is triggered by its timer. To run a function,
/// call `RunFnPeriodically(fn, period_ms, name)`. All registered functions stop
/// running once this object is destructed.
class PeriodicalRunner : public std::enable_shared_from_this<PeriodicalRunner> {
 public:
  static std::shared_ptr<PeriodicalRunner> Create(boost::asio::io_context &io_service) {
    // Sadly we can't use std::make_shared because the constructor is private.
    return std::shared_ptr<PeriodicalRunner>(new PeriodicalRunner(io_service));
  }

  ~PeriodicalRunner();

  void RunFnPeriodically(std::function<void()> fn, uint64_t period_ms, std::string name)
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  explicit PeriodicalRunner(boost::asio::io_context &io_service);

  void DoRunFnPeriodically(std::function<void()> fn,
                           std::chrono::milliseconds period,
                           std::shared_ptr<boost::asio::steady_timer> timer,
                           std::string name) ABSL_LOCKS_EXCLUDED(mutex_);

  boost::asio::io_context &io_service_;
  mutable absl::Mutex mutex_;
  std::vector<std::shared_ptr<boost::asio::steady_timer>> timers_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace armada
