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

#include "armada/util/periodical_runner.h"

#include <utility>

#include "armada/util/logging.h"

namespace armada {

PeriodicalRunner::PeriodicalRunner(boost::asio::io_context &io_service)
    : io_service_(io_service) {}

PeriodicalRunner::~PeriodicalRunner() {
  absl::MutexLock lock(&mutex_);
  for (const auto &timer : timers_) {
    timer->cancel();
  }
  timers_.clear();
}

void PeriodicalRunner::RunFnPeriodically(std::function<void()> fn,
                                         uint64_t period_ms,
                                         std::string name) {
  if (period_ms == 0) {
    return;
  }
  auto timer = std::make_shared<boost::asio::steady_timer>(io_service_);
  {
    absl::MutexLock lock(&mutex_);
    timers_.push_back(timer);
  }
  boost::asio::post(io_service_,
                    [weak_self = weak_from_this(),
                     fn = std::move(fn),
                     period_ms,
                     name = std::move(name),
                     timer = std::move(timer)]() mutable {
                      if (auto self = weak_self.lock(); self) {
                        self->DoRunFnPeriodically(std::move(fn),
                                                  std::chrono::milliseconds(period_ms),
                                                  std::move(timer),
                                                  std::move(name));
                      }
                    });
}

void PeriodicalRunner::DoRunFnPeriodically(
    std::function<void()> fn,
    std::chrono::milliseconds period,
    std::shared_ptr<boost::asio::steady_timer> timer,
    std::string name) {
  fn();
  absl::MutexLock lock(&mutex_);
  timer->expires_after(period);
  timer->async_wait([weak_self = weak_from_this(),
                     fn = std::move(fn),
                     period,
                     timer,
                     name = std::move(name)](const boost::system::error_code &error) mutable {
    if (auto self = weak_self.lock(); self) {
      if (error == boost::asio::error::operation_aborted) {
        // `operation_aborted` is set when `timer` is canceled or destroyed.
        return;
      }
      ARMADA_CHECK(!error) << name << ": " << error.message();
      self->DoRunFnPeriodically(std::move(fn), period, std::move(timer), std::move(name));
    }
  });
}

}  // namespace armada
