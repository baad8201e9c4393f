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

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "gtest/gtest.h"

namespace armada {

TEST(PeriodicalRunnerTest, TestRunsUntilDestroyed) {
  boost::asio::io_context io_service;
  auto work = boost::asio::make_work_guard(io_service);
  std::thread thread([&io_service] { io_service.run(); });

  std::atomic<int> count{0};
  auto runner = PeriodicalRunner::Create(io_service);
  runner->RunFnPeriodically([&count] { ++count; }, 5, "PeriodicalRunnerTest.Count");

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (count.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_GE(count.load(), 3);

  // Destroy the runner on the io_context thread, where its timers fire.
  std::promise<void> destroyed;
  boost::asio::post(io_service, [&runner, &destroyed] {
    runner.reset();
    destroyed.set_value();
  });
  destroyed.get_future().wait();
  const int stopped_at = count.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ASSERT_EQ(count.load(), stopped_at);

  work.reset();
  io_service.stop();
  thread.join();
}

TEST(PeriodicalRunnerTest, TestZeroPeriodDoesNotRun) {
  boost::asio::io_context io_service;
  std::atomic<int> count{0};
  auto runner = PeriodicalRunner::Create(io_service);
  runner->RunFnPeriodically([&count] { ++count; }, 0, "PeriodicalRunnerTest.Never");
  io_service.poll();
  ASSERT_EQ(count.load(), 0);
}

}  // namespace armada
