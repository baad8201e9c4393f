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

#include <atomic>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <vector>

namespace armada {

/// \class IOServicePool
/// The io_context pool. Each io_context owns a thread, so handlers posted to the
/// same io_context never run concurrently.
/// To get an io_context from this pool, call `Run()` first.
/// Before exit, `Stop()` must be called.
class IOServicePool {
 public:
  explicit IOServicePool(size_t io_service_num);

  ~IOServicePool();

  void Run();

  void Stop();

  /// Select io_context by round robin.
  boost::asio::io_context *Get();

  /// Select io_context by hash. The same hash always gets the same io_context.
  boost::asio::io_context *Get(size_t hash);

 private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  size_t io_service_num_{0};

  std::vector<std::thread> threads_;
  std::vector<std::unique_ptr<boost::asio::io_context>> io_services_;
  std::vector<WorkGuard> work_guards_;

  std::atomic<size_t> current_index_{0};
};

inline boost::asio::io_context *IOServicePool::Get() {
  size_t index = ++current_index_ % io_service_num_;
  return io_services_[index].get();
}

inline boost::asio::io_context *IOServicePool::Get(size_t hash) {
  size_t index = hash % io_service_num_;
  return io_services_[index].get();
}

}  // namespace armada
