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

#include "armada/util/io_service_pool.h"

#include "armada/util/logging.h"

namespace armada {

IOServicePool::IOServicePool(size_t io_service_num) : io_service_num_(io_service_num) {
  ARMADA_CHECK_GT(io_service_num_, 0u);
}

IOServicePool::~IOServicePool() { Stop(); }

void IOServicePool::Run() {
  for (size_t i = 0; i < io_service_num_; ++i) {
    io_services_.emplace_back(std::make_unique<boost::asio::io_context>());
    boost::asio::io_context &io_service = *io_services_[i];
    work_guards_.emplace_back(boost::asio::make_work_guard(io_service));
    threads_.emplace_back([&io_service] { io_service.run(); });
  }

  ARMADA_LOG(INFO) << "IOServicePool is running with " << io_service_num_
                   << " io_context.";
}

void IOServicePool::Stop() {
  if (threads_.empty()) {
    return;
  }
  for (auto &guard : work_guards_) {
    guard.reset();
  }
  for (auto &io_service : io_services_) {
    io_service->stop();
  }
  for (auto &thread : threads_) {
    thread.join();
  }
  threads_.clear();
  work_guards_.clear();

  ARMADA_LOG(INFO) << "IOServicePool is stopped.";
}

}  // namespace armada
