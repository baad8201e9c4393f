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

#include "armada/util/shared_lru.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/notification.h"
#include "gtest/gtest.h"

namespace armada {

TEST(SharedLruCacheTest, TestEvictsLeastRecentlyUsed) {
  SharedLruCache<std::string, int> cache(2);
  cache.Put("a", std::make_shared<int>(1));
  cache.Put("b", std::make_shared<int>(2));
  // Touch "a" so that "b" is the oldest.
  ASSERT_EQ(*cache.Get("a"), 1);
  cache.Put("c", std::make_shared<int>(3));
  ASSERT_EQ(cache.size(), 2u);
  ASSERT_EQ(cache.Get("b"), nullptr);
  ASSERT_EQ(*cache.Get("a"), 1);
  ASSERT_EQ(*cache.Get("c"), 3);
}

TEST(SharedLruCacheTest, TestPutReplacesAndDelete) {
  SharedLruCache<std::string, int> cache(0);
  cache.Put("a", std::make_shared<int>(1));
  cache.Put("a", std::make_shared<int>(2));
  ASSERT_EQ(cache.size(), 1u);
  ASSERT_EQ(*cache.Get("a"), 2);
  ASSERT_TRUE(cache.Delete("a"));
  ASSERT_FALSE(cache.Delete("a"));
  ASSERT_EQ(cache.size(), 0u);
}

TEST(ThreadSafeSharedLruCacheTest, TestFactoryErrorIsNotCached) {
  ThreadSafeSharedLruCache<std::string, int> cache(10);
  int calls = 0;
  auto failing = [&calls](const std::string &) -> StatusOr<std::shared_ptr<int>> {
    ++calls;
    return Status::Unavailable("down");
  };
  ASSERT_TRUE(cache.GetOrCreate("k", failing).status().IsUnavailable());
  auto ok = [&calls](const std::string &) -> StatusOr<std::shared_ptr<int>> {
    ++calls;
    return std::make_shared<int>(7);
  };
  ASSERT_EQ(**cache.GetOrCreate("k", ok), 7);
  ASSERT_EQ(**cache.GetOrCreate("k", ok), 7);
  ASSERT_EQ(calls, 2);
}

TEST(ThreadSafeSharedLruCacheTest, TestConcurrentMissesRunFactoryOnce) {
  ThreadSafeSharedLruCache<std::string, int> cache(10);
  std::atomic<int> calls{0};
  absl::Notification factory_started;
  absl::Notification release_factory;
  auto factory = [&](const std::string &) -> StatusOr<std::shared_ptr<int>> {
    ++calls;
    factory_started.Notify();
    release_factory.WaitForNotification();
    return std::make_shared<int>(3);
  };

  std::thread first([&] { ASSERT_EQ(**cache.GetOrCreate("k", factory), 3); });
  factory_started.WaitForNotification();
  std::vector<std::thread> waiters;
  for (int i = 0; i < 4; i++) {
    waiters.emplace_back([&] { ASSERT_EQ(**cache.GetOrCreate("k", factory), 3); });
  }
  release_factory.Notify();
  first.join();
  for (auto &waiter : waiters) {
    waiter.join();
  }
  ASSERT_EQ(calls.load(), 1);
}

}  // namespace armada
