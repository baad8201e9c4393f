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

#include "armada/scheduling/priority_resource_accountant.h"

#include <atomic>
#include <random>
#include <thread>
#include <vector>

#include "armada/common/test_util.h"
#include "gtest/gtest.h"

namespace armada {

class PriorityResourceAccountantTest : public ::testing::Test {
 public:
  PriorityResourceAccountantTest() : accountant_("c1", "default") {
    accountant_.UpdateCapacity(MakeResources({{"cpu", 10}}), {});
  }

 protected:
  /// No band may hold more, counting itself and every band above, than the total.
  void CheckInvariant(const std::vector<int32_t> &priorities) {
    for (int32_t band : priorities) {
      ResourceSet cumulative;
      for (int32_t other : priorities) {
        if (other >= band) {
          cumulative += accountant_.Allocated(other);
        }
      }
      ASSERT_TRUE(cumulative <= accountant_.Total())
          << "band " << band << " holds " << cumulative;
    }
  }

  PriorityResourceAccountant accountant_;
};

TEST_F(PriorityResourceAccountantTest, TestTwoOfThreeFit) {
  auto four = MakeResources({{"cpu", 4}});
  ASSERT_TRUE(accountant_.TryCommit(1, four));
  ASSERT_TRUE(accountant_.TryCommit(1, four));
  ASSERT_FALSE(accountant_.TryCommit(1, four));
  ASSERT_EQ(accountant_.Allocated(1), MakeResources({{"cpu", 8}}));
  ASSERT_EQ(accountant_.Headroom(1), MakeResources({{"cpu", 2}}));

  accountant_.Release(1, four);
  ASSERT_TRUE(accountant_.CanAdmit(1, four));
  ASSERT_TRUE(accountant_.TryCommit(1, four));
}

TEST_F(PriorityResourceAccountantTest, TestHigherPriorityUsesPreemptionHeadroom) {
  ASSERT_TRUE(accountant_.TryCommit(0, MakeResources({{"cpu", 10}})));
  // Priority 0 is full but a more urgent band may still preempt it.
  ASSERT_FALSE(accountant_.CanAdmit(0, MakeResources({{"cpu", 1}})));
  ASSERT_TRUE(accountant_.TryCommit(5, MakeResources({{"cpu", 6}})));
  // The band at 5 now holds 6 of 10.
  ASSERT_FALSE(accountant_.CanAdmit(5, MakeResources({{"cpu", 5}})));
  ASSERT_TRUE(accountant_.CanAdmit(9, MakeResources({{"cpu", 4}})));
  // Band 3 is constrained by what is held at 3 and above, which is the 6 at band 5.
  ASSERT_TRUE(accountant_.CanAdmit(3, MakeResources({{"cpu", 4}})));
  ASSERT_FALSE(accountant_.CanAdmit(3, MakeResources({{"cpu", 5}})));
}

TEST_F(PriorityResourceAccountantTest, TestBaselineCountsAgainstBands) {
  accountant_.UpdateCapacity(MakeResources({{"cpu", 10}}),
                             {{100, MakeResources({{"cpu", 7}})}});
  ASSERT_FALSE(accountant_.CanAdmit(1, MakeResources({{"cpu", 4}})));
  ASSERT_TRUE(accountant_.CanAdmit(1, MakeResources({{"cpu", 3}})));
  ASSERT_TRUE(accountant_.CanAdmit(200, MakeResources({{"cpu", 10}})));

  // Capacity reports replace the baseline wholesale.
  accountant_.UpdateCapacity(MakeResources({{"cpu", 10}}), {});
  ASSERT_TRUE(accountant_.CanAdmit(1, MakeResources({{"cpu", 10}})));
}

TEST_F(PriorityResourceAccountantTest, TestReportedLeasesAreNotCountedTwice) {
  auto four = MakeResources({{"cpu", 4}});
  ASSERT_TRUE(accountant_.TryCommit(1, four));
  ASSERT_TRUE(accountant_.TryCommit(1, four));
  ASSERT_FALSE(accountant_.CanAdmit(1, four));

  // The executor reports both leased pods running.
  accountant_.UpdateCapacity(MakeResources({{"cpu", 10}}),
                             {{1, MakeResources({{"cpu", 8}})}});
  ASSERT_EQ(accountant_.Allocated(1), MakeResources({{"cpu", 8}}));
  ASSERT_EQ(accountant_.Headroom(1), MakeResources({{"cpu", 2}}));

  // One finishes and the next report no longer shows it.
  accountant_.Release(1, four);
  accountant_.UpdateCapacity(MakeResources({{"cpu", 10}}),
                             {{1, MakeResources({{"cpu", 4}})}});
  ASSERT_EQ(accountant_.Headroom(1), MakeResources({{"cpu", 6}}));
  ASSERT_TRUE(accountant_.TryCommit(1, four));

  // A report taken before the new pod started still counts its commit.
  ASSERT_EQ(accountant_.Headroom(1), MakeResources({{"cpu", 2}}));
}

TEST_F(PriorityResourceAccountantTest, TestUnknownResourceIsNotAdmitted) {
  ASSERT_FALSE(accountant_.CanAdmit(1, MakeResources({{"cpu", 1}, {"gpu", 1}})));
}

TEST_F(PriorityResourceAccountantTest, TestReleaseBelowZeroIsClamped) {
  accountant_.Commit(1, MakeResources({{"cpu", 2}}));
  accountant_.Release(1, MakeResources({{"cpu", 5}}));
  ASSERT_TRUE(accountant_.Allocated(1).IsEmpty());
  ASSERT_EQ(accountant_.Headroom(0), MakeResources({{"cpu", 10}}));
}

TEST_F(PriorityResourceAccountantTest, TestRandomCommitReleaseKeepsInvariant) {
  const std::vector<int32_t> priorities = {0, 1, 5, 100};
  std::mt19937 gen(7);
  std::uniform_int_distribution<int> pick_priority(0, priorities.size() - 1);
  std::uniform_int_distribution<int> pick_cpu(1, 4);
  std::vector<std::pair<int32_t, ResourceSet>> committed;
  for (int step = 0; step < 2000; ++step) {
    if (committed.empty() || gen() % 3 != 0) {
      int32_t priority = priorities[pick_priority(gen)];
      auto request = MakeResources({{"cpu", static_cast<double>(pick_cpu(gen))}});
      if (accountant_.TryCommit(priority, request)) {
        committed.emplace_back(priority, request);
      }
    } else {
      size_t index = gen() % committed.size();
      accountant_.Release(committed[index].first, committed[index].second);
      committed.erase(committed.begin() + index);
    }
    CheckInvariant(priorities);
  }
}

TEST_F(PriorityResourceAccountantTest, TestConcurrentTryCommitNeverOvercommits) {
  std::vector<std::thread> threads;
  std::atomic<int> admitted{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, &admitted]() {
      for (int j = 0; j < 100; ++j) {
        if (accountant_.TryCommit(1, MakeResources({{"cpu", 1}}))) {
          ++admitted;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  ASSERT_EQ(admitted.load(), 10);
  CheckInvariant({1});
}

TEST(AccountantRegistryTest, TestOneAccountantPerClusterPool) {
  AccountantRegistry registry;
  ASSERT_EQ(registry.Get("c1", "a"), nullptr);
  auto a = registry.GetOrCreate("c1", "a");
  ASSERT_EQ(registry.GetOrCreate("c1", "a"), a);
  ASSERT_NE(registry.GetOrCreate("c1", "b"), a);
  ASSERT_NE(registry.GetOrCreate("c2", "a"), a);
  ASSERT_EQ(registry.Get("c1", "a"), a);
}

}  // namespace armada
