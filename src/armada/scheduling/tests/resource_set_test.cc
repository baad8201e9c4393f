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

#include "armada/scheduling/resource_set.h"

#include "armada/common/test_util.h"
#include "gtest/gtest.h"

namespace armada {

class ResourceSetTest : public ::testing::Test {};

TEST_F(ResourceSetTest, TestZeroValuesAreRemoved) {
  ResourceSet r1({{"cpu", FixedPoint(1)}, {"memory", FixedPoint(0)}});
  ASSERT_EQ(r1.Size(), 1u);
  r1.Set("cpu", 0);
  ASSERT_TRUE(r1.IsEmpty());
}

TEST_F(ResourceSetTest, TestOperator) {
  ResourceSet r1({{"cpu", FixedPoint(4)}, {"memory", FixedPoint(8)}});
  ResourceSet r2 = MakeResources({{"cpu", 1}});
  ASSERT_EQ(r1 - r2, ResourceSet({{"cpu", FixedPoint(3)}, {"memory", FixedPoint(8)}}));
  ASSERT_EQ(r1 + r2, ResourceSet({{"cpu", FixedPoint(5)}, {"memory", FixedPoint(8)}}));
  ASSERT_TRUE(r2 <= r1);
  ASSERT_FALSE(r1 <= r2);

  // A resource missing on one side counts as zero.
  ResourceSet gpu = MakeResources({{"gpu", 1}});
  ASSERT_FALSE(gpu <= r1);
  ASSERT_TRUE(ResourceSet() <= r1);

  ResourceSet negative = r2 - r1;
  ASSERT_FALSE(negative.IsNonNegative());
  ASSERT_TRUE(negative <= ResourceSet());
  ASSERT_TRUE(negative.ClampNegative());
  ASSERT_TRUE(negative.IsEmpty());
}

TEST_F(ResourceSetTest, TestQuantityMapConversion) {
  ResourceSet::QuantityMap quantities;
  quantities["cpu"] = "1500m";
  quantities["memory"] = "1Gi";
  auto resources = ResourceSet::FromQuantityMap(quantities);
  ASSERT_TRUE(resources.ok());
  ASSERT_EQ(resources->Get("cpu"), FixedPoint(1.5));

  ResourceSet::QuantityMap out;
  resources->ToQuantityMap(&out);
  ASSERT_EQ(out["cpu"], "1500m");
  ASSERT_EQ(out["memory"], "1073741824");

  quantities["gpu"] = "lots";
  ASSERT_TRUE(ResourceSet::FromQuantityMap(quantities).status().IsInvalid());
}

TEST_F(ResourceSetTest, TestMax) {
  ResourceSet r1({{"cpu", FixedPoint(4)}, {"memory", FixedPoint(1)}});
  ResourceSet r2({{"cpu", FixedPoint(2)}, {"memory", FixedPoint(3)}});
  ASSERT_EQ(r1.Max(r2), ResourceSet({{"cpu", FixedPoint(4)}, {"memory", FixedPoint(3)}}));
}

TEST_F(ResourceSetTest, TestCumulativeAllocation) {
  std::map<int32_t, ResourceSet> reported = {
      {0, MakeResources({{"cpu", 1}})},
      {5, MakeResources({{"cpu", 4}, {"memory", 1}})},
      {9, MakeResources({{"cpu", 2}})}};
  std::map<int32_t, ResourceSet> committed = {
      {5, MakeResources({{"cpu", 3}, {"memory", 2}})},
      {7, MakeResources({{"cpu", 1}})}};
  ASSERT_EQ(CumulativeAllocation(reported, committed, 0),
            MakeResources({{"cpu", 8}, {"memory", 2}}));
  ASSERT_EQ(CumulativeAllocation(reported, committed, 6), MakeResources({{"cpu", 3}}));
  ASSERT_TRUE(CumulativeAllocation(reported, committed, 10).IsEmpty());
  ASSERT_TRUE(CumulativeAllocation({}, {}, 0).IsEmpty());
}

}  // namespace armada
