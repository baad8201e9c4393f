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

#include "armada/scheduling/node_type.h"

#include <algorithm>
#include <random>
#include <tuple>

#include "armada/common/test_util.h"
#include "gtest/gtest.h"

namespace armada {

namespace {

rpc::NodeInfo Tainted(rpc::NodeInfo node,
                      const std::vector<std::tuple<std::string, std::string, std::string>> &taints) {
  for (const auto &[key, value, effect] : taints) {
    auto *taint = node.add_taints();
    taint->set_key(key);
    taint->set_value(value);
    taint->set_effect(effect);
  }
  return node;
}

/// Map each node name to the key of the class it landed in.
absl::flat_hash_map<std::string, NodeTypeKey> ClassOf(const NodeTypeMap &node_types) {
  absl::flat_hash_map<std::string, NodeTypeKey> class_of;
  for (const auto &[key, stats] : node_types) {
    for (const auto &node : stats.Nodes()) {
      class_of[node.name] = key;
    }
  }
  return class_of;
}

}  // namespace

class NodeTypeTest : public ::testing::Test {};

TEST_F(NodeTypeTest, TestNodesWithSameKeyShareAClass) {
  // Same taints, labels and allocatable, different consumption.
  std::vector<rpc::NodeInfo> nodes = {
      MakeNode("a", {{"cpu", 8}}, {{"zone", "1"}}, {{0, {{"cpu", 2}}}}),
      MakeNode("b", {{"cpu", 8}}, {{"zone", "1"}}, {{0, {{"cpu", 5}}}}),
  };
  auto node_types = ClassifyNodes(nodes);
  ASSERT_TRUE(node_types.ok());
  ASSERT_EQ(node_types->size(), 1u);
  const auto &stats = node_types->begin()->second;
  ASSERT_EQ(stats.NodeCount(), 2u);
  ASSERT_EQ(stats.Allocatable(), MakeResources({{"cpu", 16}}));
  // Available resources are summed, not compared.
  ASSERT_EQ(stats.AvailableAtPriority(0), MakeResources({{"cpu", 9}}));
  ASSERT_EQ(stats.LargestNodeFreeAtPriority(0), MakeResources({{"cpu", 6}}));
}

TEST_F(NodeTypeTest, TestTaintOrderAndDuplicatesDoNotMatter) {
  auto a = Tainted(MakeNode("a", {{"cpu", 8}}),
                   {{"gpu", "true", "NoSchedule"}, {"spot", "", "NoExecute"}});
  auto b = Tainted(MakeNode("b", {{"cpu", 8}}),
                   {{"spot", "", "NoExecute"},
                    {"gpu", "true", "NoSchedule"},
                    {"gpu", "true", "NoSchedule"}});
  auto node_types = ClassifyNodes({a, b});
  ASSERT_TRUE(node_types.ok());
  ASSERT_EQ(node_types->size(), 1u);
  ASSERT_EQ(node_types->begin()->first.taints.size(), 2u);
}

TEST_F(NodeTypeTest, TestDifferentKeysSplitClasses) {
  std::vector<rpc::NodeInfo> nodes = {
      MakeNode("a", {{"cpu", 8}}),
      MakeNode("b", {{"cpu", 8}}, {{"zone", "1"}}),
      MakeNode("c", {{"cpu", 16}}),
      Tainted(MakeNode("d", {{"cpu", 8}}), {{"gpu", "true", "NoSchedule"}}),
      // Allocatable is compared exactly.
      MakeNode("e", {{"cpu", 8.001}}),
  };
  auto node_types = ClassifyNodes(nodes);
  ASSERT_TRUE(node_types.ok());
  ASSERT_EQ(node_types->size(), 5u);
}

TEST_F(NodeTypeTest, TestPartitionIndependentOfSubmissionOrder) {
  std::vector<rpc::NodeInfo> nodes;
  for (int i = 0; i < 30; ++i) {
    std::string zone = std::to_string(i % 3);
    double cpu = i % 2 == 0 ? 8 : 16;
    auto node = MakeNode("node-" + std::to_string(i), {{"cpu", cpu}}, {{"zone", zone}},
                         {{i % 4, {{"cpu", 1}}}});
    if (i % 5 == 0) {
      node = Tainted(node, {{"dedicated", "batch", "NoSchedule"}});
    }
    nodes.push_back(node);
  }
  auto expected = ClassifyNodes(nodes);
  ASSERT_TRUE(expected.ok());
  auto expected_class_of = ClassOf(*expected);

  std::mt19937 gen(42);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(nodes.begin(), nodes.end(), gen);
    auto shuffled = ClassifyNodes(nodes);
    ASSERT_TRUE(shuffled.ok());
    ASSERT_EQ(shuffled->size(), expected->size());
    auto class_of = ClassOf(*shuffled);
    // Two nodes share a class iff their keys are equal, whatever the order.
    for (const auto &a : nodes) {
      for (const auto &b : nodes) {
        bool same_class = class_of[a.name()] == class_of[b.name()];
        bool same_expected = expected_class_of[a.name()] == expected_class_of[b.name()];
        ASSERT_EQ(same_class, same_expected) << a.name() << " " << b.name();
      }
    }
  }
}

TEST_F(NodeTypeTest, TestAvailabilityByPriority) {
  // 10 cpu, 2 taken at priority 100 and 3 at priority 0.
  auto node = MakeNode("a", {{"cpu", 10}}, {}, {{100, {{"cpu", 2}}}, {0, {{"cpu", 3}}}});
  auto node_types = ClassifyNodes({node});
  ASSERT_TRUE(node_types.ok());
  auto &stats = node_types->begin()->second;
  ASSERT_EQ(stats.AvailableAtPriority(0), MakeResources({{"cpu", 5}}));
  ASSERT_EQ(stats.AvailableAtPriority(50), MakeResources({{"cpu", 8}}));
  ASSERT_EQ(stats.AvailableAtPriority(100), MakeResources({{"cpu", 8}}));
  ASSERT_EQ(stats.AvailableAtPriority(1000), MakeResources({{"cpu", 10}}));
  ASSERT_EQ(stats.ReportedPriorities(), std::set<int32_t>({0, 100}));

  // A reservation at priority 50 counts against priority 50 and below only.
  auto index = stats.FindNode(50, MakeResources({{"cpu", 8}}));
  ASSERT_TRUE(index.has_value());
  stats.Reserve(*index, 50, MakeResources({{"cpu", 8}}));
  ASSERT_FALSE(stats.FindNode(50, MakeResources({{"cpu", 1}})).has_value());
  ASSERT_TRUE(stats.FindNode(1000, MakeResources({{"cpu", 10}})).has_value());
}

TEST_F(NodeTypeTest, TestLeasedPodsInReportAreNotCountedTwice) {
  auto node = MakeNode("a", {{"cpu", 10}});
  auto node_types = ClassifyNodes({node});
  ASSERT_TRUE(node_types.ok());
  auto &stats = node_types->begin()->second;
  ASSERT_TRUE(stats.ReserveOnNode("a", 1, MakeResources({{"cpu", 8}})));
  ASSERT_FALSE(stats.ReserveOnNode("b", 1, MakeResources({{"cpu", 8}})));
  ASSERT_EQ(stats.AvailableAtPriority(1), MakeResources({{"cpu", 2}}));

  // The executor now reports the 8 leased cpu as running at priority 1.
  node = MakeNode("a", {{"cpu", 10}}, {}, {{1, {{"cpu", 8}}}});
  node_types = ClassifyNodes({node});
  ASSERT_TRUE(node_types.ok());
  auto &reported = node_types->begin()->second;
  ASSERT_TRUE(reported.ReserveOnNode("a", 1, MakeResources({{"cpu", 8}})));
  ASSERT_EQ(reported.AvailableAtPriority(1), MakeResources({{"cpu", 2}}));
  ASSERT_TRUE(reported.FindNode(1, MakeResources({{"cpu", 2}})).has_value());
  ASSERT_FALSE(reported.FindNode(1, MakeResources({{"cpu", 3}})).has_value());
}

TEST_F(NodeTypeTest, TestNodeWithoutBreakdownUsesAvailable) {
  rpc::NodeInfo node;
  node.set_name("a");
  FillQuantities({{"cpu", 10}}, node.mutable_allocatable_resources());
  FillQuantities({{"cpu", 4}}, node.mutable_available_resources());
  auto node_types = ClassifyNodes({node});
  ASSERT_TRUE(node_types.ok());
  const auto &stats = node_types->begin()->second;
  ASSERT_EQ(stats.AvailableAtPriority(0), MakeResources({{"cpu", 4}}));
  ASSERT_EQ(stats.AvailableAtPriority(1000), MakeResources({{"cpu", 4}}));
}

TEST_F(NodeTypeTest, TestSelectors) {
  auto node = Tainted(MakeNode("a", {{"cpu", 8}}, {{"zone", "1"}, {"gpu", "a100"}}),
                      {{"gpu", "true", "NoSchedule"}, {"soft", "", "PreferNoSchedule"}});
  auto node_types = ClassifyNodes({node});
  ASSERT_TRUE(node_types.ok());
  const auto &stats = node_types->begin()->second;

  ::google::protobuf::Map<std::string, std::string> required;
  required["zone"] = "1";
  ASSERT_TRUE(stats.MatchesLabels(required));
  required["zone"] = "2";
  ASSERT_FALSE(stats.MatchesLabels(required));

  ::google::protobuf::RepeatedPtrField<rpc::Toleration> tolerations;
  ASSERT_FALSE(stats.ToleratedBy(tolerations));
  auto *toleration = tolerations.Add();
  toleration->set_key("gpu");
  toleration->set_operator_("Exists");
  // PreferNoSchedule taints do not need a toleration.
  ASSERT_TRUE(stats.ToleratedBy(tolerations));

  ASSERT_TRUE(stats.HasAnyLabel({{"gpu", "a100"}}));
  ASSERT_FALSE(stats.HasAnyLabel({{"gpu", "h100"}}));
}

TEST_F(NodeTypeTest, TestUnparseableQuantityIsInvalid) {
  auto node = MakeNode("bad", {{"cpu", 1}});
  (*node.mutable_total_resources())["cpu"] = "one";
  auto node_types = ClassifyNodes({node});
  ASSERT_FALSE(node_types.ok());
  ASSERT_TRUE(node_types.status().IsInvalid());
}

}  // namespace armada
