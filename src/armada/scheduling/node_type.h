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

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status_or.h"
#include "armada/scheduling/resource_set.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

struct TaintKey {
  std::string key;
  std::string value;
  std::string effect;

  bool operator==(const TaintKey &other) const {
    return key == other.key && value == other.value && effect == other.effect;
  }
  bool operator<(const TaintKey &other) const {
    return std::tie(key, value, effect) < std::tie(other.key, other.value, other.effect);
  }

  template <typename H>
  friend H AbslHashValue(H h, const TaintKey &taint) {
    return H::combine(std::move(h), taint.key, taint.value, taint.effect);
  }
};

/// The equivalence key of a node: its taints (sorted, deduplicated), its labels
/// (sorted) and its allocatable resources (exact milli values).
struct NodeTypeKey {
  std::vector<TaintKey> taints;
  std::vector<std::pair<std::string, std::string>> labels;
  std::vector<std::pair<std::string, int64_t>> allocatable;

  bool operator==(const NodeTypeKey &other) const {
    return taints == other.taints && labels == other.labels &&
           allocatable == other.allocatable;
  }
  bool operator!=(const NodeTypeKey &other) const { return !(*this == other); }
  bool operator<(const NodeTypeKey &other) const {
    return std::tie(taints, labels, allocatable) <
           std::tie(other.taints, other.labels, other.allocatable);
  }

  template <typename H>
  friend H AbslHashValue(H h, const NodeTypeKey &key) {
    return H::combine(std::move(h), key.taints, key.labels, key.allocatable);
  }

  static NodeTypeKey FromNode(const rpc::NodeInfo &node, const ResourceSet &allocatable);

  void ToProto(rpc::NodeType *node_type) const;

  std::string DebugString() const;
};

/// What one node reported, kept so that availability can be computed for any
/// priority, including ones the executor never mentioned.
struct NodeCapacity {
  std::string name;
  /// Total resources, or allocatable ones when the total is not reported.
  ResourceSet base;
  /// Empty when the executor did not break allocation down by priority.
  std::map<int32_t, ResourceSet> allocated_by_priority;
  /// Used for every priority when there is no breakdown.
  ResourceSet reported_available;
  /// Resources of live leases placed on this node, including the ones handed out
  /// by the current admission pass, by priority.
  std::map<int32_t, ResourceSet> reserved_by_priority;

  /// Resources still free for a pod of priority `priority`: the base minus the
  /// allocation at `priority` or above, where each band counts the larger of what
  /// was reported and what is reserved. Without a per-priority breakdown the
  /// reservations come on top of the reported availability.
  ResourceSet AvailableAtPriority(int32_t priority) const;
};

/// Aggregate view of the nodes sharing one NodeTypeKey.
class NodeTypeStats {
 public:
  explicit NodeTypeStats(NodeTypeKey key) : key_(std::move(key)) {}

  const NodeTypeKey &key() const { return key_; }

  size_t NodeCount() const { return nodes_.size(); }

  /// Sum of the allocatable resources of every node.
  const ResourceSet &Allocatable() const { return allocatable_; }

  /// Priorities that appear in the allocation breakdown of any node.
  const std::set<int32_t> &ReportedPriorities() const { return priorities_; }

  /// Sum over nodes of the resources available at `priority`.
  ResourceSet AvailableAtPriority(int32_t priority) const;

  /// Component-wise maximum over nodes of the resources available at `priority`.
  /// A request that is not <= this fits on no node.
  ResourceSet LargestNodeFreeAtPriority(int32_t priority) const;

  /// Index of the first node with room for `request` at `priority`.
  std::optional<size_t> FindNode(int32_t priority, const ResourceSet &request) const;

  /// Take `request` out of node `node_index` for the rest of this admission pass.
  void Reserve(size_t node_index, int32_t priority, const ResourceSet &request);

  /// Reserve for a lease placed earlier on the node called `node_name`. Returns
  /// false if no node of this type has that name.
  bool ReserveOnNode(const std::string &node_name, int32_t priority,
                     const ResourceSet &request);

  /// Whether every label in `required` is present with the same value.
  bool MatchesLabels(const ::google::protobuf::Map<std::string, std::string> &required) const;

  /// Whether the tolerations cover every NoSchedule and NoExecute taint.
  bool ToleratedBy(
      const ::google::protobuf::RepeatedPtrField<rpc::Toleration> &tolerations) const;

  /// Whether the node type carries any of the given label pairs.
  bool HasAnyLabel(const std::vector<std::pair<std::string, std::string>> &labels) const;

  void AddNode(NodeCapacity node, const ResourceSet &allocatable);

  const std::vector<NodeCapacity> &Nodes() const { return nodes_; }

 private:
  NodeTypeKey key_;
  ResourceSet allocatable_;
  std::set<int32_t> priorities_;
  std::vector<NodeCapacity> nodes_;
};

using NodeTypeMap = absl::flat_hash_map<NodeTypeKey, NodeTypeStats>;

/// Partition `nodes` into node types. Pure function of its input: the order of
/// `nodes` does not change the partition.
///
/// \return Invalid if a node carries an unparseable resource quantity.
StatusOr<NodeTypeMap> ClassifyNodes(const std::vector<rpc::NodeInfo> &nodes);

/// Node types ordered by key, for deterministic iteration.
std::vector<NodeTypeStats *> SortedNodeTypes(NodeTypeMap *node_types);

}  // namespace armada
