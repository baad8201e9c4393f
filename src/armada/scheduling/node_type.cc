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
#include <sstream>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "armada/scheduling/quantity.h"

namespace armada {

namespace {

constexpr char kEffectNoSchedule[] = "NoSchedule";
constexpr char kEffectNoExecute[] = "NoExecute";
constexpr char kOperatorExists[] = "Exists";

bool TolerationMatches(const rpc::Toleration &toleration, const TaintKey &taint) {
  if (!toleration.effect().empty() && toleration.effect() != taint.effect) {
    return false;
  }
  if (toleration.operator_() == kOperatorExists) {
    // An empty key with Exists tolerates everything.
    return toleration.key().empty() || toleration.key() == taint.key;
  }
  return toleration.key() == taint.key && toleration.value() == taint.value;
}

}  // namespace

NodeTypeKey NodeTypeKey::FromNode(const rpc::NodeInfo &node,
                                  const ResourceSet &allocatable) {
  NodeTypeKey key;
  for (const auto &taint : node.taints()) {
    key.taints.push_back(TaintKey{taint.key(), taint.value(), taint.effect()});
  }
  std::sort(key.taints.begin(), key.taints.end());
  key.taints.erase(std::unique(key.taints.begin(), key.taints.end()), key.taints.end());

  key.labels.assign(node.labels().begin(), node.labels().end());
  std::sort(key.labels.begin(), key.labels.end());

  for (const auto &[name, value] : allocatable.SortedResources()) {
    key.allocatable.emplace_back(name, value.Milli());
  }
  return key;
}

void NodeTypeKey::ToProto(rpc::NodeType *node_type) const {
  node_type->Clear();
  for (const auto &taint : taints) {
    auto *out = node_type->add_taints();
    out->set_key(taint.key);
    out->set_value(taint.value);
    out->set_effect(taint.effect);
  }
  for (const auto &[name, value] : labels) {
    (*node_type->mutable_labels())[name] = value;
  }
  for (const auto &[name, milli] : allocatable) {
    (*node_type->mutable_allocatable_resources())[name] =
        FormatQuantity(FixedPoint::FromMilli(milli));
  }
}

std::string NodeTypeKey::DebugString() const {
  std::stringstream buffer;
  buffer << "taints=["
         << absl::StrJoin(taints, ",",
                          [](std::string *out, const TaintKey &taint) {
                            absl::StrAppend(out, taint.key, "=", taint.value, ":",
                                            taint.effect);
                          })
         << "] labels=[" << absl::StrJoin(labels, ",", absl::PairFormatter("="))
         << "] allocatable=["
         << absl::StrJoin(allocatable,
                          ",",
                          [](std::string *out, const std::pair<std::string, int64_t> &r) {
                            absl::StrAppend(
                                out, r.first, "=", FormatQuantity(FixedPoint::FromMilli(r.second)));
                          })
         << "]";
  return buffer.str();
}

ResourceSet NodeCapacity::AvailableAtPriority(int32_t priority) const {
  if (!allocated_by_priority.empty()) {
    return base - CumulativeAllocation(allocated_by_priority, reserved_by_priority, priority);
  }
  ResourceSet available = reported_available;
  for (auto it = reserved_by_priority.lower_bound(priority);
       it != reserved_by_priority.end();
       ++it) {
    available -= it->second;
  }
  return available;
}

ResourceSet NodeTypeStats::AvailableAtPriority(int32_t priority) const {
  ResourceSet total;
  for (const auto &node : nodes_) {
    total += node.AvailableAtPriority(priority);
  }
  return total;
}

ResourceSet NodeTypeStats::LargestNodeFreeAtPriority(int32_t priority) const {
  ResourceSet largest;
  for (const auto &node : nodes_) {
    largest = largest.Max(node.AvailableAtPriority(priority));
  }
  return largest;
}

std::optional<size_t> NodeTypeStats::FindNode(int32_t priority,
                                              const ResourceSet &request) const {
  for (size_t i = 0; i < nodes_.size(); ++i) {
    if (request <= nodes_[i].AvailableAtPriority(priority)) {
      return i;
    }
  }
  return std::nullopt;
}

void NodeTypeStats::Reserve(size_t node_index, int32_t priority,
                            const ResourceSet &request) {
  ARMADA_CHECK_LT(node_index, nodes_.size());
  nodes_[node_index].reserved_by_priority[priority] += request;
}

bool NodeTypeStats::ReserveOnNode(const std::string &node_name, int32_t priority,
                                  const ResourceSet &request) {
  for (auto &node : nodes_) {
    if (node.name == node_name) {
      node.reserved_by_priority[priority] += request;
      return true;
    }
  }
  return false;
}

bool NodeTypeStats::MatchesLabels(
    const ::google::protobuf::Map<std::string, std::string> &required) const {
  for (const auto &[name, value] : required) {
    auto it = std::lower_bound(key_.labels.begin(),
                               key_.labels.end(),
                               std::make_pair(name, std::string()));
    if (it == key_.labels.end() || it->first != name || it->second != value) {
      return false;
    }
  }
  return true;
}

bool NodeTypeStats::ToleratedBy(
    const ::google::protobuf::RepeatedPtrField<rpc::Toleration> &tolerations) const {
  for (const auto &taint : key_.taints) {
    if (taint.effect != kEffectNoSchedule && taint.effect != kEffectNoExecute) {
      continue;
    }
    bool tolerated = std::any_of(
        tolerations.begin(), tolerations.end(), [&taint](const rpc::Toleration &t) {
          return TolerationMatches(t, taint);
        });
    if (!tolerated) {
      return false;
    }
  }
  return true;
}

bool NodeTypeStats::HasAnyLabel(
    const std::vector<std::pair<std::string, std::string>> &labels) const {
  for (const auto &label : labels) {
    if (std::binary_search(key_.labels.begin(), key_.labels.end(), label)) {
      return true;
    }
  }
  return false;
}

void NodeTypeStats::AddNode(NodeCapacity node, const ResourceSet &allocatable) {
  allocatable_ += allocatable;
  for (const auto &entry : node.allocated_by_priority) {
    priorities_.insert(entry.first);
  }
  nodes_.push_back(std::move(node));
}

StatusOr<NodeTypeMap> ClassifyNodes(const std::vector<rpc::NodeInfo> &nodes) {
  NodeTypeMap node_types;
  for (const auto &node : nodes) {
    auto prefix_error = [&node](const Status &status) {
      return Status::Invalid(absl::StrCat("node ", node.name(), ": ", status.message()));
    };
    auto allocatable = ResourceSet::FromQuantityMap(node.allocatable_resources());
    auto total = ResourceSet::FromQuantityMap(node.total_resources());
    auto available = ResourceSet::FromQuantityMap(node.available_resources());
    if (!allocatable.ok()) {
      return prefix_error(allocatable.status());
    }
    if (!total.ok()) {
      return prefix_error(total.status());
    }
    if (!available.ok()) {
      return prefix_error(available.status());
    }

    NodeCapacity capacity;
    capacity.name = node.name();
    capacity.base = total->IsEmpty() ? *allocatable : *total;
    capacity.reported_available = available->IsEmpty() ? capacity.base : *available;
    for (const auto &[priority, resources] : node.allocated_resources()) {
      auto allocated = ResourceSet::FromQuantityMap(resources.resources());
      if (!allocated.ok()) {
        return prefix_error(allocated.status());
      }
      capacity.allocated_by_priority[priority] += *allocated;
    }

    const ResourceSet &key_resources = allocatable->IsEmpty() ? *total : *allocatable;
    auto key = NodeTypeKey::FromNode(node, key_resources);
    auto it = node_types.find(key);
    if (it == node_types.end()) {
      it = node_types.emplace(key, NodeTypeStats(key)).first;
    }
    it->second.AddNode(std::move(capacity), key_resources);
  }
  return node_types;
}

std::vector<NodeTypeStats *> SortedNodeTypes(NodeTypeMap *node_types) {
  std::vector<NodeTypeStats *> sorted;
  sorted.reserve(node_types->size());
  for (auto &entry : *node_types) {
    sorted.push_back(&entry.second);
  }
  std::sort(sorted.begin(), sorted.end(), [](const NodeTypeStats *a, const NodeTypeStats *b) {
    return a->key() < b->key();
  });
  return sorted;
}

}  // namespace armada
