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
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "armada/scheduling/quantity.h"
#include "armada/scheduling/resource_set.h"
#include "src/armada/protobuf/queue.pb.h"

namespace armada {

/// Build a ResourceSet from whole or fractional units, e.g. {{"cpu", 4}}.
inline ResourceSet MakeResources(const absl::flat_hash_map<std::string, double> &units) {
  ResourceSet resources;
  for (const auto &[name, value] : units) {
    resources.Set(name, FixedPoint(value));
  }
  return resources;
}

inline void FillQuantities(const absl::flat_hash_map<std::string, double> &units,
                           ::google::protobuf::Map<std::string, std::string> *out) {
  MakeResources(units).ToQuantityMap(out);
}

/// A node with `total` resources of which `allocated` are taken at each priority.
inline rpc::NodeInfo MakeNode(
    const std::string &name,
    const absl::flat_hash_map<std::string, double> &total,
    const std::vector<std::pair<std::string, std::string>> &labels = {},
    const std::vector<std::pair<int32_t, absl::flat_hash_map<std::string, double>>>
        &allocated = {}) {
  rpc::NodeInfo node;
  node.set_name(name);
  FillQuantities(total, node.mutable_total_resources());
  FillQuantities(total, node.mutable_allocatable_resources());
  for (const auto &[key, value] : labels) {
    (*node.mutable_labels())[key] = value;
  }
  ResourceSet available = MakeResources(total);
  for (const auto &[priority, resources] : allocated) {
    FillQuantities(resources,
                   (*node.mutable_allocated_resources())[priority].mutable_resources());
    available -= MakeResources(resources);
  }
  available.ToQuantityMap(node.mutable_available_resources());
  return node;
}

inline rpc::Job MakeJob(const std::string &id,
                        const std::string &queue,
                        const absl::flat_hash_map<std::string, double> &request,
                        int32_t priority_class = 0,
                        double priority = 0) {
  rpc::Job job;
  job.set_id(id);
  job.set_queue(queue);
  job.set_job_set_id(queue + "-set");
  job.set_priority(priority);
  job.set_priority_class(priority_class);
  FillQuantities(request, job.mutable_resource_requirements());
  return job;
}

}  // namespace armada
