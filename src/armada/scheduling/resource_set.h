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

#include <google/protobuf/map.h>

#include <cstdint>
#include <map>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status_or.h"
#include "armada/scheduling/fixed_point.h"

namespace armada {

/// Represents a set of resources and their values, keyed by resource name
/// ("cpu", "memory", "nvidia.com/gpu").
/// If any resource value is changed to 0, the resource will be removed.
/// Negative values are valid in this set; they show up as the result of a subtraction.
class ResourceSet {
 public:
  using QuantityMap = ::google::protobuf::Map<std::string, std::string>;

  ResourceSet() {}

  explicit ResourceSet(const absl::flat_hash_map<std::string, FixedPoint> &resource_map);

  /// Build a set from Kubernetes quantity strings.
  ///
  /// \return Invalid if any quantity cannot be parsed.
  static StatusOr<ResourceSet> FromQuantityMap(const QuantityMap &quantities);

  bool operator==(const ResourceSet &other) const;
  bool operator!=(const ResourceSet &other) const { return !(*this == other); }

  ResourceSet operator+(const ResourceSet &other) const;
  ResourceSet operator-(const ResourceSet &other) const;
  ResourceSet &operator+=(const ResourceSet &other);
  ResourceSet &operator-=(const ResourceSet &other);

  /// Check whether this set is a subset of another one.
  /// If A <= B, it means for each resource, its value in A is less than or equal to that
  /// in B. A resource missing from a set counts as zero.
  bool operator<=(const ResourceSet &other) const;

  bool operator>=(const ResourceSet &other) const { return other <= *this; }

  /// Return the quantity value associated with the specified resource, zero if the
  /// resource does not exist.
  FixedPoint Get(const std::string &resource) const;

  /// Set a resource to the given value.
  /// NOTE: if the new value is 0, the resource will be removed.
  ResourceSet &Set(const std::string &resource, FixedPoint value);

  bool Has(const std::string &resource) const { return resources_.contains(resource); }

  size_t Size() const { return resources_.size(); }

  void Clear() { resources_.clear(); }

  bool IsEmpty() const { return resources_.empty(); }

  /// Whether no resource in this set is negative.
  bool IsNonNegative() const;

  /// Replace every negative value with zero. Return true if anything changed.
  bool ClampNegative();

  /// Component-wise maximum of the two sets.
  ResourceSet Max(const ResourceSet &other) const;

  const absl::flat_hash_map<std::string, FixedPoint> &Resources() const {
    return resources_;
  }

  /// Resources sorted by name, used for keys and for deterministic output.
  std::map<std::string, FixedPoint> SortedResources() const;

  /// Write the set as quantity strings.
  void ToQuantityMap(QuantityMap *out) const;

  std::string DebugString() const;

 private:
  /// Map from the resource names to the resource values.
  absl::flat_hash_map<std::string, FixedPoint> resources_;
};

std::ostream &operator<<(std::ostream &os, const ResourceSet &resources);

/// Resources allocated at `priority` and every band above it. A band counts the
/// component-wise maximum of what the executor `reported` and what this server
/// `committed` there: running leased pods show up in both.
ResourceSet CumulativeAllocation(const std::map<int32_t, ResourceSet> &reported,
                                 const std::map<int32_t, ResourceSet> &committed,
                                 int32_t priority);

}  // namespace armada
