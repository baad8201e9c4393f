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

#include <sstream>

#include "armada/scheduling/quantity.h"

namespace armada {

ResourceSet::ResourceSet(
    const absl::flat_hash_map<std::string, FixedPoint> &resource_map) {
  for (auto const &[name, quantity] : resource_map) {
    Set(name, quantity);
  }
}

StatusOr<ResourceSet> ResourceSet::FromQuantityMap(const QuantityMap &quantities) {
  ResourceSet result;
  for (const auto &[name, quantity] : quantities) {
    ARMADA_ASSIGN_OR_RETURN(auto value, ParseQuantity(quantity));
    result.Set(name, value);
  }
  return result;
}

bool ResourceSet::operator==(const ResourceSet &other) const {
  return this->resources_ == other.resources_;
}

ResourceSet ResourceSet::operator+(const ResourceSet &other) const {
  ResourceSet res = *this;
  res += other;
  return res;
}

ResourceSet ResourceSet::operator-(const ResourceSet &other) const {
  ResourceSet res = *this;
  res -= other;
  return res;
}

ResourceSet &ResourceSet::operator+=(const ResourceSet &other) {
  for (auto &entry : other.resources_) {
    Set(entry.first, Get(entry.first) + entry.second);
  }
  return *this;
}

ResourceSet &ResourceSet::operator-=(const ResourceSet &other) {
  for (auto &entry : other.resources_) {
    Set(entry.first, Get(entry.first) - entry.second);
  }
  return *this;
}

bool ResourceSet::operator<=(const ResourceSet &other) const {
  // Check all resources that exist in this.
  for (auto &entry : resources_) {
    if (entry.second > other.Get(entry.first)) {
      return false;
    }
  }
  // Check all resources that exist in other, but not in this.
  for (auto &entry : other.resources_) {
    if (!resources_.contains(entry.first) && entry.second < 0) {
      return false;
    }
  }
  return true;
}

FixedPoint ResourceSet::Get(const std::string &resource) const {
  auto it = resources_.find(resource);
  if (it == resources_.end()) {
    return FixedPoint(0);
  }
  return it->second;
}

ResourceSet &ResourceSet::Set(const std::string &resource, FixedPoint value) {
  if (value == 0) {
    resources_.erase(resource);
  } else {
    resources_[resource] = value;
  }
  return *this;
}

bool ResourceSet::IsNonNegative() const {
  for (const auto &entry : resources_) {
    if (entry.second < 0) {
      return false;
    }
  }
  return true;
}

bool ResourceSet::ClampNegative() {
  bool changed = false;
  for (auto it = resources_.begin(); it != resources_.end();) {
    if (it->second < 0) {
      resources_.erase(it++);
      changed = true;
    } else {
      ++it;
    }
  }
  return changed;
}

ResourceSet ResourceSet::Max(const ResourceSet &other) const {
  ResourceSet res = *this;
  for (const auto &entry : other.resources_) {
    if (entry.second > res.Get(entry.first)) {
      res.Set(entry.first, entry.second);
    }
  }
  return res;
}

std::map<std::string, FixedPoint> ResourceSet::SortedResources() const {
  return std::map<std::string, FixedPoint>(resources_.begin(), resources_.end());
}

void ResourceSet::ToQuantityMap(QuantityMap *out) const {
  out->clear();
  for (const auto &[name, value] : resources_) {
    (*out)[name] = FormatQuantity(value);
  }
}

std::string ResourceSet::DebugString() const {
  std::stringstream buffer;
  buffer << "{";
  bool first = true;
  for (const auto &[name, value] : SortedResources()) {
    if (!first) {
      buffer << ", ";
    }
    first = false;
    buffer << name << ": " << FormatQuantity(value);
  }
  buffer << "}";
  return buffer.str();
}

std::ostream &operator<<(std::ostream &os, const ResourceSet &resources) {
  return os << resources.DebugString();
}

ResourceSet CumulativeAllocation(const std::map<int32_t, ResourceSet> &reported,
                                 const std::map<int32_t, ResourceSet> &committed,
                                 int32_t priority) {
  ResourceSet cumulative;
  auto r = reported.lower_bound(priority);
  auto c = committed.lower_bound(priority);
  while (r != reported.end() || c != committed.end()) {
    if (c == committed.end() || (r != reported.end() && r->first < c->first)) {
      cumulative += r->second;
      ++r;
    } else if (r == reported.end() || c->first < r->first) {
      cumulative += c->second;
      ++c;
    } else {
      cumulative += r->second.Max(c->second);
      ++r;
      ++c;
    }
  }
  return cumulative;
}

}  // namespace armada
