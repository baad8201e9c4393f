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

#include <cmath>
#include <cstdint>
#include <iostream>

namespace armada {

/// Resource quantities are kept in thousandths (the Kubernetes "milli" unit), so
/// "100m" CPU and "1.5Gi" memory both add and compare exactly.
constexpr int64_t kResourceUnitScaling = 1000;

/// Fixed point data type.
class FixedPoint {
 private:
  int64_t i_ = 0;

 public:
  FixedPoint(double d = 0)  // NOLINT
      : i_(static_cast<int64_t>(std::llround(d * kResourceUnitScaling))) {}

  static FixedPoint FromMilli(int64_t milli) {
    FixedPoint res;
    res.i_ = milli;
    return res;
  }

  FixedPoint operator+(FixedPoint const &ru) const { return FromMilli(i_ + ru.i_); }

  FixedPoint &operator+=(FixedPoint const &ru) {
    i_ += ru.i_;
    return *this;
  }

  FixedPoint operator-(FixedPoint const &ru) const { return FromMilli(i_ - ru.i_); }

  FixedPoint &operator-=(FixedPoint const &ru) {
    i_ -= ru.i_;
    return *this;
  }

  FixedPoint operator-() const { return FromMilli(-i_); }

  friend bool operator<(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ < ru2.i_;
  }
  friend bool operator>(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ > ru2.i_;
  }
  friend bool operator<=(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ <= ru2.i_;
  }
  friend bool operator>=(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ >= ru2.i_;
  }
  friend bool operator==(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ == ru2.i_;
  }
  friend bool operator!=(FixedPoint const &ru1, FixedPoint const &ru2) {
    return ru1.i_ != ru2.i_;
  }

  double Double() const { return static_cast<double>(i_) / kResourceUnitScaling; }

  int64_t Milli() const { return i_; }

  friend std::ostream &operator<<(std::ostream &out, FixedPoint const &ru) {
    out << ru.Double();
    return out;
  }
};

}  // namespace armada
