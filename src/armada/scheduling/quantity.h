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

#include <string>
#include <string_view>

#include "armada/common/status_or.h"
#include "armada/scheduling/fixed_point.h"

namespace armada {

/// Parse a Kubernetes resource quantity such as "100m", "2", "1.5Gi" or "4e3".
///
/// Supported suffixes are the decimal SI ones (n, u, m, k, M, G, T, P, E), the
/// binary ones (Ki, Mi, Gi, Ti, Pi, Ei) and a decimal exponent (e3, E-2). Values
/// finer than a milli unit are rounded up, as Kubernetes does.
///
/// \return Invalid if the string is not a quantity or does not fit in 64 bits of
/// milli units.
StatusOr<FixedPoint> ParseQuantity(std::string_view quantity);

/// Format a value back to a quantity string: "2" for whole units, "1500m" otherwise.
std::string FormatQuantity(FixedPoint value);

}  // namespace armada
