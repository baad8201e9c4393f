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

#include "armada/scheduling/quantity.h"

#include <cstdint>
#include <limits>

#include "absl/numeric/int128.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace armada {

namespace {

// Significant mantissa digits beyond this cannot fit in 64 bits of milli units.
constexpr int kMaxMantissaDigits = 30;
constexpr int kMaxDivisorExponent = 38;

struct Suffix {
  int binary_power = 0;
  int decimal_exponent = 0;
};

bool ParseSuffix(std::string_view suffix, Suffix *out) {
  if (suffix.empty()) {
    return true;
  }
  if (suffix.size() == 2 && suffix[1] == 'i') {
    switch (suffix[0]) {
    case 'K':
      out->binary_power = 1;
      return true;
    case 'M':
      out->binary_power = 2;
      return true;
    case 'G':
      out->binary_power = 3;
      return true;
    case 'T':
      out->binary_power = 4;
      return true;
    case 'P':
      out->binary_power = 5;
      return true;
    case 'E':
      out->binary_power = 6;
      return true;
    default:
      return false;
    }
  }
  if (suffix.size() == 1) {
    switch (suffix[0]) {
    case 'n':
      out->decimal_exponent = -9;
      return true;
    case 'u':
      out->decimal_exponent = -6;
      return true;
    case 'm':
      out->decimal_exponent = -3;
      return true;
    case 'k':
      out->decimal_exponent = 3;
      return true;
    case 'M':
      out->decimal_exponent = 6;
      return true;
    case 'G':
      out->decimal_exponent = 9;
      return true;
    case 'T':
      out->decimal_exponent = 12;
      return true;
    case 'P':
      out->decimal_exponent = 15;
      return true;
    case 'E':
      out->decimal_exponent = 18;
      return true;
    default:
      return false;
    }
  }
  // Decimal exponent form, e.g. "e3" or "E-2".
  if (suffix[0] == 'e' || suffix[0] == 'E') {
    int exponent = 0;
    std::string_view digits = suffix.substr(1);
    if (digits.empty() || !absl::SimpleAtoi(digits, &exponent) || exponent > 100 ||
        exponent < -100) {
      return false;
    }
    out->decimal_exponent = exponent;
    return true;
  }
  return false;
}

}  // namespace

StatusOr<FixedPoint> ParseQuantity(std::string_view quantity) {
  auto invalid = [&quantity](std::string_view reason) {
    return Status::Invalid(absl::StrCat("invalid quantity \"", quantity, "\": ", reason));
  };
  if (quantity.empty()) {
    return invalid("empty");
  }

  size_t pos = 0;
  bool negative = false;
  if (quantity[pos] == '+' || quantity[pos] == '-') {
    negative = quantity[pos] == '-';
    ++pos;
  }

  absl::int128 mantissa = 0;
  int significant_digits = 0;
  int fraction_digits = 0;
  int digits_seen = 0;
  bool seen_point = false;
  for (; pos < quantity.size(); ++pos) {
    const char c = quantity[pos];
    if (c == '.') {
      if (seen_point) {
        return invalid("more than one decimal point");
      }
      seen_point = true;
      continue;
    }
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
      break;
    }
    ++digits_seen;
    if (seen_point) {
      ++fraction_digits;
    }
    if (mantissa == 0 && c == '0') {
      continue;
    }
    if (++significant_digits > kMaxMantissaDigits) {
      return invalid("too many digits");
    }
    mantissa = mantissa * 10 + (c - '0');
  }
  if (digits_seen == 0) {
    return invalid("no digits");
  }

  Suffix suffix;
  if (!ParseSuffix(quantity.substr(pos), &suffix)) {
    return invalid("unknown suffix");
  }

  for (int i = 0; i < suffix.binary_power; ++i) {
    if (mantissa > absl::Int128Max() / 1024) {
      return invalid("out of range");
    }
    mantissa *= 1024;
  }

  const absl::int128 max_value = std::numeric_limits<int64_t>::max();
  int exponent = 3 - fraction_digits + suffix.decimal_exponent;
  if (exponent >= 0) {
    for (int i = 0; i < exponent && mantissa != 0; ++i) {
      mantissa *= 10;
      if (mantissa > max_value) {
        return invalid("out of range");
      }
    }
  } else if (-exponent > kMaxDivisorExponent) {
    mantissa = mantissa == 0 ? 0 : 1;
  } else {
    absl::int128 divisor = 1;
    for (int i = 0; i < -exponent; ++i) {
      divisor *= 10;
    }
    const bool has_remainder = mantissa % divisor != 0;
    mantissa /= divisor;
    // Round up towards positive infinity.
    if (has_remainder && !negative) {
      mantissa += 1;
    }
  }
  if (mantissa > max_value) {
    return invalid("out of range");
  }

  const int64_t milli = static_cast<int64_t>(mantissa);
  return FixedPoint::FromMilli(negative ? -milli : milli);
}

std::string FormatQuantity(FixedPoint value) {
  const int64_t milli = value.Milli();
  if (milli % kResourceUnitScaling == 0) {
    return absl::StrCat(milli / kResourceUnitScaling);
  }
  return absl::StrCat(milli, "m");
}

}  // namespace armada
