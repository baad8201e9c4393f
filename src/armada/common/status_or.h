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

#include <optional>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "armada/common/status.h"
#include "armada/util/macros.h"

#define __ARMADA_ASSIGN_OR_RETURN_IMPL(var, expr, statusor_name) \
  auto statusor_name = (expr);                                   \
  ARMADA_RETURN_NOT_OK(statusor_name.status());                  \
  var = std::move(statusor_name).value()

// Use `ARMADA_UNIQUE_VARIABLE` to add line number into variable name, since we could
// have multiple macros used in one code block.
#define ARMADA_ASSIGN_OR_RETURN(var, expr) \
  __ARMADA_ASSIGN_OR_RETURN_IMPL(var, expr, ARMADA_UNIQUE_VARIABLE(statusor))

namespace armada {

template <typename T>
class StatusOr {
 public:
  StatusOr() : status_(Status::UnknownError("Uninitialized StatusOr")) {}
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(Status status) : status_(std::move(status)) {
    ARMADA_CHECK(!status_.ok()) << "StatusOr built from an OK status without a value";
  }
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(const T &data) : status_(Status::OK()), data_(data) {}
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(T &&data) : status_(Status::OK()), data_(std::move(data)) {}

  template <typename U,
            typename = std::enable_if_t<std::is_constructible_v<T, U &&> &&
                                        !std::is_same_v<std::decay_t<U>, T> &&
                                        !std::is_same_v<std::decay_t<U>, Status> &&
                                        !std::is_same_v<std::decay_t<U>, StatusOr<T>>>>
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(U &&data) : status_(Status::OK()), data_(std::in_place, std::forward<U>(data)) {}

  StatusOr(const StatusOr &rhs) = default;
  StatusOr &operator=(const StatusOr &rhs) = default;
  StatusOr(StatusOr &&rhs) noexcept(std::is_nothrow_move_constructible_v<T>) = default;
  StatusOr &operator=(StatusOr &&rhs) noexcept(std::is_nothrow_move_assignable_v<T>) =
      default;

  // Returns whether or not this `armada::StatusOr<T>` holds a `T` value.
  bool ok() const { return status_.ok(); }
  explicit operator bool() const { return ok(); }

  ABSL_MUST_USE_RESULT StatusCode code() const { return status_.code(); }

  ABSL_MUST_USE_RESULT std::string message() const { return status_.message(); }

  ABSL_MUST_USE_RESULT const Status &status() const & { return status_; }
  ABSL_MUST_USE_RESULT Status status() && {
    Status new_status = std::move(status_);
    return new_status;
  }

  // Returns a reference to the current value. Check-fails if there is no value.
  T &value() & {
    CheckHasValue();
    return *data_;
  }
  const T &value() const & {
    CheckHasValue();
    return *data_;
  }
  T &&value() && {
    CheckHasValue();
    return std::move(*data_);
  }

  template <typename U>
  T value_or(U &&u) const & {
    return ok() ? *data_ : T{std::forward<U>(u)};
  }

  T &operator*() & { return value(); }
  const T &operator*() const & { return value(); }
  T &&operator*() && { return std::move(*this).value(); }

  T *operator->() { return &value(); }
  const T *operator->() const { return &value(); }

 private:
  void CheckHasValue() const {
    ARMADA_CHECK(ok()) << "Accessing value of an errored StatusOr: "
                       << status_.ToString();
  }

  Status status_;
  std::optional<T> data_;
};

}  // namespace armada
