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

// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.

#pragma once

#include <iosfwd>
#include <string>

#include "armada/util/logging.h"
#include "armada/util/macros.h"

// Return the given status if it is not OK.
#define ARMADA_RETURN_NOT_OK(s)           \
  do {                                    \
    ::armada::Status _s = (s);            \
    if (ARMADA_PREDICT_FALSE(!_s.ok())) { \
      return _s;                          \
    }                                     \
  } while (0)

#define ARMADA_RETURN_NOT_OK_ELSE(s, else_) \
  do {                                      \
    ::armada::Status _s = (s);              \
    if (!_s.ok()) {                         \
      else_;                                \
      return _s;                            \
    }                                       \
  } while (0)

// If 'to_call' returns a bad status, CHECK immediately with a logged message
// of 'msg' followed by the status.
#define ARMADA_CHECK_OK_PREPEND(to_call, msg)                \
  do {                                                       \
    ::armada::Status _s = (to_call);                         \
    ARMADA_CHECK(_s.ok()) << (msg) << ": " << _s.ToString(); \
  } while (0)

// If the status is bad, CHECK immediately, appending the status to the
// logged message.
#define ARMADA_CHECK_OK(s) ARMADA_CHECK_OK_PREPEND(s, "Bad status")

namespace armada {

enum class StatusCode : char {
  OK = 0,
  Invalid = 4,
  IOError = 5,
  UnknownError = 9,
  TimedOut = 12,
  NotFound = 17,
  Disconnected = 18,
  AlreadyExists = 20,
  // Transient failure of a collaborator (store, oracle). Retryable.
  Unavailable = 26,
  Unauthenticated = 30,
};

class Status {
 public:
  // Create a success status.
  Status() : state_(nullptr) {}
  ~Status() { delete state_; }

  Status(StatusCode code, const std::string &msg);

  // Copy the specified status.
  Status(const Status &s);
  Status &operator=(const Status &s);

  Status(Status &&s) noexcept : state_(s.state_) { s.state_ = nullptr; }
  Status &operator=(Status &&s) noexcept {
    if (this != &s) {
      delete state_;
      state_ = s.state_;
      s.state_ = nullptr;
    }
    return *this;
  }

  // Return a success status.
  static Status OK() { return Status(); }

  static Status Invalid(const std::string &msg) {
    return Status(StatusCode::Invalid, msg);
  }

  static Status IOError(const std::string &msg) {
    return Status(StatusCode::IOError, msg);
  }

  static Status UnknownError(const std::string &msg) {
    return Status(StatusCode::UnknownError, msg);
  }

  static Status TimedOut(const std::string &msg) {
    return Status(StatusCode::TimedOut, msg);
  }

  static Status NotFound(const std::string &msg) {
    return Status(StatusCode::NotFound, msg);
  }

  static Status Disconnected(const std::string &msg) {
    return Status(StatusCode::Disconnected, msg);
  }

  static Status AlreadyExists(const std::string &msg) {
    return Status(StatusCode::AlreadyExists, msg);
  }

  static Status Unavailable(const std::string &msg) {
    return Status(StatusCode::Unavailable, msg);
  }

  static Status Unauthenticated(const std::string &msg) {
    return Status(StatusCode::Unauthenticated, msg);
  }

  static StatusCode StringToCode(const std::string &str);

  // Returns true iff the status indicates success.
  bool ok() const { return (state_ == nullptr); }

  bool IsInvalid() const { return code() == StatusCode::Invalid; }
  bool IsIOError() const { return code() == StatusCode::IOError; }
  bool IsUnknownError() const { return code() == StatusCode::UnknownError; }
  bool IsTimedOut() const { return code() == StatusCode::TimedOut; }
  bool IsNotFound() const { return code() == StatusCode::NotFound; }
  bool IsDisconnected() const { return code() == StatusCode::Disconnected; }
  bool IsAlreadyExists() const { return code() == StatusCode::AlreadyExists; }
  bool IsUnavailable() const { return code() == StatusCode::Unavailable; }
  bool IsUnauthenticated() const { return code() == StatusCode::Unauthenticated; }

  // Transient infrastructure failures; the caller may retry the whole call.
  bool IsRetryable() const { return IsUnavailable() || IsTimedOut(); }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  // Return a string representation of the status code, without the message
  // text or posix code information.
  std::string CodeAsString() const;

  StatusCode code() const { return ok() ? StatusCode::OK : state_->code; }

  std::string message() const { return ok() ? "" : state_->msg; }

 private:
  struct State {
    StatusCode code;
    std::string msg;
  };
  // OK status has a `nullptr` state_.  Otherwise, `state_` points to
  // a `State` structure containing the error code and message(s)
  State *state_;

  void CopyFrom(const State *s);
};

std::ostream &operator<<(std::ostream &os, const Status &x);

inline Status::Status(const Status &s)
    : state_((s.state_ == nullptr) ? nullptr : new State(*s.state_)) {}

inline Status &Status::operator=(const Status &s) {
  // The following condition catches both aliasing (when this == &s),
  // and the common case where both s and *this are ok.
  if (state_ != s.state_) {
    CopyFrom(s.state_);
  }
  return *this;
}

}  // namespace armada
