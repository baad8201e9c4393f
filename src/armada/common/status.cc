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

#include "armada/common/status.h"

#include <ostream>
#include <string_view>

#include "absl/container/flat_hash_map.h"

namespace armada {

constexpr std::string_view kStatusCodeOk = "OK";
// not a real status (catch all for codes not known)
constexpr std::string_view kStatusCodeUnknown = "Unknown";

namespace {

const absl::flat_hash_map<StatusCode, std::string_view> kCodeToStr = {
    {StatusCode::OK, kStatusCodeOk},
    {StatusCode::Invalid, "Invalid"},
    {StatusCode::IOError, "IOError"},
    {StatusCode::UnknownError, "Unknown error"},
    {StatusCode::TimedOut, "TimedOut"},
    {StatusCode::NotFound, "NotFound"},
    {StatusCode::Disconnected, "Disconnected"},
    {StatusCode::AlreadyExists, "AlreadyExists"},
    {StatusCode::Unavailable, "Unavailable"},
    {StatusCode::Unauthenticated, "Unauthenticated"},
};

const absl::flat_hash_map<std::string_view, StatusCode> kStrToCode = []() {
  absl::flat_hash_map<std::string_view, StatusCode> str_to_code;
  for (const auto &pair : kCodeToStr) {
    str_to_code[pair.second] = pair.first;
  }
  return str_to_code;
}();

}  // namespace

Status::Status(StatusCode code, const std::string &msg) {
  ARMADA_CHECK(code != StatusCode::OK);
  state_ = new State;
  state_->code = code;
  state_->msg = msg;
}

void Status::CopyFrom(const State *state) {
  delete state_;
  if (state == nullptr) {
    state_ = nullptr;
  } else {
    state_ = new State(*state);
  }
}

std::string Status::CodeAsString() const {
  if (state_ == nullptr) {
    return std::string(kStatusCodeOk);
  }

  auto it = kCodeToStr.find(code());
  if (it == kCodeToStr.end()) {
    return std::string(kStatusCodeUnknown);
  }
  return std::string(it->second);
}

StatusCode Status::StringToCode(const std::string &str) {
  // Note: unknown string is mapped to IOError, while unknown code is mapped to "Unknown"
  // which is not an error. This means code -> string -> code is not identity.
  auto it = kStrToCode.find(str);
  if (it == kStrToCode.end()) {
    return StatusCode::IOError;
  }
  return it->second;
}

std::string Status::ToString() const {
  std::string result(CodeAsString());
  if (state_ == nullptr) {
    return result;
  }
  result += ": ";
  result += state_->msg;
  return result;
}

std::ostream &operator<<(std::ostream &os, const Status &x) {
  os << x.ToString();
  return os;
}

}  // namespace armada
