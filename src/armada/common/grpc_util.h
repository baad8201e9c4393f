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
#include <google/protobuf/repeated_field.h>
#include <grpcpp/grpcpp.h>

#include <sstream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status.h"

namespace armada {

/// Helper function that converts an armada status to a gRPC status.
inline grpc::Status StatusToGrpcStatus(const Status &status) {
  if (status.ok()) {
    return grpc::Status::OK;
  }
  grpc::StatusCode code;
  switch (status.code()) {
  case StatusCode::Invalid:
    code = grpc::StatusCode::INVALID_ARGUMENT;
    break;
  case StatusCode::NotFound:
    code = grpc::StatusCode::NOT_FOUND;
    break;
  case StatusCode::AlreadyExists:
    code = grpc::StatusCode::ALREADY_EXISTS;
    break;
  case StatusCode::Unauthenticated:
    code = grpc::StatusCode::UNAUTHENTICATED;
    break;
  case StatusCode::Unavailable:
  case StatusCode::IOError:
  case StatusCode::Disconnected:
    code = grpc::StatusCode::UNAVAILABLE;
    break;
  case StatusCode::TimedOut:
    code = grpc::StatusCode::DEADLINE_EXCEEDED;
    break;
  default:
    code = grpc::StatusCode::UNKNOWN;
  }
  return grpc::Status(code, status.message());
}

/// Helper function that converts a gRPC status to an armada status.
inline Status GrpcStatusToStatus(const grpc::Status &grpc_status) {
  if (grpc_status.ok()) {
    return Status::OK();
  }
  std::stringstream msg;
  msg << grpc_status.error_code() << ": " << grpc_status.error_message();
  switch (grpc_status.error_code()) {
  case grpc::StatusCode::UNAVAILABLE:
    return Status::Unavailable(msg.str());
  case grpc::StatusCode::DEADLINE_EXCEEDED:
    return Status::TimedOut(msg.str());
  default:
    return Status::IOError(msg.str());
  }
}

/// Converts a Protobuf `RepeatedPtrField` to a vector.
template <class T>
inline std::vector<T> VectorFromProtobuf(
    const ::google::protobuf::RepeatedPtrField<T> &pb_repeated) {
  return std::vector<T>(pb_repeated.begin(), pb_repeated.end());
}

/// Add a vector type to a protobuf `RepeatedPtrField`.
template <class T>
inline void AddToProtobuf(const std::vector<T> &vec,
                          ::google::protobuf::RepeatedPtrField<T> *pb_repeated) {
  for (const auto &elem : vec) {
    *pb_repeated->Add() = elem;
  }
}

/// Converts a Protobuf map to a flat hash map.
template <class K, class V>
inline absl::flat_hash_map<K, V> MapFromProtobuf(const ::google::protobuf::Map<K, V> &pb_map) {
  return absl::flat_hash_map<K, V>(pb_map.begin(), pb_map.end());
}

}  // namespace armada
