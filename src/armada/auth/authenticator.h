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
#include <utility>
#include <vector>

#include "armada/common/status_or.h"

namespace armada {

/// Metadata key carrying the credentials of a call.
inline constexpr char kAuthorizationKey[] = "authorization";

/// The authenticated caller of an RPC.
struct Principal {
  std::string name;
  std::vector<std::string> groups;

  static Principal Static(std::string name) {
    Principal principal;
    principal.groups.push_back(name);
    principal.name = std::move(name);
    return principal;
  }
};

/// \class AuthenticatorInterface
///
/// Verifies the credentials sent with a call. Implementations are called from
/// concurrent handlers and must be thread safe.
class AuthenticatorInterface {
 public:
  virtual ~AuthenticatorInterface() = default;

  /// \param authorization Value of the authorization metadata, empty if absent.
  /// \return Unauthenticated if the credentials are missing or rejected,
  /// Unavailable if they could not be checked right now.
  virtual StatusOr<Principal> Authenticate(std::string_view authorization) = 0;
};

/// Accepts every call as the anonymous user.
class AnonymousAuthenticator : public AuthenticatorInterface {
 public:
  StatusOr<Principal> Authenticate(std::string_view authorization) override {
    Principal principal;
    principal.name = "anonymous";
    principal.groups.push_back("everyone");
    return principal;
  }
};

}  // namespace armada
