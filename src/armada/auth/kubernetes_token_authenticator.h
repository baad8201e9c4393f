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

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "armada/auth/authenticator.h"
#include "armada/auth/token_cache.h"
#include "armada/auth/token_reviewer.h"
#include "armada/util/macros.h"
#include "armada/util/time.h"

namespace armada {

/// Scheme prefix of the authorization value handled by
/// KubernetesTokenAuthenticator.
inline constexpr char kKubernetesAuthScheme[] = "KubernetesAuth ";

/// \class KubernetesTokenAuthenticator
///
/// Authenticates executors by the service account token of the cluster they
/// run in. The authorization value is
///
///   KubernetesAuth <base64url(JSON {"token": <jwt>, "ca": <base64url PEM>})>
///
/// The `kid` in the JWT header names a file under `kid_mapping_dir` holding
/// the API server URL of the issuing cluster. That API server reviews the
/// token. Results are cached: accepted tokens until the earlier of their
/// expiry and `valid_token_max_ttl_ms`, rejected ones for
/// `invalid_token_ttl_ms`. Failures to reach the API server are not cached.
class KubernetesTokenAuthenticator : public AuthenticatorInterface {
 public:
  KubernetesTokenAuthenticator(std::string kid_mapping_dir,
                               std::shared_ptr<TokenReviewerInterface> reviewer,
                               int64_t invalid_token_ttl_ms,
                               int64_t valid_token_max_ttl_ms,
                               ClockFn wall_clock = current_sys_time_ms);

  StatusOr<Principal> Authenticate(std::string_view authorization) override;

  /// Drop expired cache entries. Returns how many were dropped.
  size_t SweepCache() { return cache_.Sweep(); }

  size_t CacheSize() const { return cache_.size(); }

 private:
  struct Credentials {
    std::string token;
    std::string ca;
  };

  struct TokenClaims {
    std::string kid;
    int64_t expires_at_ms = 0;
  };

  static StatusOr<Credentials> ParseCredentials(std::string_view authorization);

  static StatusOr<TokenClaims> ParseToken(const std::string &token);

  StatusOr<std::string> LookupClusterUrl(const std::string &kid) const;

  const std::string kid_mapping_dir_;
  std::shared_ptr<TokenReviewerInterface> reviewer_;
  const int64_t invalid_token_ttl_ms_;
  const int64_t valid_token_max_ttl_ms_;
  ClockFn wall_clock_;
  TokenCache cache_;

  ARMADA_DISALLOW_COPY_AND_ASSIGN(KubernetesTokenAuthenticator);
};

}  // namespace armada
