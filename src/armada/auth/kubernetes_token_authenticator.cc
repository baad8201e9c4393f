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

#include "armada/auth/kubernetes_token_authenticator.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "armada/util/logging.h"
#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace armada {

namespace {

/// JWT segments and the credentials blob may come with or without padding.
bool DecodeBase64Url(std::string_view encoded, std::string *decoded) {
  while (absl::ConsumeSuffix(&encoded, "=")) {
  }
  return absl::WebSafeBase64Unescape(encoded, decoded);
}

StatusOr<json> DecodeJsonSegment(std::string_view segment, const char *what) {
  std::string decoded;
  if (!DecodeBase64Url(segment, &decoded)) {
    return Status::Unauthenticated(absl::StrCat(what, " is not base64url"));
  }
  json parsed = json::parse(decoded, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return Status::Unauthenticated(absl::StrCat(what, " is not a JSON object"));
  }
  return parsed;
}

}  // namespace

KubernetesTokenAuthenticator::KubernetesTokenAuthenticator(
    std::string kid_mapping_dir,
    std::shared_ptr<TokenReviewerInterface> reviewer,
    int64_t invalid_token_ttl_ms,
    int64_t valid_token_max_ttl_ms,
    ClockFn wall_clock)
    : kid_mapping_dir_(std::move(kid_mapping_dir)),
      reviewer_(std::move(reviewer)),
      invalid_token_ttl_ms_(invalid_token_ttl_ms),
      valid_token_max_ttl_ms_(valid_token_max_ttl_ms),
      wall_clock_(std::move(wall_clock)),
      cache_(wall_clock_) {}

StatusOr<KubernetesTokenAuthenticator::Credentials>
KubernetesTokenAuthenticator::ParseCredentials(std::string_view authorization) {
  authorization = absl::StripAsciiWhitespace(authorization);
  if (!absl::ConsumePrefix(&authorization, kKubernetesAuthScheme)) {
    return Status::Unauthenticated("missing credentials");
  }
  ARMADA_ASSIGN_OR_RETURN(json body,
                          DecodeJsonSegment(absl::StripAsciiWhitespace(authorization),
                                            "credentials"));
  Credentials credentials;
  auto token = body.find("token");
  if (token == body.end() || !token->is_string() || token->get<std::string>().empty()) {
    return Status::Unauthenticated("credentials carry no token");
  }
  credentials.token = token->get<std::string>();
  auto ca = body.find("ca");
  if (ca != body.end() && ca->is_string() && !ca->get<std::string>().empty()) {
    if (!DecodeBase64Url(ca->get<std::string>(), &credentials.ca)) {
      return Status::Unauthenticated("CA in credentials is not base64url");
    }
  }
  return credentials;
}

StatusOr<KubernetesTokenAuthenticator::TokenClaims>
KubernetesTokenAuthenticator::ParseToken(const std::string &token) {
  std::vector<std::string_view> parts = absl::StrSplit(token, '.');
  if (parts.size() != 3) {
    return Status::Unauthenticated("token is not a JWT");
  }
  ARMADA_ASSIGN_OR_RETURN(json header, DecodeJsonSegment(parts[0], "token header"));
  ARMADA_ASSIGN_OR_RETURN(json payload, DecodeJsonSegment(parts[1], "token payload"));

  TokenClaims claims;
  auto exp = payload.find("exp");
  if (exp == payload.end() || !exp->is_number()) {
    return Status::Unauthenticated("token has no expiry");
  }
  // Expiries past the largest representable millisecond are clamped to it.
  constexpr int64_t kMaxExpirySeconds = std::numeric_limits<int64_t>::max() / 1000;
  int64_t exp_s = 0;
  if (exp->is_number_unsigned()) {
    exp_s = static_cast<int64_t>(std::min<uint64_t>(exp->get<uint64_t>(), kMaxExpirySeconds));
  } else if (exp->is_number_integer()) {
    exp_s = std::min(exp->get<int64_t>(), kMaxExpirySeconds);
  } else {
    const double value = exp->get<double>();
    exp_s = value >= static_cast<double>(kMaxExpirySeconds) ? kMaxExpirySeconds
            : value > 0                                     ? static_cast<int64_t>(value)
                                                            : 0;
  }
  if (exp_s <= 0) {
    return Status::Unauthenticated("token has no expiry");
  }
  claims.expires_at_ms = exp_s * 1000;
  auto kid = header.find("kid");
  if (kid != header.end() && kid->is_string()) {
    claims.kid = kid->get<std::string>();
  }
  return claims;
}

StatusOr<std::string> KubernetesTokenAuthenticator::LookupClusterUrl(
    const std::string &kid) const {
  if (kid.empty()) {
    return Status::Unauthenticated("token has no kid");
  }
  if (absl::StrContains(kid, "../") || absl::StrContains(kid, "/")) {
    return Status::Unauthenticated(absl::StrCat("kid ", kid, " is not a plain name"));
  }
  const std::filesystem::path path = std::filesystem::path(kid_mapping_dir_) / kid;
  std::ifstream file(path);
  if (!file.is_open()) {
    return Status::Unauthenticated(absl::StrCat("unknown kid ", kid));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string url(absl::StripAsciiWhitespace(buffer.str()));
  if (url.empty()) {
    return Status::Unauthenticated(absl::StrCat("no cluster URL for kid ", kid));
  }
  return url;
}

StatusOr<Principal> KubernetesTokenAuthenticator::Authenticate(
    std::string_view authorization) {
  ARMADA_ASSIGN_OR_RETURN(Credentials credentials, ParseCredentials(authorization));
  ARMADA_ASSIGN_OR_RETURN(TokenClaims claims, ParseToken(credentials.token));
  const int64_t now_ms = wall_clock_();
  if (claims.expires_at_ms <= now_ms) {
    return Status::Unauthenticated("token expired");
  }

  if (auto cached = cache_.Get(credentials.token)) {
    if (cached->kind == TokenCacheEntry::Kind::kInvalid) {
      return Status::Unauthenticated("token rejected");
    }
    return Principal::Static(cached->name);
  }

  ARMADA_ASSIGN_OR_RETURN(std::string cluster_url, LookupClusterUrl(claims.kid));
  auto review = reviewer_->ReviewToken(cluster_url, credentials.token, credentials.ca);
  if (!review.ok()) {
    ARMADA_LOG_EVERY_MS(WARNING, 10000)
        << "Token review against " << cluster_url << " failed: " << review.status();
    return Status::Unavailable(
        absl::StrCat("cannot review token: ", review.status().message()));
  }
  if (!review.value().authenticated || review.value().username.empty()) {
    cache_.PutInvalid(credentials.token, invalid_token_ttl_ms_);
    return Status::Unauthenticated("token rejected");
  }
  const int64_t ttl_ms = std::min(claims.expires_at_ms - now_ms, valid_token_max_ttl_ms_);
  const std::string &username = review.value().username;
  cache_.PutValid(credentials.token, username, ttl_ms);
  ARMADA_LOG(DEBUG) << "Authenticated " << username << " via " << cluster_url;
  return Principal::Static(username);
}

}  // namespace armada
