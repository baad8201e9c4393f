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
#include <string>
#include <string_view>

#include "armada/common/status_or.h"

namespace armada {

/// Outcome of a Kubernetes TokenReview.
struct TokenReview {
  bool authenticated = false;
  std::string username;
};

/// \class TokenReviewerInterface
///
/// Asks the API server of a cluster whether a service account token is valid.
class TokenReviewerInterface {
 public:
  virtual ~TokenReviewerInterface() = default;

  /// \param cluster_url Base URL of the API server, e.g. https://10.0.0.1:6443.
  /// \param token The bearer token under review, also used to authorize the call.
  /// \param ca PEM bundle to verify the API server with. Empty uses the system store.
  /// \return The review, or an error if the API server could not be asked.
  virtual StatusOr<TokenReview> ReviewToken(const std::string &cluster_url,
                                            const std::string &token,
                                            const std::string &ca) = 0;
};

struct ClusterEndpoint {
  std::string host;
  std::string port;
  /// Path prefix without a trailing slash, usually empty.
  std::string base_path;
};

/// Split an https URL into host, port (443 when absent) and path.
StatusOr<ClusterEndpoint> ParseClusterUrl(std::string_view url);

/// Posts a TokenReview to the cluster over HTTPS. Each call opens its own
/// connection and blocks the caller for at most `timeout_ms`.
class KubernetesTokenReviewer : public TokenReviewerInterface {
 public:
  explicit KubernetesTokenReviewer(int64_t timeout_ms) : timeout_ms_(timeout_ms) {}

  StatusOr<TokenReview> ReviewToken(const std::string &cluster_url,
                                    const std::string &token,
                                    const std::string &ca) override;

  /// Read the review out of a TokenReview response body.
  static StatusOr<TokenReview> ParseReviewResponse(std::string_view body);

 private:
  const int64_t timeout_ms_;
};

}  // namespace armada
