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

#include "armada/auth/token_reviewer.h"

#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "armada/util/logging.h"
#include "nlohmann/json.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace armada {

namespace {

constexpr char kTokenReviewPath[] = "/apis/authentication.k8s.io/v1/tokenreviews";

//------------------------------------------------------------------------------
// One TokenReview POST over TLS, driven to completion by `ioc.run()`.
//
// Error handling:
// - resolve, connect and handshake failures are Unavailable.
// - write and read failures are Disconnected.
// - a well-formed response with a non-2xx status is IOError.
// - the whole exchange is bounded by the stream timeout, which fails the
//   pending step with TimedOut.
class ReviewSession : public std::enable_shared_from_this<ReviewSession> {
 public:
  static std::shared_ptr<ReviewSession> Create(net::io_context &ioc,
                                               ssl::context &ctx,
                                               ClusterEndpoint endpoint,
                                               const std::string &token,
                                               std::chrono::milliseconds timeout) {
    return std::shared_ptr<ReviewSession>(
        new ReviewSession(ioc, ctx, std::move(endpoint), token, timeout));
  }

  void Run() {
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str())) {
      Failed(Status::Invalid(absl::StrCat("cannot use ", endpoint_.host, " for SNI")));
      return;
    }
    stream_.set_verify_mode(ssl::verify_peer);
    stream_.set_verify_callback(ssl::host_name_verification(endpoint_.host));
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    resolver_.async_resolve(
        endpoint_.host,
        endpoint_.port,
        beast::bind_front_handler(&ReviewSession::OnResolve, shared_from_this()));
  }

  /// Set once the session has finished.
  const std::optional<StatusOr<std::string>> &result() const { return result_; }

 private:
  ReviewSession(net::io_context &ioc,
                ssl::context &ctx,
                ClusterEndpoint endpoint,
                const std::string &token,
                std::chrono::milliseconds timeout)
      : resolver_(ioc),
        stream_(ioc, ctx),
        endpoint_(std::move(endpoint)),
        timeout_(timeout) {
    req_.method(http::verb::post);
    req_.target(endpoint_.base_path + kTokenReviewPath);
    req_.version(11);
    req_.set(http::field::host, endpoint_.host);
    req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req_.set(http::field::content_type, "application/json");
    req_.set(http::field::accept, "application/json");
    req_.set(http::field::authorization, absl::StrCat("Bearer ", token));
    json review = {{"apiVersion", "authentication.k8s.io/v1"},
                   {"kind", "TokenReview"},
                   {"spec", {{"token", token}}}};
    req_.body() = review.dump();
    req_.prepare_payload();
  }

  Status StepError(const char *step, beast::error_code ec) {
    const std::string message = absl::StrCat(step, " ", ec.message());
    if (ec == beast::error::timeout) {
      return Status::TimedOut(message);
    }
    return Status::Unavailable(message);
  }

  void Failed(Status status) { result_ = std::move(status); }

  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      Failed(StepError("resolve", ec));
      return;
    }
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&ReviewSession::OnConnect, shared_from_this()));
  }

  void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      Failed(StepError("connect", ec));
      return;
    }
    stream_.async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&ReviewSession::OnHandshake, shared_from_this()));
  }

  void OnHandshake(beast::error_code ec) {
    if (ec) {
      Failed(StepError("handshake", ec));
      return;
    }
    http::async_write(
        stream_, req_, beast::bind_front_handler(&ReviewSession::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
      Failed(ec == beast::error::timeout
                 ? StepError("write", ec)
                 : Status::Disconnected(absl::StrCat("write ", ec.message(),
                                                     ", bytes_transferred ",
                                                     bytes_transferred)));
      return;
    }
    http::async_read(stream_,
                     buffer_,
                     res_,
                     beast::bind_front_handler(&ReviewSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
      Failed(ec == beast::error::timeout
                 ? StepError("read", ec)
                 : Status::Disconnected(absl::StrCat("read ", ec.message(),
                                                     ", bytes_transferred ",
                                                     bytes_transferred)));
      return;
    }
    if (http::to_status_class(res_.result()) == http::status_class::successful) {
      result_ = std::move(res_.body());
    } else {
      result_ = Status::IOError(absl::StrCat("token review returned HTTP ",
                                             res_.result_int(), ": ", res_.body()));
    }
    stream_.async_shutdown(
        beast::bind_front_handler(&ReviewSession::OnShutdown, shared_from_this()));
  }

  void OnShutdown(beast::error_code ec) {
    // Servers commonly close without a TLS close_notify.
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
      ARMADA_LOG(DEBUG) << "TLS shutdown with " << endpoint_.host << ": " << ec.message();
    }
  }

  tcp::resolver resolver_;
  beast::ssl_stream<beast::tcp_stream> stream_;
  ClusterEndpoint endpoint_;
  std::chrono::milliseconds timeout_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
  std::optional<StatusOr<std::string>> result_;
};

}  // namespace

StatusOr<ClusterEndpoint> ParseClusterUrl(std::string_view url) {
  std::string_view rest = absl::StripAsciiWhitespace(url);
  if (!absl::ConsumePrefix(&rest, "https://")) {
    return Status::Invalid(absl::StrCat("cluster URL must use https: ", url));
  }
  ClusterEndpoint endpoint;
  std::string_view authority = rest;
  const size_t slash = rest.find('/');
  if (slash != std::string_view::npos) {
    authority = rest.substr(0, slash);
    std::string_view path = rest.substr(slash);
    while (absl::ConsumeSuffix(&path, "/")) {
    }
    endpoint.base_path = std::string(path);
  }
  const size_t colon = authority.rfind(':');
  const size_t bracket = authority.rfind(']');
  if (colon != std::string_view::npos &&
      (bracket == std::string_view::npos || colon > bracket)) {
    int port = 0;
    if (!absl::SimpleAtoi(authority.substr(colon + 1), &port) || port <= 0 ||
        port > 65535) {
      return Status::Invalid(absl::StrCat("bad port in cluster URL: ", url));
    }
    endpoint.port = absl::StrCat(port);
    authority = authority.substr(0, colon);
  } else {
    endpoint.port = "443";
  }
  absl::ConsumePrefix(&authority, "[");
  absl::ConsumeSuffix(&authority, "]");
  if (authority.empty()) {
    return Status::Invalid(absl::StrCat("no host in cluster URL: ", url));
  }
  endpoint.host = std::string(authority);
  return endpoint;
}

StatusOr<TokenReview> KubernetesTokenReviewer::ParseReviewResponse(std::string_view body) {
  json response = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (response.is_discarded() || !response.is_object()) {
    return Status::IOError("token review response is not a JSON object");
  }
  TokenReview review;
  auto status = response.find("status");
  if (status == response.end() || !status->is_object()) {
    return review;
  }
  auto authenticated = status->find("authenticated");
  if (authenticated != status->end() && authenticated->is_boolean()) {
    review.authenticated = authenticated->get<bool>();
  }
  auto user = status->find("user");
  if (user != status->end() && user->is_object()) {
    auto username = user->find("username");
    if (username != user->end() && username->is_string()) {
      review.username = username->get<std::string>();
    }
  }
  return review;
}

StatusOr<TokenReview> KubernetesTokenReviewer::ReviewToken(const std::string &cluster_url,
                                                           const std::string &token,
                                                           const std::string &ca) {
  ARMADA_ASSIGN_OR_RETURN(ClusterEndpoint endpoint, ParseClusterUrl(cluster_url));

  ssl::context ctx(ssl::context::tls_client);
  beast::error_code ec;
  if (ca.empty()) {
    ctx.set_default_verify_paths(ec);
  } else {
    ctx.add_certificate_authority(net::buffer(ca.data(), ca.size()), ec);
  }
  if (ec) {
    return Status::Invalid(absl::StrCat("cannot load CA for ", cluster_url, ": ",
                                        ec.message()));
  }

  net::io_context ioc;
  auto session = ReviewSession::Create(
      ioc, ctx, std::move(endpoint), token, std::chrono::milliseconds(timeout_ms_));
  session->Run();
  ioc.run();

  if (!session->result().has_value()) {
    return Status::UnknownError("token review finished without a result");
  }
  ARMADA_ASSIGN_OR_RETURN(std::string body, *session->result());
  return ParseReviewResponse(body);
}

}  // namespace armada
