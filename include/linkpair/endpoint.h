#pragma once

#include "linkpair/linkpair.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>

namespace linkpair {

/**
 * Outcome of an authorization check, with the HTTP status to answer on failure.
 */
struct AuthResult {
  bool authorized = false;
  int status_code = 200;
  std::string error;
};

/**
 * Bearer-token check for the local endpoint with per-client lockout.
 */
class TokenAuthenticator {
 public:
  TokenAuthenticator(int max_failures, std::chrono::milliseconds block_duration);

  /// Install the session token and forget previous failures.
  void SetToken(const std::string& token);
  /// Drop the session token; every request is refused afterwards.
  void ClearToken();
  bool HasToken() const;

  /// Check an "Authorization: Bearer <token>" header value.
  AuthResult AuthorizeBearer(const std::string& authorization,
                             const std::string& client_ip,
                             std::chrono::steady_clock::time_point now);
  /// Check a token passed as a query parameter (handshake check).
  AuthResult AuthorizeToken(const std::string& token) const;
  /// Number of clients with recorded failures or an active block.
  size_t TrackedClients() const;

 private:
  struct FailureRecord {
    int count = 0;
    std::chrono::steady_clock::time_point blocked_until;
  };

  void RecordFailure(const std::string& client_ip, std::chrono::steady_clock::time_point now);

  const int max_failures_;
  const std::chrono::milliseconds block_duration_;

  mutable std::mutex mutex_;
  std::optional<std::string> token_;
  std::unordered_map<std::string, FailureRecord> failures_;
};

/**
 * Request as seen by application routes. Header names are lower-case.
 */
struct EndpointRequest {
  std::string method;
  std::string path;
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string client_ip;
};

struct EndpointResponse {
  int status_code = 200;
  std::string content_type = "application/json";
  std::string body;
};

/**
 * Local endpoint launcher serving HTTP over Boost.Beast.
 *
 * Serves GET /api/handshake?token=... itself and hands every other request,
 * once its bearer token checks out, to the application request handler.
 */
class HttpEndpointLauncher : public LocalEndpointLauncher {
 public:
  /// Return std::nullopt to answer 404.
  using RequestHandler = std::function<std::optional<EndpointResponse>(const EndpointRequest&)>;

  /// The io_context must outlive the launcher and be run by the caller.
  HttpEndpointLauncher(boost::asio::io_context& ioc, Config config);
  ~HttpEndpointLauncher() override;

  HttpEndpointLauncher(const HttpEndpointLauncher&) = delete;
  HttpEndpointLauncher& operator=(const HttpEndpointLauncher&) = delete;

  /// Set the handler for authorized application requests.
  void SetRequestHandler(RequestHandler handler);

  void Start(const std::string& token, LaunchCallback done) override;
  void Stop() override;

  /// Return the address being served, if running.
  std::optional<LocalEndpointInfo> GetEndpoint() const;

  /// Run a request through authorization and routing.
  EndpointResponse Dispatch(const EndpointRequest& request);

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace linkpair
