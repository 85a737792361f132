// Tests for the local endpoint: bearer checks, lockout, routing and serving.
#include "io_thread.h"

#include "linkpair/endpoint.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <future>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

using linkpair::AuthResult;
using linkpair::EndpointRequest;
using linkpair::EndpointResponse;
using linkpair::HttpEndpointLauncher;
using linkpair::LaunchResult;
using linkpair::TokenAuthenticator;

namespace {

using Clock = std::chrono::steady_clock;

linkpair::Config LoopbackConfig() {
  linkpair::Config config;
  config.endpoint_bind_address = "127.0.0.1";
  config.endpoint_advertised_host = "127.0.0.1";
  config.endpoint_max_auth_failures = 3;
  config.log_callback = [](const std::string&) {};
  return config;
}

EndpointRequest Request(const std::string& method, const std::string& path,
                        const std::string& authorization = {}) {
  EndpointRequest request;
  request.method = method;
  request.path = path;
  request.client_ip = "10.0.0.9";
  if (!authorization.empty()) {
    request.headers["authorization"] = authorization;
  }
  return request;
}

nlohmann::json Body(const EndpointResponse& response) {
  return nlohmann::json::parse(response.body);
}

}  // namespace

TEST(TokenAuthenticatorTest, RefusesWithoutSession) {
  TokenAuthenticator auth(5, std::chrono::minutes(5));
  const AuthResult result = auth.AuthorizeBearer("Bearer t1", "10.0.0.1", Clock::now());
  EXPECT_FALSE(result.authorized);
  EXPECT_EQ(result.status_code, 503);
  EXPECT_EQ(result.error, "No active session");
  EXPECT_EQ(auth.AuthorizeToken("t1").status_code, 503);
}

TEST(TokenAuthenticatorTest, AcceptsMatchingBearer) {
  TokenAuthenticator auth(5, std::chrono::minutes(5));
  auth.SetToken("t1");
  EXPECT_TRUE(auth.HasToken());
  EXPECT_TRUE(auth.AuthorizeBearer("Bearer t1", "10.0.0.1", Clock::now()).authorized);
  EXPECT_TRUE(auth.AuthorizeToken("t1").authorized);
}

TEST(TokenAuthenticatorTest, DistinguishesMissingHeaderFromWrongToken) {
  TokenAuthenticator auth(5, std::chrono::minutes(5));
  auth.SetToken("t1");
  const auto now = Clock::now();

  AuthResult result = auth.AuthorizeBearer("", "10.0.0.1", now);
  EXPECT_EQ(result.status_code, 401);
  EXPECT_EQ(result.error, "Missing or invalid authorization header");

  result = auth.AuthorizeBearer("Basic dDE=", "10.0.0.1", now);
  EXPECT_EQ(result.error, "Missing or invalid authorization header");

  result = auth.AuthorizeBearer("Bearer nope", "10.0.0.1", now);
  EXPECT_EQ(result.status_code, 401);
  EXPECT_EQ(result.error, "Invalid token");

  EXPECT_EQ(auth.AuthorizeToken("").status_code, 401);
  EXPECT_EQ(auth.AuthorizeToken("nope").error, "Invalid token");
}

TEST(TokenAuthenticatorTest, BlocksClientAfterRepeatedFailures) {
  TokenAuthenticator auth(3, std::chrono::minutes(5));
  auth.SetToken("t1");
  const auto now = Clock::now();
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now).status_code, 401);
  }

  // Even the right token is refused while blocked.
  AuthResult result = auth.AuthorizeBearer("Bearer t1", "10.0.0.1", now + std::chrono::seconds(1));
  EXPECT_EQ(result.status_code, 429);
  EXPECT_EQ(result.error, "Too many failed attempts. Try again later.");

  // Other clients are unaffected.
  EXPECT_TRUE(auth.AuthorizeBearer("Bearer t1", "10.0.0.2", now).authorized);

  // The block expires.
  EXPECT_TRUE(
      auth.AuthorizeBearer("Bearer t1", "10.0.0.1", now + std::chrono::minutes(6)).authorized);
}

TEST(TokenAuthenticatorTest, ExpiredBlocksAreForgotten) {
  TokenAuthenticator auth(2, std::chrono::minutes(5));
  auth.SetToken("t1");
  const auto now = Clock::now();
  for (int i = 0; i < 2; ++i) {
    auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now);
    auth.AuthorizeBearer("Bearer bad", "10.0.0.2", now);
  }
  EXPECT_EQ(auth.TrackedClients(), 2u);

  // Neither blocked client comes back; another client's request sweeps them.
  const auto later = now + std::chrono::minutes(6);
  EXPECT_TRUE(auth.AuthorizeBearer("Bearer t1", "10.0.0.3", later).authorized);
  EXPECT_EQ(auth.TrackedClients(), 0u);

  // A forgotten client starts over with a full failure budget.
  EXPECT_EQ(auth.AuthorizeBearer("Bearer bad", "10.0.0.1", later).status_code, 401);
  EXPECT_EQ(auth.AuthorizeBearer("Bearer t1", "10.0.0.1", later).status_code, 200);
}

TEST(TokenAuthenticatorTest, SuccessResetsFailureCount) {
  TokenAuthenticator auth(3, std::chrono::minutes(5));
  auth.SetToken("t1");
  const auto now = Clock::now();
  auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now);
  auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now);
  EXPECT_TRUE(auth.AuthorizeBearer("Bearer t1", "10.0.0.1", now).authorized);
  auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now);
  auth.AuthorizeBearer("Bearer bad", "10.0.0.1", now);
  EXPECT_TRUE(auth.AuthorizeBearer("Bearer t1", "10.0.0.1", now).authorized);
}

TEST(TokenAuthenticatorTest, ClearTokenEndsSession) {
  TokenAuthenticator auth(3, std::chrono::minutes(5));
  auth.SetToken("t1");
  auth.ClearToken();
  EXPECT_FALSE(auth.HasToken());
  EXPECT_EQ(auth.AuthorizeBearer("Bearer t1", "10.0.0.1", Clock::now()).status_code, 503);
}

class EndpointLauncherTest : public ::testing::Test {
 protected:
  LaunchResult StartWithToken(const std::string& token) {
    std::promise<LaunchResult> started;
    auto future = started.get_future();
    launcher.Start(token, [&started](const LaunchResult& result) { started.set_value(result); });
    EXPECT_TRUE(linkpair::fakes::WaitFor(future));
    return future.get();
  }

  linkpair::fakes::IoThread io;
  HttpEndpointLauncher launcher{io.ioc, LoopbackConfig()};
};

TEST_F(EndpointLauncherTest, StartsOnEphemeralPort) {
  const LaunchResult result = StartWithToken("t1");
  ASSERT_TRUE(result.ok()) << result.error;
  EXPECT_EQ(result.endpoint->host, "127.0.0.1");
  EXPECT_GE(result.endpoint->port, linkpair::kEphemeralPortFirst);
  ASSERT_TRUE(launcher.GetEndpoint().has_value());
  EXPECT_EQ(*launcher.GetEndpoint(), *result.endpoint);
}

TEST_F(EndpointLauncherTest, EmptyTokenFailsLaunch) {
  const LaunchResult result = StartWithToken("");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, "Missing session token");
}

TEST_F(EndpointLauncherTest, HandshakeCheckUsesQueryToken) {
  ASSERT_TRUE(StartWithToken("t1").ok());

  auto check = Request("GET", "/api/handshake");
  check.query["token"] = "t1";
  EndpointResponse response = launcher.Dispatch(check);
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(Body(response).at("status"), "connected");
  EXPECT_TRUE(Body(response).at("timestamp").is_string());

  check.query["token"] = "wrong";
  response = launcher.Dispatch(check);
  EXPECT_EQ(response.status_code, 401);
  EXPECT_EQ(Body(response).at("error"), "Invalid token");

  EXPECT_EQ(launcher.Dispatch(Request("POST", "/api/handshake")).status_code, 405);
}

TEST_F(EndpointLauncherTest, RoutesAuthorizedRequestsToHandler) {
  launcher.SetRequestHandler([](const EndpointRequest& request) -> std::optional<EndpointResponse> {
    if (request.path == "/api/notes") {
      EndpointResponse response;
      response.body = R"({"notes":[]})";
      return response;
    }
    if (request.path == "/api/boom") {
      throw std::runtime_error("handler failure");
    }
    return std::nullopt;
  });
  ASSERT_TRUE(StartWithToken("t1").ok());

  EndpointResponse response = launcher.Dispatch(Request("GET", "/api/notes", "Bearer t1"));
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, R"({"notes":[]})");

  EXPECT_EQ(launcher.Dispatch(Request("GET", "/api/missing", "Bearer t1")).status_code, 404);

  response = launcher.Dispatch(Request("GET", "/api/boom", "Bearer t1"));
  EXPECT_EQ(response.status_code, 500);
  EXPECT_EQ(Body(response).at("error"), "Internal server error");

  response = launcher.Dispatch(Request("GET", "/api/notes"));
  EXPECT_EQ(response.status_code, 401);
}

TEST_F(EndpointLauncherTest, StopRefusesFurtherRequests) {
  ASSERT_TRUE(StartWithToken("t1").ok());
  launcher.Stop();

  EXPECT_EQ(launcher.Dispatch(Request("GET", "/api/notes", "Bearer t1")).status_code, 503);
  auto check = Request("GET", "/api/handshake");
  check.query["token"] = "t1";
  EXPECT_EQ(launcher.Dispatch(check).status_code, 503);
}

TEST_F(EndpointLauncherTest, StopBeforeStartAbandonsLaunch) {
  // Hold the io thread so the stop is seen before the start runs.
  std::promise<void> gate;
  auto released = gate.get_future().share();
  boost::asio::post(io.ioc, [released]() { released.wait(); });

  std::promise<LaunchResult> started;
  auto future = started.get_future();
  launcher.Start("t1", [&started](const LaunchResult& result) { started.set_value(result); });
  launcher.Stop();
  gate.set_value();
  ASSERT_TRUE(linkpair::fakes::WaitFor(future));
  const LaunchResult result = future.get();
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, "Local server launch abandoned");
}

TEST_F(EndpointLauncherTest, ServesHandshakeOverHttp) {
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = boost::asio::ip::tcp;

  const LaunchResult result = StartWithToken("t1");
  ASSERT_TRUE(result.ok()) << result.error;

  boost::asio::io_context client_ioc;
  tcp::resolver resolver(client_ioc);
  beast::tcp_stream stream(client_ioc);
  stream.connect(resolver.resolve("127.0.0.1", std::to_string(result.endpoint->port)));

  http::request<http::empty_body> request(http::verb::get, "/api/handshake?token=t1", 11);
  request.set(http::field::host, "127.0.0.1");
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(stream, buffer, response);
  EXPECT_EQ(response.result_int(), 200u);
  EXPECT_EQ(nlohmann::json::parse(response.body()).at("status"), "connected");

  http::request<http::empty_body> denied(http::verb::get, "/api/notes", 11);
  denied.set(http::field::host, "127.0.0.1");
  denied.set(http::field::authorization, "Bearer wrong");
  http::write(stream, denied);
  http::response<http::string_body> refusal;
  http::read(stream, buffer, refusal);
  EXPECT_EQ(refusal.result_int(), 401u);

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
}
