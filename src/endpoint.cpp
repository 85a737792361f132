#include "linkpair/endpoint.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

namespace linkpair {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

constexpr const char* kHandshakePath = "/api/handshake";
constexpr const char* kBearerPrefix = "Bearer ";
constexpr std::chrono::seconds kRequestTimeout{30};

EndpointResponse JsonResponse(int status_code, const json& body) {
  EndpointResponse response;
  response.status_code = status_code;
  response.body = body.dump();
  return response;
}

EndpointResponse ErrorResponse(int status_code, const std::string& error) {
  return JsonResponse(status_code, json{{"error", error}});
}

std::string IsoTimestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buffer[32] = {0};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string DecodePercent(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 &&
               HexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Split "/path?a=1&b=2" into path and decoded query map.
void SplitTarget(const std::string& target, std::string* path,
                 std::map<std::string, std::string>* query) {
  const auto question = target.find('?');
  *path = DecodePercent(target.substr(0, question));
  if (question == std::string::npos) {
    return;
  }
  std::istringstream pairs(target.substr(question + 1));
  std::string pair;
  while (std::getline(pairs, pair, '&')) {
    if (pair.empty()) {
      continue;
    }
    const auto equals = pair.find('=');
    const std::string key = DecodePercent(pair.substr(0, equals));
    const std::string value =
        equals == std::string::npos ? std::string() : DecodePercent(pair.substr(equals + 1));
    query->emplace(key, value);
  }
}

// First non-loopback IPv4 address of an interface that is up.
std::string DetectLocalIpv4() {
  ifaddrs* addrs = nullptr;
  if (::getifaddrs(&addrs) != 0) {
    return {};
  }
  std::string result;
  for (ifaddrs* it = addrs; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      result = buffer;
      break;
    }
  }
  ::freeifaddrs(addrs);
  return result;
}

}  // namespace

TokenAuthenticator::TokenAuthenticator(int max_failures,
                                       std::chrono::milliseconds block_duration)
    : max_failures_(max_failures), block_duration_(block_duration) {}

void TokenAuthenticator::SetToken(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  token_ = token;
  failures_.clear();
}

void TokenAuthenticator::ClearToken() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_.reset();
  failures_.clear();
}

bool TokenAuthenticator::HasToken() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return token_.has_value();
}

AuthResult TokenAuthenticator::AuthorizeBearer(const std::string& authorization,
                                               const std::string& client_ip,
                                               std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!token_) {
    return {false, 503, "No active session"};
  }
  // Forget clients whose block has run out.
  for (auto it = failures_.begin(); it != failures_.end();) {
    const bool was_blocked = it->second.blocked_until != std::chrono::steady_clock::time_point{};
    if (was_blocked && it->second.blocked_until <= now) {
      it = failures_.erase(it);
    } else {
      ++it;
    }
  }
  if (!client_ip.empty()) {
    auto it = failures_.find(client_ip);
    if (it != failures_.end() && it->second.blocked_until > now) {
      return {false, 429, "Too many failed attempts. Try again later."};
    }
  }
  const std::string prefix = kBearerPrefix;
  if (authorization.compare(0, prefix.size(), prefix) != 0) {
    RecordFailure(client_ip, now);
    return {false, 401, "Missing or invalid authorization header"};
  }
  if (authorization.substr(prefix.size()) != *token_) {
    RecordFailure(client_ip, now);
    return {false, 401, "Invalid token"};
  }
  if (!client_ip.empty()) {
    failures_.erase(client_ip);
  }
  return {true, 200, {}};
}

size_t TokenAuthenticator::TrackedClients() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_.size();
}

AuthResult TokenAuthenticator::AuthorizeToken(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!token_) {
    return {false, 503, "No active session"};
  }
  if (token.empty() || token != *token_) {
    return {false, 401, "Invalid token"};
  }
  return {true, 200, {}};
}

// Called with mutex_ held.
void TokenAuthenticator::RecordFailure(const std::string& client_ip,
                                       std::chrono::steady_clock::time_point now) {
  if (client_ip.empty()) {
    return;
  }
  FailureRecord& record = failures_[client_ip];
  record.count++;
  if (record.count >= max_failures_) {
    record.blocked_until = now + block_duration_;
    record.count = 0;
  }
}

struct HttpEndpointLauncher::Impl : std::enable_shared_from_this<HttpEndpointLauncher::Impl> {
  class HttpSession;

  Impl(net::io_context& ioc_ref, Config config_in)
      : ioc(ioc_ref),
        config(std::move(config_in)),
        authenticator(config.endpoint_max_auth_failures, config.endpoint_block_duration) {}

  void DoStart(uint64_t generation_at_start, const std::string& token, LaunchCallback done) {
    auto finish = [&](LaunchResult result) {
      if (!done) {
        return;
      }
      try {
        done(result);
      } catch (...) {
        detail::LogCallbackError("LaunchCallback", config.log_callback);
      }
    };
    if (generation_at_start != generation.load()) {
      finish({std::nullopt, "Local server launch abandoned"});
      return;
    }
    std::string error;
    if (!config.Validate(&error)) {
      detail::Log(error, config.log_callback);
      finish({std::nullopt, "invalid configuration: " + error});
      return;
    }
    if (token.empty()) {
      finish({std::nullopt, "Missing session token"});
      return;
    }
    std::string host = config.endpoint_advertised_host;
    if (host.empty()) {
      host = DetectLocalIpv4();
    }
    if (host.empty()) {
      finish({std::nullopt, "No network address available"});
      return;
    }

    // A new session replaces whatever was being served.
    StopServing();

    beast::error_code ec;
    const auto bind_address = net::ip::make_address(config.endpoint_bind_address, ec);
    if (ec) {
      finish({std::nullopt, "invalid bind address: " + ec.message()});
      return;
    }
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> port_dist(kEphemeralPortFirst, kEphemeralPortLast);
    const int attempts = config.endpoint_port == 0 ? config.endpoint_bind_attempts : 1;

    auto next_acceptor = std::make_unique<tcp::acceptor>(net::make_strand(ioc));
    uint16_t bound_port = 0;
    std::string last_error;
    for (int i = 0; i < attempts && bound_port == 0; ++i) {
      const uint16_t port = config.endpoint_port != 0
                                ? config.endpoint_port
                                : static_cast<uint16_t>(port_dist(rng));
      const tcp::endpoint local(bind_address, port);
      beast::error_code bind_ec;
      next_acceptor->open(local.protocol(), bind_ec);
      if (!bind_ec) {
        next_acceptor->set_option(net::socket_base::reuse_address(true), bind_ec);
      }
      if (!bind_ec) {
        next_acceptor->bind(local, bind_ec);
      }
      if (!bind_ec) {
        next_acceptor->listen(net::socket_base::max_listen_connections, bind_ec);
      }
      if (bind_ec) {
        std::ostringstream oss;
        oss << "bind(" << config.endpoint_bind_address << ":" << port
            << ") failed: " << bind_ec.message();
        last_error = oss.str();
        detail::Log(last_error, config.log_callback);
        beast::error_code ignored;
        next_acceptor->close(ignored);
        continue;
      }
      bound_port = port;
    }
    if (bound_port == 0) {
      finish({std::nullopt, "Failed to start local server: " + last_error});
      return;
    }

    acceptor = std::move(next_acceptor);
    authenticator.SetToken(token);
    LocalEndpointInfo info{host, bound_port};
    {
      std::lock_guard<std::mutex> lock(endpoint_mutex);
      endpoint = info;
    }
    detail::Log("local endpoint listening on " + config.endpoint_bind_address + ":" +
                    std::to_string(bound_port) + ", advertised as " + host,
                config.log_callback);
    DoAccept();
    finish({info, {}});
  }

  void DoAccept() {
    if (!acceptor) {
      return;
    }
    auto self = shared_from_this();
    tcp::acceptor* current = acceptor.get();
    acceptor->async_accept(net::make_strand(ioc),
                           [self, current](beast::error_code ec, tcp::socket socket) {
                             self->OnAccept(current, ec, std::move(socket));
                           });
  }

  void OnAccept(tcp::acceptor* source, beast::error_code ec, tcp::socket socket);

  // Close the listener and every live connection.
  void StopServing();

  EndpointResponse Dispatch(const EndpointRequest& request) {
    if (request.path == kHandshakePath) {
      if (request.method != "GET") {
        return ErrorResponse(405, "Method not allowed");
      }
      auto token = request.query.find("token");
      const AuthResult auth =
          authenticator.AuthorizeToken(token == request.query.end() ? "" : token->second);
      if (!auth.authorized) {
        return ErrorResponse(auth.status_code, auth.error);
      }
      return JsonResponse(200, json{{"status", "connected"}, {"timestamp", IsoTimestamp()}});
    }

    auto header = request.headers.find("authorization");
    const AuthResult auth = authenticator.AuthorizeBearer(
        header == request.headers.end() ? "" : header->second, request.client_ip,
        std::chrono::steady_clock::now());
    if (!auth.authorized) {
      detail::Log("rejected " + request.method + " " + request.path + " from " +
                      request.client_ip + ": " + auth.error,
                  config.log_callback);
      return ErrorResponse(auth.status_code, auth.error);
    }

    RequestHandler handler_copy;
    {
      std::lock_guard<std::mutex> lock(handler_mutex);
      handler_copy = handler;
    }
    if (!handler_copy) {
      return ErrorResponse(404, "Not found");
    }
    try {
      auto response = handler_copy(request);
      if (!response) {
        return ErrorResponse(404, "Not found");
      }
      return *response;
    } catch (const std::exception& ex) {
      detail::Log(std::string("request handler failed: ") + ex.what(), config.log_callback);
    } catch (...) {
      detail::LogCallbackError("RequestHandler", config.log_callback);
    }
    return ErrorResponse(500, "Internal server error");
  }

  net::io_context& ioc;
  const Config config;
  TokenAuthenticator authenticator;

  // Serving state below is only touched on the io_context.
  std::unique_ptr<tcp::acceptor> acceptor;
  std::vector<std::weak_ptr<HttpSession>> sessions;
  std::atomic<uint64_t> generation{0};

  mutable std::mutex endpoint_mutex;
  std::optional<LocalEndpointInfo> endpoint;

  mutable std::mutex handler_mutex;
  RequestHandler handler;
};

// One keep-alive HTTP connection from the browser.
class HttpEndpointLauncher::Impl::HttpSession
    : public std::enable_shared_from_this<HttpEndpointLauncher::Impl::HttpSession> {
 public:
  HttpSession(tcp::socket socket, std::weak_ptr<Impl> owner)
      : stream_(std::move(socket)), owner_(std::move(owner)) {
    beast::error_code ec;
    const auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
      client_ip_ = remote.address().to_string();
    }
  }

  void Run() {
    auto self = shared_from_this();
    net::dispatch(stream_.get_executor(), [self]() { self->DoRead(); });
  }

  void Close() {
    auto self = shared_from_this();
    net::post(stream_.get_executor(), [self]() {
      beast::error_code ignored;
      self->stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
      self->stream_.close();
    });
  }

 private:
  void DoRead() {
    request_ = {};
    stream_.expires_after(kRequestTimeout);
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, request_,
                     [self](beast::error_code ec, std::size_t) { self->OnRead(ec); });
  }

  void OnRead(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      beast::error_code ignored;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
      return;
    }
    if (ec) {
      return;
    }
    auto owner = owner_.lock();
    if (!owner) {
      return;
    }

    EndpointRequest request;
    request.method = std::string(request_.method_string());
    SplitTarget(std::string(request_.target()), &request.path, &request.query);
    for (const auto& field : request_) {
      std::string name(field.name_string());
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      request.headers[name] = std::string(field.value());
    }
    request.body = request_.body();
    request.client_ip = client_ip_;

    const EndpointResponse reply = owner->Dispatch(request);

    auto response = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(reply.status_code), request_.version());
    response->set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response->set(http::field::content_type, reply.content_type);
    response->keep_alive(request_.keep_alive());
    response->body() = reply.body;
    response->prepare_payload();

    auto self = shared_from_this();
    http::async_write(stream_, *response,
                      [self, response](beast::error_code ec, std::size_t) {
                        if (ec) {
                          return;
                        }
                        if (response->need_eof()) {
                          beast::error_code ignored;
                          self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                          return;
                        }
                        self->DoRead();
                      });
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  std::weak_ptr<Impl> owner_;
  std::string client_ip_;
};

void HttpEndpointLauncher::Impl::OnAccept(tcp::acceptor* source, beast::error_code ec,
                                          tcp::socket socket) {
  if (source != acceptor.get()) {
    // Listener was replaced or stopped while the accept was pending.
    return;
  }
  if (ec) {
    if (ec != net::error::operation_aborted) {
      detail::Log("accept failed: " + ec.message(), config.log_callback);
      DoAccept();
    }
    return;
  }
  auto session = std::make_shared<HttpSession>(std::move(socket), weak_from_this());
  sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                [](const std::weak_ptr<HttpSession>& s) { return s.expired(); }),
                 sessions.end());
  sessions.push_back(session);
  session->Run();
  DoAccept();
}

void HttpEndpointLauncher::Impl::StopServing() {
  if (acceptor) {
    beast::error_code ignored;
    acceptor->close(ignored);
    acceptor.reset();
    detail::Log("local endpoint stopped", config.log_callback);
  }
  for (auto& weak : sessions) {
    if (auto session = weak.lock()) {
      session->Close();
    }
  }
  sessions.clear();
  authenticator.ClearToken();
  std::lock_guard<std::mutex> lock(endpoint_mutex);
  endpoint.reset();
}

HttpEndpointLauncher::HttpEndpointLauncher(boost::asio::io_context& ioc, Config config)
    : impl_(std::make_shared<Impl>(ioc, std::move(config))) {}

HttpEndpointLauncher::~HttpEndpointLauncher() { Stop(); }

void HttpEndpointLauncher::SetRequestHandler(RequestHandler handler) {
  std::lock_guard<std::mutex> lock(impl_->handler_mutex);
  impl_->handler = std::move(handler);
}

void HttpEndpointLauncher::Start(const std::string& token, LaunchCallback done) {
  const uint64_t generation = impl_->generation.load();
  auto impl = impl_;
  net::post(impl_->ioc, [impl, generation, token, done = std::move(done)]() mutable {
    impl->DoStart(generation, token, std::move(done));
  });
}

void HttpEndpointLauncher::Stop() {
  impl_->generation.fetch_add(1);
  // Refuse requests right away; the listener closes on the io_context.
  impl_->authenticator.ClearToken();
  auto impl = impl_;
  net::post(impl_->ioc, [impl]() { impl->StopServing(); });
}

std::optional<LocalEndpointInfo> HttpEndpointLauncher::GetEndpoint() const {
  std::lock_guard<std::mutex> lock(impl_->endpoint_mutex);
  return impl_->endpoint;
}

EndpointResponse HttpEndpointLauncher::Dispatch(const EndpointRequest& request) {
  return impl_->Dispatch(request);
}

}  // namespace linkpair
