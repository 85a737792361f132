#include "linkpair/beast_transport.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

namespace linkpair {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using Strand = net::strand<net::io_context::executor_type>;

constexpr const char* kUserAgent = "linkpair";

bool IsDigits(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Holds the concrete stream type; TLS needs the ssl context at construction.
template <bool kSecure>
struct StreamHolder;

template <>
struct StreamHolder<false> {
  StreamHolder(const Strand& strand, ssl::context&) : ws(strand) {}
  websocket::stream<beast::tcp_stream> ws;
};

template <>
struct StreamHolder<true> {
  StreamHolder(const Strand& strand, ssl::context& ctx) : ws(strand, ctx) {}
  websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws;
};

class WebSocketSession {
 public:
  virtual ~WebSocketSession() = default;
  virtual void Run() = 0;
  virtual void Send(std::string text) = 0;
  virtual void Close() = 0;
};

// One relay connection: resolve, connect, [TLS], upgrade, then read until the
// relay closes. Every handler runs on the session strand.
template <bool kSecure>
class WebSocketConnection : public WebSocketSession,
                            public std::enable_shared_from_this<WebSocketConnection<kSecure>> {
 public:
  WebSocketConnection(net::io_context& ioc,
                      ssl::context& ctx,
                      RelayUrl url,
                      std::chrono::milliseconds connect_timeout,
                      bool verify_tls,
                      RelayTransport::EventCallback on_event,
                      Config::LogCallback log_callback)
      : strand_(net::make_strand(ioc)),
        resolver_(strand_),
        stream_(strand_, ctx),
        url_(std::move(url)),
        connect_timeout_(connect_timeout),
        verify_tls_(verify_tls),
        on_event_(std::move(on_event)),
        log_callback_(std::move(log_callback)) {}

  void Run() override {
    auto self = this->shared_from_this();
    net::post(strand_, [self]() {
      self->resolver_.async_resolve(
          self->url_.host, self->url_.port,
          [self](beast::error_code ec, tcp::resolver::results_type results) {
            self->OnResolve(ec, std::move(results));
          });
    });
  }

  void Send(std::string text) override {
    auto self = this->shared_from_this();
    net::post(strand_, [self, text = std::move(text)]() mutable {
      if (self->closing_ || self->terminal_) {
        return;
      }
      self->outbox_.push_back(std::move(text));
      if (self->opened_ && !self->writing_) {
        self->DoWrite();
      }
    });
  }

  void Close() override {
    detached_ = true;
    auto self = this->shared_from_this();
    net::post(strand_, [self]() { self->DoClose(); });
  }

 private:
  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return Fail("resolve " + url_.host + ": " + ec.message());
    }
    if (closing_) {
      return;
    }
    // Covers TCP connect and the TLS handshake.
    beast::get_lowest_layer(stream_.ws).expires_after(connect_timeout_);
    auto self = this->shared_from_this();
    beast::get_lowest_layer(stream_.ws).async_connect(
        results, [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
          self->OnConnect(ec);
        });
  }

  void OnConnect(beast::error_code ec) {
    if (ec) {
      return Fail("connect: " + ec.message());
    }
    if (closing_) {
      return;
    }
    if constexpr (kSecure) {
      auto& tls = stream_.ws.next_layer();
      if (!SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
        return Fail("tls: failed to set SNI host name");
      }
      if (verify_tls_) {
        tls.set_verify_mode(ssl::verify_peer);
        tls.set_verify_callback(ssl::host_name_verification(url_.host));
      } else {
        tls.set_verify_mode(ssl::verify_none);
      }
      auto self = this->shared_from_this();
      tls.async_handshake(ssl::stream_base::client,
                          [self](beast::error_code ec) { self->OnTlsHandshake(ec); });
    } else {
      StartUpgrade();
    }
  }

  void OnTlsHandshake(beast::error_code ec) {
    if (ec) {
      return Fail("tls handshake: " + ec.message());
    }
    if (closing_) {
      return;
    }
    StartUpgrade();
  }

  void StartUpgrade() {
    beast::get_lowest_layer(stream_.ws).expires_never();
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = connect_timeout_;
    stream_.ws.set_option(timeouts);
    stream_.ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) { req.set(http::field::user_agent, kUserAgent); }));

    const bool default_port = url_.port == (kSecure ? "443" : "80");
    const std::string host_header = default_port ? url_.host : url_.host + ":" + url_.port;
    auto self = this->shared_from_this();
    stream_.ws.async_handshake(host_header, url_.target,
                               [self](beast::error_code ec) { self->OnUpgrade(ec); });
  }

  void OnUpgrade(beast::error_code ec) {
    if (ec) {
      return Fail("websocket upgrade: " + ec.message());
    }
    if (closing_) {
      return;
    }
    opened_ = true;
    stream_.ws.text(true);
    Emit({TransportEvent::Type::kOpen, {}});
    DoRead();
    if (!outbox_.empty() && !writing_) {
      DoWrite();
    }
  }

  void DoRead() {
    auto self = this->shared_from_this();
    stream_.ws.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
      self->OnRead(ec);
    });
  }

  void OnRead(beast::error_code ec) {
    if (ec == websocket::error::closed) {
      const auto& reason = stream_.ws.reason();
      std::string detail = "code " + std::to_string(reason.code);
      if (!reason.reason.empty()) {
        detail += ": " + std::string(reason.reason.data(), reason.reason.size());
      }
      terminal_ = true;
      Emit({TransportEvent::Type::kClosed, detail});
      return;
    }
    if (ec) {
      if (closing_) {
        return;
      }
      return Fail("read: " + ec.message());
    }
    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    Emit({TransportEvent::Type::kMessage, std::move(text)});
    DoRead();
  }

  void DoWrite() {
    writing_ = true;
    auto self = this->shared_from_this();
    stream_.ws.async_write(net::buffer(outbox_.front()),
                           [self](beast::error_code ec, std::size_t) { self->OnWrite(ec); });
  }

  void OnWrite(beast::error_code ec) {
    writing_ = false;
    if (ec) {
      if (closing_) {
        return;
      }
      return Fail("write: " + ec.message());
    }
    outbox_.pop_front();
    if (!outbox_.empty() && !closing_) {
      DoWrite();
    }
  }

  void DoClose() {
    if (closing_) {
      return;
    }
    closing_ = true;
    resolver_.cancel();
    if (opened_ && !terminal_ && stream_.ws.is_open()) {
      auto self = this->shared_from_this();
      stream_.ws.async_close(websocket::close_code::normal,
                             [self](beast::error_code ec) {
                               if (ec && ec != net::error::operation_aborted) {
                                 detail::Log("relay close: " + ec.message(), self->log_callback_);
                               }
                             });
      return;
    }
    beast::error_code ignored;
    beast::get_lowest_layer(stream_.ws).socket().close(ignored);
  }

  void Fail(const std::string& reason) {
    if (terminal_) {
      return;
    }
    terminal_ = true;
    Emit({TransportEvent::Type::kError, reason});
    beast::error_code ignored;
    beast::get_lowest_layer(stream_.ws).socket().close(ignored);
  }

  void Emit(const TransportEvent& event) {
    if (detached_ || !on_event_) {
      return;
    }
    on_event_(event);
  }

  Strand strand_;
  tcp::resolver resolver_;
  StreamHolder<kSecure> stream_;
  RelayUrl url_;
  std::chrono::milliseconds connect_timeout_;
  bool verify_tls_;
  RelayTransport::EventCallback on_event_;
  Config::LogCallback log_callback_;

  beast::flat_buffer buffer_;
  std::deque<std::string> outbox_;
  std::atomic<bool> detached_{false};
  bool opened_ = false;
  bool writing_ = false;
  bool closing_ = false;
  bool terminal_ = false;
};

class BeastConnection : public RelayConnection {
 public:
  explicit BeastConnection(std::shared_ptr<WebSocketSession> session)
      : session_(std::move(session)) {}
  ~BeastConnection() override { Close(); }

  void Send(const std::string& text) override { session_->Send(text); }

  void Close() override {
    if (!closed_) {
      closed_ = true;
      session_->Close();
    }
  }

 private:
  std::shared_ptr<WebSocketSession> session_;
  bool closed_ = false;
};

}  // namespace

bool ParseRelayUrl(const std::string& url, RelayUrl* out, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return fail("relay address has no scheme: " + url);
  }
  std::string scheme = url.substr(0, scheme_end);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  RelayUrl parsed;
  if (scheme == "ws") {
    parsed.secure = false;
    parsed.port = "80";
  } else if (scheme == "wss") {
    parsed.secure = true;
    parsed.port = "443";
  } else {
    return fail("unsupported relay scheme: " + scheme);
  }

  const std::string rest = url.substr(scheme_end + 3);
  const auto authority_end = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, authority_end);
  std::string target = authority_end == std::string::npos ? "" : rest.substr(authority_end);

  const auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return fail("unterminated IPv6 literal in relay address");
    }
    parsed.host = authority.substr(1, close - 1);
    const std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return fail("unexpected text after IPv6 literal");
      }
      port_text = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      parsed.host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    } else {
      parsed.host = authority;
    }
  }
  if (parsed.host.empty()) {
    return fail("relay address has no host");
  }
  if (!port_text.empty()) {
    if (!IsDigits(port_text) || port_text.size() > 5 || std::stoi(port_text) == 0 ||
        std::stoi(port_text) > 65535) {
      return fail("invalid relay port: " + port_text);
    }
    parsed.port = port_text;
  }

  const auto hash = target.find('#');
  if (hash != std::string::npos) {
    target.resize(hash);
  }
  if (target.empty() || target.front() != '/') {
    target.insert(target.begin(), '/');
  }
  parsed.target = target;

  if (out) {
    *out = std::move(parsed);
  }
  return true;
}

BeastRelayTransport::BeastRelayTransport(boost::asio::io_context& ioc, const Config& config)
    : ioc_(ioc),
      ssl_context_(ssl::context::tls_client),
      connect_timeout_(config.relay_connect_timeout),
      log_callback_(config.log_callback) {
  beast::error_code ec;
  ssl_context_.set_default_verify_paths(ec);
  if (ec) {
    detail::Log("failed to load default CA paths: " + ec.message(), log_callback_);
  }
  verify_tls_ = config.verify_tls;
}

BeastRelayTransport::~BeastRelayTransport() = default;

std::unique_ptr<RelayConnection> BeastRelayTransport::Open(const std::string& url,
                                                           EventCallback on_event) {
  RelayUrl parsed;
  std::string error;
  if (!ParseRelayUrl(url, &parsed, &error)) {
    detail::Log(error, log_callback_);
    return nullptr;
  }
  std::shared_ptr<WebSocketSession> session;
  if (parsed.secure) {
    session = std::make_shared<WebSocketConnection<true>>(
        ioc_, ssl_context_, std::move(parsed), connect_timeout_, verify_tls_,
        std::move(on_event), log_callback_);
  } else {
    session = std::make_shared<WebSocketConnection<false>>(
        ioc_, ssl_context_, std::move(parsed), connect_timeout_, verify_tls_,
        std::move(on_event), log_callback_);
  }
  session->Run();
  return std::unique_ptr<RelayConnection>(new BeastConnection(std::move(session)));
}

}  // namespace linkpair
