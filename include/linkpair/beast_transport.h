#pragma once

#include "linkpair/linkpair.h"
#include "linkpair/relay.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

namespace linkpair {

/**
 * Parsed ws:// or wss:// relay address.
 */
struct RelayUrl {
  bool secure = false;
  std::string host;
  std::string port;
  /// Path plus query, always starting with '/'.
  std::string target;
};

/**
 * Split a WebSocket URL into its parts.
 *
 * @param error Optional output string describing why the URL was rejected.
 */
bool ParseRelayUrl(const std::string& url, RelayUrl* out, std::string* error = nullptr);

/**
 * WebSocket relay transport over Boost.Beast (plain and TLS).
 *
 * Connection work runs on the supplied io_context; events are delivered from
 * its thread.
 */
class BeastRelayTransport : public RelayTransport {
 public:
  BeastRelayTransport(boost::asio::io_context& ioc, const Config& config);
  ~BeastRelayTransport() override;

  BeastRelayTransport(const BeastRelayTransport&) = delete;
  BeastRelayTransport& operator=(const BeastRelayTransport&) = delete;

  std::unique_ptr<RelayConnection> Open(const std::string& url,
                                        EventCallback on_event) override;

 private:
  boost::asio::io_context& ioc_;
  boost::asio::ssl::context ssl_context_;
  std::chrono::milliseconds connect_timeout_;
  bool verify_tls_ = true;
  Config::LogCallback log_callback_;
};

}  // namespace linkpair
