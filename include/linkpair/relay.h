#pragma once

#include "linkpair/linkpair.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace linkpair {

/**
 * Message types on the relay wire.
 */
constexpr const char* kPhoneReadyType = "phone-ready";
constexpr const char* kRelayErrorType = "error";

/// Shown when the relay reports an error without any text.
constexpr const char* kRelayErrorFallback = "Connection failed";
/// Shown for any connection-level failure.
constexpr const char* kRelayTransportError = "Failed to connect to signaling server";

/**
 * Outbound announcement sent once the relay connection opens.
 */
struct PhoneReadyMessage {
  std::string ip;
  uint16_t port = 0;
  std::string token;
};

enum class InboundMessageType {
  kError,
  kOther,
};

struct InboundRelayMessage {
  InboundMessageType type = InboundMessageType::kOther;
  /// Raw "type" field, kept for logging ignored messages.
  std::string raw_type;
  /// Error text for kError.
  std::string error;
};

/// Serialize a phone-ready message to its JSON wire form.
std::string EncodePhoneReady(const PhoneReadyMessage& message);

/**
 * Decode an inbound relay frame.
 *
 * @return false if the frame is not a JSON object with a string "type".
 */
bool DecodeRelayMessage(const std::string& text, InboundRelayMessage* out);

/// Append sessionId and role query parameters to the relay address.
std::string BuildRelayUrl(const std::string& relay_address,
                          const std::string& session_id,
                          const std::string& role);

/**
 * Events a transport delivers for one connection, in order.
 */
struct TransportEvent {
  enum class Type {
    kOpen,
    kMessage,
    kClosed,
    kError,
  };

  Type type = Type::kOpen;
  /// Frame text for kMessage, reason for kClosed/kError.
  std::string data;
};

/**
 * Handle to one transient relay connection.
 */
class RelayConnection {
 public:
  virtual ~RelayConnection() = default;

  /// Queue a text frame.
  virtual void Send(const std::string& text) = 0;
  /// Close the connection; no further events are delivered.
  virtual void Close() = 0;
};

/**
 * Factory for relay connections (WebSocket in production, fakes in tests).
 */
class RelayTransport {
 public:
  using EventCallback = std::function<void(const TransportEvent&)>;

  virtual ~RelayTransport() = default;

  /// Begin connecting to `url`. Events are delivered through `on_event`.
  virtual std::unique_ptr<RelayConnection> Open(const std::string& url,
                                                EventCallback on_event) = 0;
};

/**
 * Terminal outcome of a relay handshake.
 */
struct RelayOutcome {
  enum class Type {
    /// Relay closed cleanly after the announcement.
    kClosed,
    /// Relay reported an error message.
    kRelayError,
    /// Connection-level failure.
    kTransportError,
  };

  Type type = Type::kClosed;
  std::string message;
};

/**
 * Short-lived rendezvous with the relay in the phone role.
 *
 * Sends exactly one phone-ready frame on open, then only listens. The first
 * terminal event wins and everything after it is ignored.
 */
class RelayHandshakeClient {
 public:
  enum class State {
    kIdle,
    kConnecting,
    kOpen,
    kClosed,
    kErrored,
  };

  using OutcomeCallback = std::function<void(const RelayOutcome&)>;

  RelayHandshakeClient(RelayTransport& transport, Config::LogCallback log_callback);
  ~RelayHandshakeClient();

  RelayHandshakeClient(const RelayHandshakeClient&) = delete;
  RelayHandshakeClient& operator=(const RelayHandshakeClient&) = delete;

  /**
   * Open the relay connection. Returns false if already used.
   *
   * `on_outcome` is invoked at most once and never after Close().
   */
  bool Connect(const std::string& relay_address,
               const std::string& session_id,
               const std::string& role,
               PhoneReadyMessage ready,
               OutcomeCallback on_outcome);

  /// Abandon the connection and suppress any pending outcome.
  void Close();

  State state() const;
  bool ready_sent() const;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

const char* RelayStateName(RelayHandshakeClient::State state);

}  // namespace linkpair
