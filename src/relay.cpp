#include "linkpair/relay.h"

#include "log.h"

#include <cctype>
#include <mutex>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace linkpair {
namespace {

using json = nlohmann::json;

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string EncodeQueryValue(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (const unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string StringField(const json& object, const char* name) {
  auto it = object.find(name);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

const char* EventName(TransportEvent::Type type) {
  switch (type) {
    case TransportEvent::Type::kOpen:
      return "open";
    case TransportEvent::Type::kMessage:
      return "message";
    case TransportEvent::Type::kClosed:
      return "closed";
    case TransportEvent::Type::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace

std::string EncodePhoneReady(const PhoneReadyMessage& message) {
  json frame = {
      {"type", kPhoneReadyType},
      {"ip", message.ip},
      {"port", message.port},
      {"token", message.token},
  };
  return frame.dump();
}

bool DecodeRelayMessage(const std::string& text, InboundRelayMessage* out) {
  const json frame = json::parse(text, nullptr, false);
  if (frame.is_discarded() || !frame.is_object()) {
    return false;
  }
  auto type = frame.find("type");
  if (type == frame.end() || !type->is_string()) {
    return false;
  }
  InboundRelayMessage message;
  message.raw_type = type->get<std::string>();
  if (message.raw_type == kRelayErrorType) {
    message.type = InboundMessageType::kError;
    message.error = StringField(frame, "error");
    // Some relays put the text under "message".
    if (message.error.empty()) {
      message.error = StringField(frame, "message");
    }
    if (message.error.empty()) {
      message.error = kRelayErrorFallback;
    }
  }
  if (out) {
    *out = std::move(message);
  }
  return true;
}

std::string BuildRelayUrl(const std::string& relay_address,
                          const std::string& session_id,
                          const std::string& role) {
  std::string base = relay_address;
  std::string fragment;
  const auto hash = base.find('#');
  if (hash != std::string::npos) {
    fragment = base.substr(hash);
    base.resize(hash);
  }
  std::ostringstream oss;
  oss << base;
  if (base.find('?') == std::string::npos) {
    oss << '?';
  } else if (base.back() != '?' && base.back() != '&') {
    oss << '&';
  }
  oss << "sessionId=" << EncodeQueryValue(session_id)
      << "&role=" << EncodeQueryValue(role) << fragment;
  return oss.str();
}

const char* RelayStateName(RelayHandshakeClient::State state) {
  switch (state) {
    case RelayHandshakeClient::State::kIdle:
      return "idle";
    case RelayHandshakeClient::State::kConnecting:
      return "connecting";
    case RelayHandshakeClient::State::kOpen:
      return "open";
    case RelayHandshakeClient::State::kClosed:
      return "closed";
    case RelayHandshakeClient::State::kErrored:
      return "errored";
  }
  return "unknown";
}

struct RelayHandshakeClient::Impl {
  Impl(RelayTransport& transport_ref, Config::LogCallback log_cb)
      : transport(transport_ref), log_callback(std::move(log_cb)) {}

  bool IsTerminal() const {
    return state == State::kClosed || state == State::kErrored;
  }

  // Single entry point for transport events. Terminal states swallow the rest.
  void HandleEvent(const TransportEvent& event) {
    std::shared_ptr<RelayConnection> to_send;
    std::shared_ptr<RelayConnection> to_close;
    OutcomeCallback outcome_cb;
    RelayOutcome outcome;
    std::string note;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (abandoned || IsTerminal()) {
        note = std::string("relay event ignored after terminal state: ") +
               EventName(event.type);
      } else {
        switch (event.type) {
          case TransportEvent::Type::kOpen:
            if (state == State::kConnecting) {
              state = State::kOpen;
              if (!ready_sent) {
                ready_sent = true;
                if (connection) {
                  to_send = connection;
                } else {
                  send_pending = true;
                }
              }
              note = "relay connection open, announcing endpoint";
            }
            break;
          case TransportEvent::Type::kMessage: {
            InboundRelayMessage message;
            if (!DecodeRelayMessage(event.data, &message)) {
              note = "ignoring undecodable relay frame";
              break;
            }
            if (message.type != InboundMessageType::kError) {
              note = "ignoring relay message type: " + message.raw_type;
              break;
            }
            state = State::kErrored;
            outcome.type = RelayOutcome::Type::kRelayError;
            outcome.message = message.error;
            outcome_cb = std::move(on_outcome);
            to_close = std::move(connection);
            note = "relay reported error: " + message.error;
            break;
          }
          case TransportEvent::Type::kClosed:
            if (state == State::kOpen) {
              state = State::kClosed;
              outcome.type = RelayOutcome::Type::kClosed;
              note = "relay closed the connection";
            } else {
              // Closed before the upgrade completed: the relay refused us.
              state = State::kErrored;
              outcome.type = RelayOutcome::Type::kTransportError;
              outcome.message = kRelayTransportError;
              note = "relay closed before open";
            }
            if (!event.data.empty()) {
              note += " (" + event.data + ")";
            }
            outcome_cb = std::move(on_outcome);
            to_close = std::move(connection);
            break;
          case TransportEvent::Type::kError:
            state = State::kErrored;
            outcome.type = RelayOutcome::Type::kTransportError;
            outcome.message = kRelayTransportError;
            outcome_cb = std::move(on_outcome);
            to_close = std::move(connection);
            note = "relay transport failed: " + event.data;
            break;
        }
        if (outcome_cb) {
          on_outcome = nullptr;
        }
      }
    }
    if (!note.empty()) {
      detail::Log(note, log_callback);
    }
    if (to_send) {
      to_send->Send(EncodePhoneReady(ready));
    }
    if (to_close) {
      to_close->Close();
    }
    if (outcome_cb) {
      outcome_cb(outcome);
    }
  }

  RelayTransport& transport;
  Config::LogCallback log_callback;

  mutable std::mutex mutex;
  State state = State::kIdle;
  bool ready_sent = false;
  bool send_pending = false;
  bool abandoned = false;
  PhoneReadyMessage ready;
  OutcomeCallback on_outcome;
  std::shared_ptr<RelayConnection> connection;
};

RelayHandshakeClient::RelayHandshakeClient(RelayTransport& transport,
                                           Config::LogCallback log_callback)
    : impl_(std::make_shared<Impl>(transport, std::move(log_callback))) {}

RelayHandshakeClient::~RelayHandshakeClient() { Close(); }

bool RelayHandshakeClient::Connect(const std::string& relay_address,
                                   const std::string& session_id,
                                   const std::string& role,
                                   PhoneReadyMessage ready,
                                   OutcomeCallback on_outcome) {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->state != State::kIdle || impl_->abandoned) {
      return false;
    }
    impl_->state = State::kConnecting;
    impl_->ready = std::move(ready);
    impl_->on_outcome = std::move(on_outcome);
  }

  const std::string url = BuildRelayUrl(relay_address, session_id, role);
  detail::Log("connecting to relay " + relay_address, impl_->log_callback);

  std::weak_ptr<Impl> weak = impl_;
  std::unique_ptr<RelayConnection> opened =
      impl_->transport.Open(url, [weak](const TransportEvent& event) {
        if (auto self = weak.lock()) {
          self->HandleEvent(event);
        }
      });
  if (!opened) {
    impl_->HandleEvent({TransportEvent::Type::kError, "transport refused " + url});
    return true;
  }

  std::shared_ptr<RelayConnection> connection(std::move(opened));
  bool send_now = false;
  bool close_now = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->abandoned || impl_->IsTerminal()) {
      close_now = true;
    } else {
      impl_->connection = connection;
      send_now = impl_->send_pending;
      impl_->send_pending = false;
    }
  }
  if (close_now) {
    connection->Close();
  } else if (send_now) {
    connection->Send(EncodePhoneReady(impl_->ready));
  }
  return true;
}

void RelayHandshakeClient::Close() {
  std::shared_ptr<RelayConnection> connection;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->abandoned) {
      return;
    }
    impl_->abandoned = true;
    impl_->on_outcome = nullptr;
    if (!impl_->IsTerminal() && impl_->state != State::kIdle) {
      impl_->state = State::kClosed;
    }
    connection = std::move(impl_->connection);
  }
  if (connection) {
    connection->Close();
  }
}

RelayHandshakeClient::State RelayHandshakeClient::state() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->state;
}

bool RelayHandshakeClient::ready_sent() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->ready_sent;
}

}  // namespace linkpair
