#include "linkpair/linkpair.h"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace linkpair {

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (payload_kind.empty()) {
    return fail("payload_kind must not be empty");
  }
  if (protocol_version <= 0) {
    return fail("protocol_version must be positive");
  }
  if (relay_role.empty()) {
    return fail("relay_role must not be empty");
  }
  if (relay_connect_timeout.count() <= 0) {
    return fail("relay_connect_timeout must be positive");
  }
  if (!is_valid_ipv4(endpoint_bind_address)) {
    return fail("endpoint_bind_address must be a valid IPv4 address");
  }
  if (endpoint_port != 0 && endpoint_port < 1024) {
    return fail("endpoint_port must be 0 or an unprivileged port");
  }
  if (endpoint_bind_attempts <= 0) {
    return fail("endpoint_bind_attempts must be positive");
  }
  if (endpoint_max_auth_failures <= 0 || endpoint_block_duration.count() <= 0) {
    return fail("endpoint auth limits must be positive");
  }
  return true;
}

const char* PhaseName(PairingPhase phase) {
  switch (phase) {
    case PairingPhase::kIdle:
      return "idle";
    case PairingPhase::kValidating:
      return "validating";
    case PairingPhase::kLaunchingEndpoint:
      return "launching-endpoint";
    case PairingPhase::kHandshaking:
      return "handshaking";
    case PairingPhase::kConnected:
      return "connected";
  }
  return "unknown";
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kMalformedPayload:
      return "malformed-payload";
    case ErrorCode::kIncompatiblePayload:
      return "incompatible-payload";
    case ErrorCode::kLaunchFailed:
      return "launch-failed";
    case ErrorCode::kRelayTransport:
      return "relay-transport";
    case ErrorCode::kRelayError:
      return "relay-error";
  }
  return "unknown";
}

}  // namespace linkpair
