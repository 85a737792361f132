#include "linkpair/linkpair.h"

#include <sstream>

#include <nlohmann/json.hpp>

namespace linkpair {
namespace {

using json = nlohmann::json;

constexpr const char* kMalformedMessage = "Invalid QR code format";
constexpr const char* kIncompleteMessage = "Incomplete QR code data";

// Primary field names, followed by the names used by older web clients.
constexpr const char* kFieldKind = "kind";
constexpr const char* kFieldKindLegacy = "type";
constexpr const char* kFieldVersion = "version";
constexpr const char* kFieldVersionLegacy = "v";
constexpr const char* kFieldSessionId = "sessionId";
constexpr const char* kFieldToken = "token";
constexpr const char* kFieldRelay = "relayAddress";
constexpr const char* kFieldRelayLegacy = "relay";

const json* FindField(const json& object, const char* name, const char* legacy) {
  auto it = object.find(name);
  if (it != object.end()) {
    return &*it;
  }
  if (legacy != nullptr) {
    it = object.find(legacy);
    if (it != object.end()) {
      return &*it;
    }
  }
  return nullptr;
}

// Copy a non-empty string field; anything else counts as missing.
bool ReadString(const json& object, const char* name, const char* legacy,
                std::string* out) {
  const json* value = FindField(object, name, legacy);
  if (value == nullptr || !value->is_string()) {
    return false;
  }
  const auto& text = value->get_ref<const json::string_t&>();
  if (text.empty()) {
    return false;
  }
  *out = text;
  return true;
}

std::string ExpectedFormat(const Config& config) {
  std::ostringstream oss;
  oss << "Expected a \"" << config.payload_kind << "\" code, version "
      << config.protocol_version;
  return oss.str();
}

std::string IncompatibleMessage(const Config& config) {
  return "Invalid QR code. " + ExpectedFormat(config);
}

std::string IncompleteMessage(const Config& config) {
  return std::string(kIncompleteMessage) + ". " + ExpectedFormat(config);
}

bool Fail(ValidationError* error, ValidationErrorKind kind, std::string message) {
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace

bool ParsePairingRequest(const std::string& raw,
                         const Config& config,
                         PairingRequest* out,
                         ValidationError* error) {
  // parse() with allow_exceptions=false yields a discarded value instead of throwing.
  const json document = json::parse(raw, nullptr, false);
  if (document.is_discarded()) {
    return Fail(error, ValidationErrorKind::kMalformed, kMalformedMessage);
  }
  if (!document.is_object()) {
    return Fail(error, ValidationErrorKind::kIncompatible, IncompatibleMessage(config));
  }

  PairingRequest request;
  if (!ReadString(document, kFieldKind, kFieldKindLegacy, &request.kind) ||
      request.kind != config.payload_kind) {
    return Fail(error, ValidationErrorKind::kIncompatible, IncompatibleMessage(config));
  }
  const json* version = FindField(document, kFieldVersion, kFieldVersionLegacy);
  if (version == nullptr || !version->is_number_integer()) {
    return Fail(error, ValidationErrorKind::kIncompatible, IncompatibleMessage(config));
  }
  const auto version_value = version->get<int64_t>();
  if (version_value != config.protocol_version) {
    return Fail(error, ValidationErrorKind::kIncompatible, IncompatibleMessage(config));
  }
  request.version = static_cast<int>(version_value);

  if (!ReadString(document, kFieldSessionId, nullptr, &request.session_id) ||
      !ReadString(document, kFieldToken, nullptr, &request.token) ||
      !ReadString(document, kFieldRelay, kFieldRelayLegacy, &request.relay_address)) {
    return Fail(error, ValidationErrorKind::kIncompatible, IncompleteMessage(config));
  }

  if (out) {
    *out = std::move(request);
  }
  return true;
}

}  // namespace linkpair
