#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace linkpair {

class RelayTransport;

/**
 * Defaults for the scanned payload and the relay handshake.
 */
constexpr const char* kDefaultPayloadKind = "pair";
constexpr int kDefaultProtocolVersion = 1;
constexpr const char* kPhoneRole = "phone";

/**
 * Ephemeral port range used when the endpoint port is left at 0.
 */
constexpr uint16_t kEphemeralPortFirst = 49152;
constexpr uint16_t kEphemeralPortLast = 65535;

/**
 * Pairing request decoded from a scanned QR payload.
 */
struct PairingRequest {
  /// Payload discriminator ("kind").
  std::string kind;
  /// Protocol version ("version").
  int version = 0;
  /// Relay-scoped correlation key ("sessionId").
  std::string session_id;
  /// Single-use bearer credential ("token").
  std::string token;
  /// URI of the rendezvous relay ("relayAddress").
  std::string relay_address;
};

/**
 * Address of the local endpoint the browser should reach.
 */
struct LocalEndpointInfo {
  std::string host;
  uint16_t port = 0;
};

inline bool operator==(const LocalEndpointInfo& a, const LocalEndpointInfo& b) {
  return a.host == b.host && a.port == b.port;
}

enum class ValidationErrorKind {
  /// Text is not decodable JSON.
  kMalformed,
  /// Decodable, but wrong discriminator/version or missing fields.
  kIncompatible,
};

struct ValidationError {
  ValidationErrorKind kind = ValidationErrorKind::kMalformed;
  std::string message;
};

/**
 * Error codes surfaced by the pairing controller.
 */
enum class ErrorCode {
  kMalformedPayload,
  kIncompatiblePayload,
  kLaunchFailed,
  kRelayTransport,
  kRelayError,
};

struct PairingError {
  ErrorCode code = ErrorCode::kMalformedPayload;
  /// User-facing message (relay errors are preserved verbatim).
  std::string message;
};

/**
 * Controller phases. kConnected is terminal.
 */
enum class PairingPhase {
  kIdle,
  kValidating,
  kLaunchingEndpoint,
  kHandshaking,
  kConnected,
};

const char* PhaseName(PairingPhase phase);
const char* ErrorCodeName(ErrorCode code);

/**
 * Counters for scan handling, outcomes and callback failures.
 */
struct PairingMetrics {
  uint64_t scans_received = 0;
  uint64_t scans_dropped = 0;
  uint64_t validation_failures = 0;
  uint64_t launch_failures = 0;
  uint64_t relay_errors = 0;
  uint64_t transport_errors = 0;
  uint64_t handoffs = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Configuration shared by the controller, relay transport and endpoint.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Discriminator the payload "kind" must equal.
  std::string payload_kind = kDefaultPayloadKind;
  /// Protocol version the payload "version" must equal.
  int protocol_version = kDefaultProtocolVersion;
  /// Role announced to the relay in the connect query.
  std::string relay_role = kPhoneRole;

  /// Connect timeout applied by the relay transport (TCP + TLS + upgrade).
  std::chrono::milliseconds relay_connect_timeout{10000};
  /// Verify the relay certificate for wss:// addresses.
  bool verify_tls = true;

  /// Local bind address for the endpoint listener.
  std::string endpoint_bind_address = "0.0.0.0";
  /// Endpoint port, 0 picks a random port in the ephemeral range.
  uint16_t endpoint_port = 0;
  /// Host advertised to the browser. Empty means first non-loopback IPv4.
  std::string endpoint_advertised_host;
  /// Number of random ports tried before giving up.
  int endpoint_bind_attempts = 5;
  /// Failed bearer checks from one client before it is blocked.
  int endpoint_max_auth_failures = 5;
  /// How long a client stays blocked after too many failures.
  std::chrono::milliseconds endpoint_block_duration{5 * 60 * 1000};

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Decode a scanned payload into a pairing request.
 *
 * Never throws. On failure `error` (if given) receives the typed reason and
 * `out` is left untouched.
 */
bool ParsePairingRequest(const std::string& raw,
                         const Config& config,
                         PairingRequest* out,
                         ValidationError* error);

/**
 * Result of a local endpoint launch: either an address or an error message.
 */
struct LaunchResult {
  std::optional<LocalEndpointInfo> endpoint;
  std::string error;

  bool ok() const { return endpoint.has_value(); }
};

/**
 * Starts a token-authenticated server reachable on the local network.
 */
class LocalEndpointLauncher {
 public:
  using LaunchCallback = std::function<void(const LaunchResult&)>;

  virtual ~LocalEndpointLauncher() = default;

  /// Start serving with `token`; `done` is invoked exactly once.
  virtual void Start(const std::string& token, LaunchCallback done) = 0;
  /// Stop the endpoint (and abandon a pending start).
  virtual void Stop() = 0;
};

/**
 * Drives one pairing attempt at a time: validate, launch, relay handshake,
 * then hand-off or error.
 */
class PairingController {
 public:
  using HandoffCallback = std::function<void(const LocalEndpointInfo&)>;
  using PhaseCallback = std::function<void(PairingPhase)>;

  /// The launcher and transport must outlive the controller.
  PairingController(Config config,
                    LocalEndpointLauncher& launcher,
                    RelayTransport& transport);
  /// Cancels an in-flight attempt. Never invokes the hand-off.
  ~PairingController();

  PairingController(const PairingController&) = delete;
  PairingController& operator=(const PairingController&) = delete;

  /// Set callback invoked once with the endpoint after a successful pairing.
  void SetHandoffCallback(HandoffCallback cb);
  /// Set callback invoked on every phase change.
  void SetPhaseCallback(PhaseCallback cb);

  /// Feed a scan event. Dropped unless the controller is idle.
  void OnScan(const std::string& raw);
  /// Abandon the in-flight attempt, if any, and return to idle.
  void Cancel();
  /// Clear the current error message.
  void DismissError();

  /// Return the current phase.
  PairingPhase GetPhase() const;
  /// Return the current error, if any.
  std::optional<PairingError> GetLastError() const;
  /// Return metrics for scans, outcomes and callbacks.
  PairingMetrics GetMetrics() const;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace linkpair
