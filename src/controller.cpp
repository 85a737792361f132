#include "linkpair/linkpair.h"
#include "linkpair/relay.h"

#include "log.h"

#include <atomic>
#include <mutex>
#include <sstream>
#include <utility>

namespace linkpair {

struct PairingMetricsAtomic {
  std::atomic<uint64_t> scans_received{0};
  std::atomic<uint64_t> scans_dropped{0};
  std::atomic<uint64_t> validation_failures{0};
  std::atomic<uint64_t> launch_failures{0};
  std::atomic<uint64_t> relay_errors{0};
  std::atomic<uint64_t> transport_errors{0};
  std::atomic<uint64_t> handoffs{0};
  std::atomic<uint64_t> callback_exceptions{0};

  PairingMetrics Snapshot() const {
    PairingMetrics snapshot;
    snapshot.scans_received = scans_received.load();
    snapshot.scans_dropped = scans_dropped.load();
    snapshot.validation_failures = validation_failures.load();
    snapshot.launch_failures = launch_failures.load();
    snapshot.relay_errors = relay_errors.load();
    snapshot.transport_errors = transport_errors.load();
    snapshot.handoffs = handoffs.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct PairingController::Impl : std::enable_shared_from_this<PairingController::Impl> {
  Impl(Config config_in, LocalEndpointLauncher& launcher_ref, RelayTransport& transport_ref)
      : config(std::move(config_in)), launcher(launcher_ref), transport(transport_ref) {
    config_valid = config.Validate(&config_error);
  }

  // Work that must run after the state lock is released.
  struct Effects {
    bool phase_changed = false;
    PairingPhase phase = PairingPhase::kIdle;
    std::shared_ptr<RelayHandshakeClient> client_to_close;
    bool stop_launcher = false;
    std::optional<LocalEndpointInfo> handoff;
    std::string log;
  };

  void SetPhase(PairingPhase next, Effects* effects) {
    if (phase == next) {
      return;
    }
    std::ostringstream oss;
    oss << "phase " << PhaseName(phase) << " -> " << PhaseName(next)
        << " (attempt " << attempt_id << ")";
    if (!effects->log.empty()) {
      effects->log += "; ";
    }
    effects->log += oss.str();
    phase = next;
    effects->phase_changed = true;
    effects->phase = next;
  }

  // Drop the attempt's transient resources and go back to idle.
  void ResetAttempt(Effects* effects) {
    effects->client_to_close = std::move(client);
    effects->stop_launcher = endpoint_started;
    request.reset();
    endpoint.reset();
    endpoint_started = false;
    SetPhase(PairingPhase::kIdle, effects);
  }

  void FailAttempt(ErrorCode code, const std::string& message, Effects* effects) {
    switch (code) {
      case ErrorCode::kMalformedPayload:
      case ErrorCode::kIncompatiblePayload:
        metrics.validation_failures.fetch_add(1);
        break;
      case ErrorCode::kLaunchFailed:
        metrics.launch_failures.fetch_add(1);
        break;
      case ErrorCode::kRelayTransport:
        metrics.transport_errors.fetch_add(1);
        break;
      case ErrorCode::kRelayError:
        metrics.relay_errors.fetch_add(1);
        break;
    }
    last_error = PairingError{code, message};
    std::string note = std::string("attempt failed (") + ErrorCodeName(code) + "): " + message;
    effects->log = effects->log.empty() ? note : effects->log + "; " + note;
    ResetAttempt(effects);
  }

  void Apply(Effects& effects) {
    if (!effects.log.empty()) {
      detail::Log(effects.log, config.log_callback);
    }
    if (effects.client_to_close) {
      effects.client_to_close->Close();
      effects.client_to_close.reset();
    }
    if (effects.stop_launcher) {
      launcher.Stop();
    }
    // Observers of kConnected can rely on the hand-off having run.
    if (effects.handoff) {
      HandoffCallback cb_copy;
      {
        std::lock_guard<std::mutex> lock(callback_mutex);
        cb_copy = handoff_cb;
      }
      metrics.handoffs.fetch_add(1);
      if (cb_copy) {
        try {
          cb_copy(*effects.handoff);
        } catch (...) {
          RecordCallbackException("HandoffCallback");
        }
      }
    }
    if (effects.phase_changed) {
      PhaseCallback cb_copy;
      {
        std::lock_guard<std::mutex> lock(callback_mutex);
        cb_copy = phase_cb;
      }
      if (cb_copy) {
        try {
          cb_copy(effects.phase);
        } catch (...) {
          RecordCallbackException("PhaseCallback");
        }
      }
    }
  }

  void RecordCallbackException(const char* name) {
    metrics.callback_exceptions.fetch_add(1);
    detail::LogCallbackError(name, config.log_callback);
  }

  void OnScan(const std::string& raw) {
    metrics.scans_received.fetch_add(1);
    Effects effects;
    uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex);
      if (phase != PairingPhase::kIdle) {
        metrics.scans_dropped.fetch_add(1);
        effects.log = std::string("scan dropped while ") + PhaseName(phase);
      } else {
        id = ++attempt_id;
        last_error.reset();
        SetPhase(PairingPhase::kValidating, &effects);
      }
    }
    // The phase change is published before validation so observers see it.
    Apply(effects);
    if (id == 0) {
      return;
    }
    Validate(id, raw);
  }

  void Validate(uint64_t id, const std::string& raw) {
    PairingRequest parsed;
    ValidationError error;
    const bool ok = ParsePairingRequest(raw, config, &parsed, &error);

    Effects effects;
    std::string token;
    {
      std::lock_guard<std::mutex> lock(state_mutex);
      if (id != attempt_id || phase != PairingPhase::kValidating) {
        return;
      }
      if (!ok) {
        FailAttempt(error.kind == ValidationErrorKind::kMalformed
                        ? ErrorCode::kMalformedPayload
                        : ErrorCode::kIncompatiblePayload,
                    error.message, &effects);
      } else if (!config_valid) {
        FailAttempt(ErrorCode::kLaunchFailed, "invalid configuration: " + config_error,
                    &effects);
      } else {
        request.emplace(std::move(parsed));
        token = request->token;
        SetPhase(PairingPhase::kLaunchingEndpoint, &effects);
      }
    }
    Apply(effects);
    if (token.empty()) {
      return;
    }

    std::weak_ptr<Impl> weak = shared_from_this();
    launcher.Start(token, [weak, id](const LaunchResult& result) {
      if (auto self = weak.lock()) {
        self->OnLaunchResult(id, result);
      }
    });
  }

  void OnLaunchResult(uint64_t id, const LaunchResult& result) {
    Effects effects;
    std::shared_ptr<RelayHandshakeClient> connect_client;
    PhoneReadyMessage ready;
    std::string relay_address;
    std::string session_id;
    {
      std::lock_guard<std::mutex> lock(state_mutex);
      if (id != attempt_id || phase != PairingPhase::kLaunchingEndpoint) {
        effects.log = "stale launch result ignored (attempt " + std::to_string(id) + ")";
      } else if (!result.ok()) {
        FailAttempt(ErrorCode::kLaunchFailed,
                    result.error.empty() ? "Failed to start local server" : result.error,
                    &effects);
      } else {
        endpoint_started = true;
        endpoint = *result.endpoint;
        ready.ip = endpoint->host;
        ready.port = endpoint->port;
        ready.token = request->token;
        relay_address = request->relay_address;
        session_id = request->session_id;
        client = std::make_shared<RelayHandshakeClient>(transport, config.log_callback);
        connect_client = client;
        effects.log = "local endpoint at " + endpoint->host + ":" +
                      std::to_string(endpoint->port);
        SetPhase(PairingPhase::kHandshaking, &effects);
      }
    }
    Apply(effects);
    if (connect_client == nullptr) {
      return;
    }

    // Holding connect_client keeps the client alive even if a cancel or a
    // synchronous outcome releases the attempt's reference meanwhile.
    std::weak_ptr<Impl> weak = shared_from_this();
    connect_client->Connect(relay_address, session_id, config.relay_role, std::move(ready),
                            [weak, id](const RelayOutcome& outcome) {
                              if (auto self = weak.lock()) {
                                self->OnRelayOutcome(id, outcome);
                              }
                            });
  }

  void OnRelayOutcome(uint64_t id, const RelayOutcome& outcome) {
    Effects effects;
    {
      std::lock_guard<std::mutex> lock(state_mutex);
      if (id != attempt_id || phase != PairingPhase::kHandshaking) {
        return;
      }
      switch (outcome.type) {
        case RelayOutcome::Type::kClosed:
          // Close without a prior error counts as success, even if the relay
          // never confirmed forwarding to the browser.
          effects.handoff = endpoint;
          effects.client_to_close = std::move(client);
          request.reset();
          SetPhase(PairingPhase::kConnected, &effects);
          break;
        case RelayOutcome::Type::kRelayError:
          FailAttempt(ErrorCode::kRelayError, outcome.message, &effects);
          break;
        case RelayOutcome::Type::kTransportError:
          FailAttempt(ErrorCode::kRelayTransport, outcome.message, &effects);
          break;
      }
    }
    Apply(effects);
  }

  void Cancel() {
    Effects effects;
    {
      std::lock_guard<std::mutex> lock(state_mutex);
      if (phase == PairingPhase::kIdle || phase == PairingPhase::kConnected) {
        return;
      }
      const bool launching = phase == PairingPhase::kLaunchingEndpoint;
      ++attempt_id;
      effects.log = "attempt cancelled";
      ResetAttempt(&effects);
      // A launch may still be pending even though no endpoint is known yet.
      effects.stop_launcher = effects.stop_launcher || launching;
    }
    Apply(effects);
  }

  const Config config;
  bool config_valid = false;
  std::string config_error;
  LocalEndpointLauncher& launcher;
  RelayTransport& transport;

  mutable std::mutex state_mutex;
  PairingPhase phase = PairingPhase::kIdle;
  uint64_t attempt_id = 0;
  std::optional<const PairingRequest> request;
  std::optional<LocalEndpointInfo> endpoint;
  bool endpoint_started = false;
  std::shared_ptr<RelayHandshakeClient> client;
  std::optional<PairingError> last_error;

  mutable std::mutex callback_mutex;
  HandoffCallback handoff_cb;
  PhaseCallback phase_cb;

  PairingMetricsAtomic metrics;
};

PairingController::PairingController(Config config,
                                     LocalEndpointLauncher& launcher,
                                     RelayTransport& transport)
    : impl_(std::make_shared<Impl>(std::move(config), launcher, transport)) {}

PairingController::~PairingController() {
  {
    // No callbacks may run from a controller that is going away.
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->handoff_cb = nullptr;
    impl_->phase_cb = nullptr;
  }
  impl_->Cancel();
}

void PairingController::SetHandoffCallback(HandoffCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->handoff_cb = std::move(cb);
}

void PairingController::SetPhaseCallback(PhaseCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->phase_cb = std::move(cb);
}

void PairingController::OnScan(const std::string& raw) { impl_->OnScan(raw); }

void PairingController::Cancel() { impl_->Cancel(); }

void PairingController::DismissError() {
  std::lock_guard<std::mutex> lock(impl_->state_mutex);
  impl_->last_error.reset();
}

PairingPhase PairingController::GetPhase() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex);
  return impl_->phase;
}

std::optional<PairingError> PairingController::GetLastError() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex);
  return impl_->last_error;
}

PairingMetrics PairingController::GetMetrics() const { return impl_->metrics.Snapshot(); }

}  // namespace linkpair
