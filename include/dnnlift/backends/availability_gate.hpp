#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "dnnlift/backends/backend.hpp"
#include "dnnlift/backends/probes.hpp"
#include "dnnlift/config.hpp"

namespace dnnlift {
namespace backends {

// Opens a session against the kernel library. May throw or return null.
using SessionFactory = std::function<BackendPtr(const DnnConfig &)>;

struct GateEnvironment {
    DeviceBindingPtr device;
    ToolchainProbePtr toolchain; // null skips the trial compile
    SessionFactory session_factory;
    DnnConfig config;
};

enum class GateStatus : uint8_t { Unknown, Probing, Available, Unavailable };

struct GateState {
    GateStatus status = GateStatus::Unknown;
    int version = 0;    // Available only
    std::string reason; // Unavailable only
};

std::string gate_status_name(GateStatus status);

// Decides once whether the accelerated backend can be used. The probe runs
// the first time any query needs it, exactly once per gate even under
// concurrent queries, and its outcome (including failures) is immutable
// afterwards.
class AvailabilityGate {
  public:
    explicit AvailabilityGate(GateEnvironment env);

    AvailabilityGate(const AvailabilityGate &) = delete;
    AvailabilityGate &operator=(const AvailabilityGate &) = delete;

    bool is_available() const;

    // Why the backend is unavailable; empty when it is available
    const std::string &reason() const;

    // Detected library version. Throws UnavailableError.
    int version() const;

    // Current state without triggering the probe
    GateState state() const;

    // Session opened by the probe. Throws UnavailableError.
    BackendPtr backend() const;

    const DnnConfig &config() const { return env_.config; }

    // Throws FeatureUnsupportedError when the detected version is below
    // `required`, UnavailableError when there is no backend at all
    void require_version(const std::string &feature, int required) const;
    bool supports(int required) const;

    // How many times the probe body ran (0 or 1)
    size_t probe_count() const { return probe_count_.load(); }

  private:
    void ensure_probed() const;
    void probe() const;
    void run_probe(std::string &stage) const;
    void finish_unavailable(const std::string &reason) const;

    GateEnvironment env_;

    // Written only inside the once_ call
    mutable std::once_flag once_;
    mutable std::atomic<GateStatus> status_{GateStatus::Unknown};
    mutable std::atomic<size_t> probe_count_{0};
    mutable int version_ = 0;
    mutable std::string reason_;
    mutable BackendPtr session_;
};

using GatePtr = std::shared_ptr<const AvailabilityGate>;

GatePtr make_gate(GateEnvironment env);

// Process-wide gate over the default environment: default device binding,
// compiler driver probe, default_config() and the registered session
// factory. Created on first use.
GatePtr process_gate();

// Installs the session factory process_gate() will use. Throws RuntimeError
// once the process gate exists.
void register_session_factory(SessionFactory factory);

} // namespace backends
} // namespace dnnlift
