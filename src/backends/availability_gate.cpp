#include "dnnlift/backends/availability_gate.hpp"
#include "dnnlift/backends/versions.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"

#include <exception>

namespace dnnlift {
namespace backends {

namespace {

// Session-creation snippet compiled by the toolchain probe
const char *kProbePreamble = R"(#include <stdio.h>
#include <cudnn.h>)";

const char *kProbeBody = R"(    cudnnHandle_t _handle = NULL;
    cudnnStatus_t err;
    if ((err = cudnnCreate(&_handle)) != CUDNN_STATUS_SUCCESS) {
        fprintf(stderr, "could not create cuDNN handle: %s",
                cudnnGetErrorString(err));
        return 1;
    })";

} // namespace

std::string gate_status_name(GateStatus status) {
    switch (status) {
    case GateStatus::Unknown:
        return "unknown";
    case GateStatus::Probing:
        return "probing";
    case GateStatus::Available:
        return "available";
    case GateStatus::Unavailable:
        return "unavailable";
    }
    return "?";
}

AvailabilityGate::AvailabilityGate(GateEnvironment env) : env_(std::move(env)) {}

void AvailabilityGate::ensure_probed() const {
    std::call_once(once_, [this] { probe(); });
}

void AvailabilityGate::finish_unavailable(const std::string &reason) const {
    reason_ = reason;
    session_.reset();
    status_.store(GateStatus::Unavailable);
    trace::Tracer::instance().record("gate", "unavailable", reason);
    trace::diagnostic("gate", "accelerated backend unavailable: " + reason);
}

// Every exit leaves the gate Available or Unavailable, so call_once never
// sees an exception and the checks run once
void AvailabilityGate::probe() const {
    probe_count_.fetch_add(1);
    status_.store(GateStatus::Probing);
    trace::ScopedTrace scoped("gate", "probe");

    std::string stage = "configuration check";
    try {
        run_probe(stage);
    } catch (const std::exception &e) {
        finish_unavailable(stage + " failed: " + e.what());
    }
}

void AvailabilityGate::run_probe(std::string &stage) const {
    if (env_.config.enabled == EnableMode::False) {
        finish_unavailable("disabled by the dnn.enabled setting");
        return;
    }

    // 1. Device family
    stage = "device query";
    std::optional<DeviceInfo> device;
    if (env_.device)
        device = env_.device->current_device();
    std::string family = device ? device->family : "none";
    if (family != "cuda") {
        finish_unavailable("not on required device family: got '" + family +
                           "'");
        return;
    }

    // 2. Compute capability
    stage = "compute capability check";
    auto cc = parse_compute_capability(device->compute_capability);
    if (!cc) {
        finish_unavailable("unrecognized device compute capability '" +
                           device->compute_capability + "'");
        return;
    }
    if (*cc < kMinComputeCapability) {
        finish_unavailable("device compute capability " +
                           device->compute_capability +
                           " is below the required sm_" +
                           std::to_string(kMinComputeCapability));
        return;
    }

    // 3. Trial compile and link
    stage = "trial compile";
    if (env_.toolchain) {
        std::vector<std::string> flags = {"-I" + env_.config.include_path,
                                          "-L" + env_.config.library_path,
                                          "-lcudnn"};
        auto result =
            env_.toolchain->try_compile(flags, kProbePreamble, kProbeBody);
        if (!result.ok) {
            finish_unavailable(
                "cannot compile against the accelerated backend:\n" +
                result.diagnostics);
            return;
        }
    }

    // 4. Functional probe
    stage = "session creation";
    BackendPtr session;
    if (!env_.session_factory) {
        finish_unavailable(
            "could not open a backend session: no session factory registered");
        return;
    }
    try {
        session = env_.session_factory(env_.config);
    } catch (const std::exception &e) {
        finish_unavailable(std::string("could not open a backend session: ") +
                           e.what());
        return;
    }
    if (!session) {
        finish_unavailable(
            "could not open a backend session: the factory returned no session");
        return;
    }

    // 5-7. Versions
    stage = "version query";
    int library = session->version();
    int header = session->header_version();
    if (header != library) {
        finish_unavailable("mixed backend versions: header " +
                           std::to_string(header) + ", library " +
                           std::to_string(library));
        return;
    }
    if (library < kMinimumVersion) {
        finish_unavailable("unsupported backend version " +
                           std::to_string(library) +
                           "; must upgrade to at least v2 final");
        return;
    }
    if (library >= kReleaseCandidateFirst && library < kReleaseCandidateEnd) {
        finish_unavailable("backend version " + std::to_string(library) +
                           " is a v3 release candidate; upgrade to the v3 "
                           "final release");
        return;
    }

    version_ = library;
    session_ = std::move(session);
    status_.store(GateStatus::Available);
    trace::Tracer::instance().record("gate", "available",
                                     session_->name() + " version " +
                                         std::to_string(version_));
    trace::diagnostic("gate", "using " + session_->name() + " version " +
                                  std::to_string(version_));
}

bool AvailabilityGate::is_available() const {
    ensure_probed();
    return status_.load() == GateStatus::Available;
}

const std::string &AvailabilityGate::reason() const {
    ensure_probed();
    return reason_;
}

int AvailabilityGate::version() const {
    if (!is_available())
        throw UnavailableError(reason_);
    return version_;
}

GateState AvailabilityGate::state() const {
    GateState s;
    s.status = status_.load();
    if (s.status == GateStatus::Available)
        s.version = version_;
    else if (s.status == GateStatus::Unavailable)
        s.reason = reason_;
    return s;
}

BackendPtr AvailabilityGate::backend() const {
    if (!is_available())
        throw UnavailableError(reason_);
    return session_;
}

bool AvailabilityGate::supports(int required) const {
    return is_available() && version_ >= required;
}

void AvailabilityGate::require_version(const std::string &feature,
                                       int required) const {
    int detected = version();
    if (detected < required)
        throw FeatureUnsupportedError(feature, required, detected);
}

GatePtr make_gate(GateEnvironment env) {
    return std::make_shared<const AvailabilityGate>(std::move(env));
}

// ============================================================================
// Process-wide gate
// ============================================================================

namespace {

struct ProcessGateRegistry {
    std::mutex mutex;
    SessionFactory factory;
    GatePtr gate;
};

ProcessGateRegistry &process_registry() {
    static ProcessGateRegistry registry;
    return registry;
}

} // namespace

GatePtr process_gate() {
    auto &registry = process_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (!registry.gate) {
        GateEnvironment env;
        env.device = default_device_binding();
        env.toolchain = std::make_shared<CompilerDriverProbe>();
        env.session_factory = registry.factory;
        env.config = default_config();
        registry.gate = make_gate(std::move(env));
    }
    return registry.gate;
}

void register_session_factory(SessionFactory factory) {
    auto &registry = process_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (registry.gate) {
        throw RuntimeError("register_session_factory called after the process "
                           "gate was created");
    }
    registry.factory = std::move(factory);
}

} // namespace backends
} // namespace dnnlift
