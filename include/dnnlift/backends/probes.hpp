#pragma once

// Environment probes consumed by the availability gate: which device the
// process is bound to, and whether a toolchain can build against the
// kernel library.

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dnnlift {
namespace backends {

// ============================================================================
// Device binding
// ============================================================================

struct DeviceInfo {
    std::string family;             // e.g. "cuda"
    std::string compute_capability; // e.g. "sm_35"
    std::string name;
};

class DeviceBinding {
  public:
    virtual ~DeviceBinding() = default;

    // The device the process is bound to, nullopt when there is none
    virtual std::optional<DeviceInfo> current_device() const = 0;
};

using DeviceBindingPtr = std::shared_ptr<const DeviceBinding>;

// Binding with a fixed answer, for callers that already know their device
class StaticDeviceBinding : public DeviceBinding {
  public:
    explicit StaticDeviceBinding(std::optional<DeviceInfo> device)
        : device_(std::move(device)) {}

    std::optional<DeviceInfo> current_device() const override {
        return device_;
    }

  private:
    std::optional<DeviceInfo> device_;
};

// CUDA runtime query when built with DNNLIFT_CUDA_SUPPORT, otherwise a
// binding that reports no device
DeviceBindingPtr default_device_binding();

// Parses "sm_XY" into XY. Returns nullopt for anything else.
std::optional<int> parse_compute_capability(const std::string &text);

// ============================================================================
// Toolchain probe
// ============================================================================

struct CompileResult {
    bool ok = false;
    std::string diagnostics;
};

class ToolchainProbe {
  public:
    virtual ~ToolchainProbe() = default;

    // Compiles and links a program made of `preamble` followed by a main()
    // wrapping `body`
    virtual CompileResult try_compile(const std::vector<std::string> &flags,
                                      const std::string &preamble,
                                      const std::string &body) const = 0;
};

using ToolchainProbePtr = std::shared_ptr<const ToolchainProbe>;

// Runs the host compiler driver: DNNLIFT_CXX, falling back to "c++"
class CompilerDriverProbe : public ToolchainProbe {
  public:
    explicit CompilerDriverProbe(std::string compiler = "");

    CompileResult try_compile(const std::vector<std::string> &flags,
                              const std::string &preamble,
                              const std::string &body) const override;

    const std::string &compiler() const { return compiler_; }

  private:
    std::string compiler_;
};

} // namespace backends
} // namespace dnnlift
