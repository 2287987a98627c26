#include "dnnlift/backends/probes.hpp"
#include "dnnlift/debug.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

namespace dnnlift {
namespace backends {

// ============================================================================
// Device binding
// ============================================================================

#ifdef DNNLIFT_CUDA_SUPPORT
// Defined in cuda/cuda_device_binding.cpp
DeviceBindingPtr make_cuda_device_binding();
#endif

DeviceBindingPtr default_device_binding() {
#ifdef DNNLIFT_CUDA_SUPPORT
    return make_cuda_device_binding();
#else
    return std::make_shared<StaticDeviceBinding>(std::nullopt);
#endif
}

std::optional<int> parse_compute_capability(const std::string &text) {
    // At most four digits, so the value always fits
    if (text.size() < 4 || text.size() > 7 || text.compare(0, 3, "sm_") != 0)
        return std::nullopt;
    int value = 0;
    for (size_t i = 3; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return std::nullopt;
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

// ============================================================================
// Compiler driver probe
// ============================================================================

namespace {

std::string shell_quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string default_compiler() {
    static const std::string compiler = []() -> std::string {
        const char *env = std::getenv("DNNLIFT_CXX");
        return (env && env[0] != '\0') ? env : "c++";
    }();
    return compiler;
}

} // namespace

CompilerDriverProbe::CompilerDriverProbe(std::string compiler)
    : compiler_(compiler.empty() ? default_compiler() : std::move(compiler)) {}

CompileResult
CompilerDriverProbe::try_compile(const std::vector<std::string> &flags,
                                 const std::string &preamble,
                                 const std::string &body) const {
    namespace fs = std::filesystem;
    static std::atomic<unsigned> counter{0};

    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec)
        return {false, "no temporary directory: " + ec.message()};

    std::string stem = "dnnlift_probe_" + std::to_string(::getpid()) + "_" +
                       std::to_string(counter.fetch_add(1));
    fs::path source = dir / (stem + ".cpp");
    fs::path binary = dir / stem;

    {
        std::ofstream out(source);
        if (!out)
            return {false, "cannot write " + source.string()};
        out << preamble << "\n\nint main() {\n" << body
            << "\n    return 0;\n}\n";
    }

    std::string cmd = shell_quote(compiler_) + " -x c++ " +
                      shell_quote(source.string()) + " -o " +
                      shell_quote(binary.string());
    for (const auto &flag : flags)
        cmd += " " + shell_quote(flag);
    cmd += " 2>&1";

    trace::diagnostic("gate", "toolchain probe: " + cmd);

    CompileResult result;
    FILE *pipe = ::popen(cmd.c_str(), "r");
    if (pipe == nullptr) {
        result.diagnostics = "could not run " + compiler_;
    } else {
        char buffer[512];
        while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr)
            result.diagnostics += buffer;
        int status = ::pclose(pipe);
        result.ok = status != -1 && WIFEXITED(status) &&
                    WEXITSTATUS(status) == 0;
    }

    fs::remove(source, ec);
    fs::remove(binary, ec);
    return result;
}

} // namespace backends
} // namespace dnnlift
