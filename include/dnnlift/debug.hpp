#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace dnnlift {
namespace trace {

// Categories used by the library: "gate", "rewrite", "descriptor",
// "algorithm", "config", "execute"
struct TraceEvent {
    std::string category;
    std::string name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
};

class Tracer {
  public:
    static Tracer &instance();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    void record(const std::string &category, const std::string &name,
                const std::string &desc,
                std::chrono::nanoseconds duration = {});

    std::string dump() const;

    // Snapshot of the recorded events
    std::vector<TraceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(const std::string &category, const std::string &name) const;

  private:
    Tracer() = default;
    std::atomic<bool> enabled_{false};
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

inline void enable() { Tracer::instance().enable(); }
inline void disable() { Tracer::instance().disable(); }
inline void clear() { Tracer::instance().clear(); }
inline std::string dump() { return Tracer::instance().dump(); }
inline bool is_enabled() { return Tracer::instance().is_enabled(); }

class ScopedTrace {
  public:
    ScopedTrace(const std::string &category, const std::string &name,
                const std::string &desc = "");
    ~ScopedTrace();

  private:
    std::string category_;
    std::string name_;
    std::string desc_;
    std::chrono::steady_clock::time_point start_;
};

// True when DNNLIFT_DEBUG is set to anything but "0" (read once)
bool debug_enabled();

// Writes "[DNNLIFT <component>] message" to stderr when debug output is on
// and records the message in the tracer when tracing is on.
void diagnostic(const std::string &component, const std::string &message);

} // namespace trace
} // namespace dnnlift
