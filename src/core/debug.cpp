#include "dnnlift/debug.hpp"

#include <cstdio>
#include <cstdlib>

namespace dnnlift {
namespace trace {

Tracer &Tracer::instance() {
    static Tracer tracer;
    return tracer;
}

void Tracer::record(const std::string &category, const std::string &name,
                    const std::string &desc,
                    std::chrono::nanoseconds duration) {
    if (!enabled_)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(
        {category, name, desc, std::chrono::steady_clock::now(), duration});
}

size_t Tracer::count(const std::string &category,
                     const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &event : events_) {
        if (event.category == category && (name.empty() || event.name == name))
            n++;
    }
    return n;
}

std::string Tracer::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "=== dnnlift Trace (" << events_.size() << " events) ===\n";
    oss << std::left << std::setw(12) << "Category" << std::setw(36) << "Name"
        << std::setw(15) << "Duration(us)"
        << "Description\n";
    oss << std::string(80, '-') << "\n";

    std::chrono::nanoseconds total_time{0};
    for (const auto &event : events_) {
        double duration_us = event.duration.count() / 1000.0;
        oss << std::left << std::setw(12) << event.category << std::setw(36)
            << event.name << std::setw(15) << std::fixed
            << std::setprecision(2) << duration_us << event.description
            << "\n";
        total_time += event.duration;
    }

    oss << std::string(80, '-') << "\n";
    oss << "Total time: " << (total_time.count() / 1000.0) << " us\n";
    return oss.str();
}

ScopedTrace::ScopedTrace(const std::string &category, const std::string &name,
                         const std::string &desc)
    : category_(category), name_(name), desc_(desc) {
    if (Tracer::instance().is_enabled()) {
        start_ = std::chrono::steady_clock::now();
    }
}

ScopedTrace::~ScopedTrace() {
    if (Tracer::instance().is_enabled()) {
        auto end = std::chrono::steady_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
        Tracer::instance().record(category_, name_, desc_, duration);
    }
}

bool debug_enabled() {
    static const bool enabled = []() {
        const char *env = std::getenv("DNNLIFT_DEBUG");
        return env != nullptr && env[0] != '\0' && env[0] != '0';
    }();
    return enabled;
}

void diagnostic(const std::string &component, const std::string &message) {
    if (debug_enabled()) {
        std::fprintf(stderr, "[DNNLIFT %s] %s\n", component.c_str(),
                     message.c_str());
    }
    Tracer::instance().record(component, "diagnostic", message);
}

} // namespace trace
} // namespace dnnlift
