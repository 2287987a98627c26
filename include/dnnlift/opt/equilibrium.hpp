#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "rule_registry.hpp"

namespace dnnlift {
namespace opt {

struct RewriteStats {
    size_t replacements = 0;
    size_t sweeps = 0;
    std::map<std::string, size_t> fired; // rule name -> times applied

    size_t count(const std::string &rule) const {
        auto it = fired.find(rule);
        return it == fired.end() ? 0 : it->second;
    }
};

// Runs selected registry entries over a FunctionGraph. Entries are taken
// in priority order and grouped by pass; a pass's global entries run once,
// its local rules are swept over the graph until none fires.
class EquilibriumRewriter {
  public:
    static constexpr size_t kDefaultMaxSweeps = 10000;

    explicit EquilibriumRewriter(size_t max_sweeps = kDefaultMaxSweeps)
        : max_sweeps_(max_sweeps) {}

    // Throws RuntimeError when a pass has not settled after max_sweeps
    // sweeps, which means its rules feed each other.
    RewriteStats run(graph::FunctionGraph &graph,
                     const backends::AvailabilityGate &gate,
                     const std::vector<const RuleEntry *> &entries) const;

    RewriteStats optimize(graph::FunctionGraph &graph,
                          const backends::AvailabilityGate &gate,
                          const RuleRegistry &registry,
                          const RuleQuery &query) const;

  private:
    void run_locals(RewriteContext &ctx,
                    const std::vector<const RuleEntry *> &locals,
                    const std::string &pass, RewriteStats &stats) const;

    size_t max_sweeps_;
};

} // namespace opt
} // namespace dnnlift
