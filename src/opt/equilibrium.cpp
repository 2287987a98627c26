#include "dnnlift/opt/equilibrium.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"

#include <utility>

namespace dnnlift {
namespace opt {

namespace {

// Applies one rule's replacement. Returns false when the rule handed back
// the node's own outputs.
bool apply_replacement(RewriteContext &ctx, const graph::Node &node,
                       const RuleEntry &entry,
                       const std::vector<ValuePtr> &replacement) {
    if (replacement.size() != node.num_outputs()) {
        throw RuntimeError::internal(
            "rule " + entry.name + " returned " +
            std::to_string(replacement.size()) + " values for " +
            node.op().name() + " with " + std::to_string(node.num_outputs()) +
            " outputs");
    }
    std::vector<std::pair<ValuePtr, ValuePtr>> pairs;
    for (size_t i = 0; i < replacement.size(); ++i) {
        auto old_value = node.output(i);
        if (!replacement[i] || replacement[i] == old_value)
            continue;
        pairs.emplace_back(std::move(old_value), replacement[i]);
    }
    if (pairs.empty())
        return false;

    std::string desc = node.op().name();
    ctx.graph.replace_all(pairs);
    trace::diagnostic("rewrite", entry.name + " replaced " + desc);
    return true;
}

} // namespace

void EquilibriumRewriter::run_locals(
    RewriteContext &ctx, const std::vector<const RuleEntry *> &locals,
    const std::string &pass, RewriteStats &stats) const {
    if (locals.empty())
        return;

    size_t sweeps = 0;
    bool changed = true;
    while (changed) {
        changed = false;
        if (++sweeps > max_sweeps_) {
            throw RuntimeError("rewrite pass '" + pass +
                               "' did not settle after " +
                               std::to_string(max_sweeps_) + " sweeps");
        }
        stats.sweeps++;

        // Every replacement rebuilds downstream nodes, so restart the sweep
        // from a fresh node list after each one
        auto nodes = ctx.graph.nodes();
        for (const auto &node : nodes) {
            for (const auto *entry : locals) {
                if (!entry->local->tracks_kind(node->kind()))
                    continue;
                auto replacement = entry->local->transform(*node, ctx);
                if (!replacement)
                    continue;
                if (apply_replacement(ctx, *node, *entry, *replacement)) {
                    stats.replacements++;
                    stats.fired[entry->name]++;
                    changed = true;
                    break;
                }
            }
            if (changed)
                break;
        }
    }
}

RewriteStats
EquilibriumRewriter::run(graph::FunctionGraph &graph,
                         const backends::AvailabilityGate &gate,
                         const std::vector<const RuleEntry *> &entries) const {
    RewriteContext ctx{graph, gate};
    RewriteStats stats;

    size_t i = 0;
    while (i < entries.size()) {
        const std::string &pass = entries[i]->pass;
        std::vector<const RuleEntry *> locals;
        for (; i < entries.size() && entries[i]->pass == pass; ++i) {
            const auto *entry = entries[i];
            if (!entry->is_global()) {
                locals.push_back(entry);
                continue;
            }
            // Globals run in place; pending locals of the pass go first
            run_locals(ctx, locals, pass, stats);
            locals.clear();
            trace::ScopedTrace scope("rewrite", entry->name);
            if (entry->global->apply(ctx)) {
                stats.replacements++;
                stats.fired[entry->name]++;
            }
        }
        run_locals(ctx, locals, pass, stats);
    }
    return stats;
}

RewriteStats EquilibriumRewriter::optimize(graph::FunctionGraph &graph,
                                           const backends::AvailabilityGate &gate,
                                           const RuleRegistry &registry,
                                           const RuleQuery &query) const {
    return run(graph, gate, registry.select(query));
}

} // namespace opt
} // namespace dnnlift
