#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dnnlift/backends/availability_gate.hpp"
#include "dnnlift/graph/function_graph.hpp"

namespace dnnlift {
namespace opt {

using graph::ValuePtr;

// What a rule sees while it runs. Local rules only read the graph; the
// driver applies their replacements.
struct RewriteContext {
    graph::FunctionGraph &graph;
    const backends::AvailabilityGate &gate;
};

// Node-local rewrite: inspects one node and either declines or returns one
// replacement value per node output. A replacement must compute the same
// values and must not be matched again by the same rule.
class LocalRule {
  public:
    virtual ~LocalRule() = default;

    virtual std::string name() const = 0;

    // Kinds this rule can match; empty means every kind
    virtual std::vector<graph::OpKind> tracks() const = 0;

    virtual std::optional<std::vector<ValuePtr>>
    transform(const graph::Node &node, const RewriteContext &ctx) const = 0;

    bool tracks_kind(graph::OpKind kind) const;
};

// Whole-graph pass. Returns true when it changed the graph.
class GlobalPass {
  public:
    virtual ~GlobalPass() = default;

    virtual std::string name() const = 0;
    virtual bool apply(RewriteContext &ctx) const = 0;
};

using LocalRulePtr = std::shared_ptr<const LocalRule>;
using GlobalPassPtr = std::shared_ptr<const GlobalPass>;

using LocalTransform = std::function<std::optional<std::vector<ValuePtr>>(
    const graph::Node &, const RewriteContext &)>;
using GlobalTransform = std::function<bool(RewriteContext &)>;

LocalRulePtr make_local_rule(std::string name,
                             std::vector<graph::OpKind> tracks,
                             LocalTransform transform);

GlobalPassPtr make_global_pass(std::string name, GlobalTransform transform);

} // namespace opt
} // namespace dnnlift
