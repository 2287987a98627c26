#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "dnnlift/backends/backend.hpp"
#include "exec_context.hpp"
#include "function_graph.hpp"
#include "graph_node.hpp"
#include "graph_signature.hpp"

namespace dnnlift {
namespace graph {

// One node evaluation of the plan
struct ExecutionStep {
    NodePtr node;
    std::vector<int> input_slots;
    std::vector<int> output_slots;
    // Slots whose last reader is this step; released after it runs
    std::vector<int> release_after;
};

struct ValueSlot {
    ValueType type;
    bool is_input = false;
    int input_index = -1;
    bool is_constant = false;
    int last_use = -1; // Last step that reads this slot
};

// Executable plan for a FunctionGraph: topologically ordered steps over
// value slots, with per-plan descriptor and algorithm caches.
struct CompiledFunction {
    GraphSignature signature{0};
    std::vector<ExecutionStep> steps;
    std::vector<ValueSlot> slots;
    std::vector<Datum> constants; // indexed like slots, monostate if none
    std::vector<int> input_slots;
    std::vector<int> output_slots;
    std::unique_ptr<ExecContext> context;

    // Keeps every node of the plan alive
    std::vector<ValuePtr> outputs;

    size_t num_steps() const { return steps.size(); }
};

// Builds the plan. `backend` may be null when the graph holds no
// accelerated operator.
std::shared_ptr<CompiledFunction> compile(const FunctionGraph &graph,
                                          backends::BackendPtr backend);

class GraphExecutor {
  public:
    // Evaluates the plan on one datum per graph input, returning one datum
    // per graph output. Steps whose operator declares a destroy map write
    // into the destroyed input unless that buffer is a graph input, a
    // constant or still read by a later step, in which case they get a
    // private copy.
    static std::vector<Datum> execute(CompiledFunction &plan,
                                      const std::vector<Datum> &inputs);
};

} // namespace graph
} // namespace dnnlift
