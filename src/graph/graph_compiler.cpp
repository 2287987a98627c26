#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/compiled_function.hpp"

#include <unordered_map>

namespace dnnlift {
namespace graph {

// ============================================================================
// Slot assignment
// ============================================================================

namespace {

struct SlotTable {
    std::unordered_map<const Value *, int> index;
    CompiledFunction &plan;

    int slot_of(const ValuePtr &v) {
        auto it = index.find(v.get());
        if (it != index.end())
            return it->second;
        int slot = static_cast<int>(plan.slots.size());
        ValueSlot info;
        info.type = v->type();
        plan.slots.push_back(info);
        plan.constants.emplace_back();
        if (v->is_constant()) {
            plan.slots[slot].is_constant = true;
            plan.constants[slot] = v->constant_value();
        }
        index[v.get()] = slot;
        return slot;
    }
};

// ============================================================================
// Memory planning: release each slot after its last reader
// ============================================================================

void plan_releases(CompiledFunction &plan) {
    for (size_t s = 0; s < plan.steps.size(); ++s) {
        for (int slot : plan.steps[s].input_slots)
            plan.slots[slot].last_use = static_cast<int>(s);
    }
    // Outputs live until the end
    for (int slot : plan.output_slots)
        plan.slots[slot].last_use = static_cast<int>(plan.steps.size());

    for (size_t slot = 0; slot < plan.slots.size(); ++slot) {
        const auto &info = plan.slots[slot];
        if (info.is_constant || info.last_use < 0 ||
            info.last_use >= static_cast<int>(plan.steps.size()))
            continue;
        plan.steps[info.last_use].release_after.push_back(
            static_cast<int>(slot));
    }
}

} // namespace

std::shared_ptr<CompiledFunction> compile(const FunctionGraph &graph,
                                          backends::BackendPtr backend) {
    trace::ScopedTrace trace("execute", "compile");

    auto plan = std::make_shared<CompiledFunction>();
    plan->signature = compute_signature(graph.inputs(), graph.outputs());
    plan->outputs = graph.outputs();
    plan->context = std::make_unique<ExecContext>(std::move(backend));

    SlotTable table{{}, *plan};

    for (size_t i = 0; i < graph.inputs().size(); ++i) {
        int slot = table.slot_of(graph.inputs()[i]);
        plan->slots[slot].is_input = true;
        plan->slots[slot].input_index = static_cast<int>(i);
        plan->input_slots.push_back(slot);
    }

    for (const auto &node : graph.nodes()) {
        ExecutionStep step;
        step.node = node;
        for (const auto &in : node->inputs()) {
            int slot = table.slot_of(in);
            const auto &info = plan->slots[slot];
            if (in->is_leaf() && !info.is_input && !info.is_constant) {
                throw RuntimeError("graph input " + in->repr() +
                                   " is not listed among the function inputs");
            }
            step.input_slots.push_back(slot);
        }
        for (size_t i = 0; i < node->num_outputs(); ++i)
            step.output_slots.push_back(table.slot_of(node->output(i)));
        plan->steps.push_back(std::move(step));
    }

    for (const auto &out : graph.outputs()) {
        int slot = table.slot_of(out);
        const auto &info = plan->slots[slot];
        if (out->is_leaf() && !info.is_input && !info.is_constant) {
            throw RuntimeError("graph output " + out->repr() +
                               " is an unbound input");
        }
        plan->output_slots.push_back(slot);
    }

    plan_releases(*plan);
    return plan;
}

} // namespace graph
} // namespace dnnlift
