#include "dnnlift/graph/gradient.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/function_graph.hpp"
#include "dnnlift/ops/tensor_ops.hpp"

#include <unordered_map>
#include <unordered_set>

namespace dnnlift {
namespace graph {

namespace {

bool carries_gradient(const ValueType &type) {
    return (type.is_tensor() || type.is_scalar()) && is_floating(type.dtype);
}

} // namespace

std::vector<ValuePtr> grad(const ValuePtr &output, const ValuePtr &seed,
                           const std::vector<ValuePtr> &wrt) {
    if (!output || !seed)
        throw RuntimeError::internal("grad called with a null output or seed");
    if (!is_compatible(output->type(), seed->type())) {
        throw TypeError("gradient seed " + seed->repr() +
                        " does not match output " + output->repr());
    }

    auto nodes = topo_sort({output});

    // Forward pass: which values depend on any of `wrt`
    std::unordered_set<const Value *> depends;
    for (const auto &w : wrt) {
        if (w && carries_gradient(w->type()))
            depends.insert(w.get());
    }
    std::unordered_map<const Node *, std::vector<bool>> patterns;
    for (const auto &node : nodes) {
        auto pattern = node->op().connection_pattern(*node);
        bool reached = false;
        for (size_t i = 0; i < node->inputs().size(); ++i) {
            reached = reached ||
                      (pattern[i] && depends.count(node->input(i).get()) != 0);
        }
        if (reached) {
            for (size_t i = 0; i < node->num_outputs(); ++i) {
                auto out = node->output(i);
                if (carries_gradient(out->type()))
                    depends.insert(out.get());
            }
        }
        patterns.emplace(node.get(), std::move(pattern));
    }

    std::vector<ValuePtr> result(wrt.size());
    if (depends.count(output.get()) == 0)
        return result;

    // Backward pass
    std::unordered_map<const Value *, ValuePtr> grads;
    grads[output.get()] = seed;

    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        const Node &node = **it;
        const auto &pattern = patterns.at(&node);

        std::vector<ValuePtr> output_grads(node.num_outputs());
        bool has_grad = false;
        for (size_t i = 0; i < node.num_outputs(); ++i) {
            auto g = grads.find(node.output(i).get());
            if (g != grads.end()) {
                output_grads[i] = g->second;
                has_grad = true;
            }
        }
        if (!has_grad)
            continue;

        bool needed = false;
        for (size_t i = 0; i < node.inputs().size(); ++i) {
            needed = needed ||
                     (pattern[i] && depends.count(node.input(i).get()) != 0);
        }
        if (!needed)
            continue;

        if (!is_differentiable(node.kind())) {
            throw RuntimeError::not_implemented("gradient of " +
                                                node.op().name());
        }

        auto input_grads = node.op().grad(node, output_grads);
        if (input_grads.size() != node.inputs().size()) {
            throw RuntimeError::internal(
                node.op().name() + " returned " +
                std::to_string(input_grads.size()) + " gradients for " +
                std::to_string(node.inputs().size()) + " inputs");
        }

        for (size_t i = 0; i < node.inputs().size(); ++i) {
            const auto &in = node.input(i);
            if (!pattern[i] || !input_grads[i] || depends.count(in.get()) == 0)
                continue;
            auto &acc = grads[in.get()];
            acc = acc ? ops::add(acc, input_grads[i]) : input_grads[i];
        }
    }

    for (size_t i = 0; i < wrt.size(); ++i) {
        if (!wrt[i])
            continue;
        auto g = grads.find(wrt[i].get());
        if (g != grads.end())
            result[i] = g->second;
    }
    return result;
}

} // namespace graph
} // namespace dnnlift
