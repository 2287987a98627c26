#include "dnnlift/graph/function_graph.hpp"
#include "dnnlift/error.hpp"

#include <unordered_set>

namespace dnnlift {
namespace graph {

// Topological sort (non-recursive to avoid stack overflow on deep graphs)
std::vector<NodePtr> topo_sort(const std::vector<ValuePtr> &outputs) {
    std::vector<NodePtr> result;
    std::unordered_set<const Node *> visited;
    std::vector<std::pair<NodePtr, size_t>> stack;

    for (const auto &out : outputs) {
        auto root = out->owner();
        if (!root || visited.count(root.get()))
            continue;
        stack.push_back({root, 0});

        while (!stack.empty()) {
            auto &[node, idx] = stack.back();

            if (visited.count(node.get())) {
                stack.pop_back();
                continue;
            }

            if (idx < node->inputs().size()) {
                auto child = node->inputs()[idx]->owner();
                idx++;
                if (child && !visited.count(child.get())) {
                    stack.push_back({child, 0});
                }
            } else {
                visited.insert(node.get());
                result.push_back(node);
                stack.pop_back();
            }
        }
    }

    return result;
}

FunctionGraph::FunctionGraph(std::vector<ValuePtr> inputs,
                             std::vector<ValuePtr> outputs)
    : inputs_(std::move(inputs)), outputs_(std::move(outputs)) {
    for (const auto &out : outputs_) {
        if (!out)
            throw RuntimeError::internal("FunctionGraph given a null output");
    }
    rebuild_index();
}

void FunctionGraph::rebuild_index() {
    nodes_ = topo_sort(outputs_);
    node_set_.clear();
    clients_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const Node *node = nodes_[i].get();
        node_set_[node] = i;
        for (size_t pos = 0; pos < node->inputs().size(); ++pos) {
            clients_[node->inputs()[pos].get()].push_back({node, pos});
        }
    }
    for (size_t i = 0; i < outputs_.size(); ++i) {
        clients_[outputs_[i].get()].push_back({nullptr, i});
    }
}

const std::vector<Client> &FunctionGraph::clients(const Value *value) const {
    static const std::vector<Client> none;
    auto it = clients_.find(value);
    return it == clients_.end() ? none : it->second;
}

void FunctionGraph::replace(const ValuePtr &old_value,
                            const ValuePtr &replacement) {
    replace_all({{old_value, replacement}});
}

void FunctionGraph::replace_all(
    const std::vector<std::pair<ValuePtr, ValuePtr>> &replacements) {
    std::unordered_map<const Value *, ValuePtr> mapping;
    for (const auto &[old_value, replacement] : replacements) {
        if (!old_value || !replacement)
            throw RuntimeError::internal("replace given a null value");
        if (!is_compatible(old_value->type(), replacement->type())) {
            throw TypeError("cannot replace " + old_value->repr() + " with " +
                            replacement->repr() + ": incompatible types");
        }
        if (old_value != replacement)
            mapping[old_value.get()] = replacement;
    }
    if (mapping.empty())
        return;

    // Rebuild downstream nodes in topological order. Nodes whose inputs are
    // unchanged are kept as-is.
    auto lookup = [&](const ValuePtr &v) -> ValuePtr {
        auto it = mapping.find(v.get());
        return it == mapping.end() ? v : it->second;
    };

    for (const auto &node : nodes_) {
        bool changed = false;
        std::vector<ValuePtr> new_inputs;
        new_inputs.reserve(node->inputs().size());
        for (const auto &in : node->inputs()) {
            auto mapped = lookup(in);
            changed = changed || mapped != in;
            new_inputs.push_back(std::move(mapped));
        }
        if (!changed)
            continue;
        auto rebuilt = Node::make(node->op_ptr(), std::move(new_inputs));
        for (size_t i = 0; i < node->num_outputs(); ++i) {
            auto old_out = node->output(i);
            if (mapping.count(old_out.get()) == 0)
                mapping[old_out.get()] = rebuilt->output(i);
        }
    }

    for (auto &out : outputs_)
        out = lookup(out);

    rebuild_index();
}

size_t FunctionGraph::count(OpKind kind) const {
    size_t n = 0;
    for (const auto &node : nodes_) {
        if (node->kind() == kind)
            n++;
    }
    return n;
}

} // namespace graph
} // namespace dnnlift
