#pragma once

#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "graph_node.hpp"
#include "value.hpp"

namespace dnnlift {
namespace graph {

// A consumer of a value: (node, input position). A null node stands for
// "is a graph output".
struct Client {
    const Node *node;
    size_t position;
};

// Rooted view over a DAG of immutable nodes: the outputs, their
// topological order and the client lists used by the rewrite rules.
// replace() rebuilds every node downstream of the replaced value.
class FunctionGraph {
  public:
    FunctionGraph(std::vector<ValuePtr> inputs, std::vector<ValuePtr> outputs);

    const std::vector<ValuePtr> &inputs() const { return inputs_; }
    const std::vector<ValuePtr> &outputs() const { return outputs_; }

    // Nodes in topological order, producers before consumers
    const std::vector<NodePtr> &nodes() const { return nodes_; }

    bool contains(const Node *node) const {
        return node_set_.count(node) != 0;
    }

    const std::vector<Client> &clients(const Value *value) const;
    size_t num_clients(const Value *value) const {
        return clients(value).size();
    }
    size_t num_clients(const ValuePtr &value) const {
        return num_clients(value.get());
    }

    // Replaces every use of `old_value` with `replacement`. Throws TypeError
    // when the two types are not compatible.
    void replace(const ValuePtr &old_value, const ValuePtr &replacement);
    void replace_all(
        const std::vector<std::pair<ValuePtr, ValuePtr>> &replacements);

    size_t count(OpKind kind) const;

  private:
    void rebuild_index();

    std::vector<ValuePtr> inputs_;
    std::vector<ValuePtr> outputs_;
    std::vector<NodePtr> nodes_;
    std::unordered_map<const Node *, size_t> node_set_;
    std::unordered_map<const Value *, std::vector<Client>> clients_;
};

// Producers-before-consumers order of every node reachable from `outputs`
std::vector<NodePtr> topo_sort(const std::vector<ValuePtr> &outputs);

} // namespace graph
} // namespace dnnlift
