#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "operator.hpp"
#include "value.hpp"

namespace dnnlift {
namespace graph {

// Application of one operator to ordered inputs. Nodes are immutable; a
// rewrite builds new nodes instead of editing existing ones. Holding any
// output value keeps the node and, transitively, its inputs alive.
class Node : public std::enable_shared_from_this<Node> {
  public:
    // Validates through the operator before anything is allocated, so a
    // failed construction leaves no node behind.
    static NodePtr make(OperatorPtr op, std::vector<ValuePtr> inputs);

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    const Operator &op() const { return *op_; }
    const OperatorPtr &op_ptr() const { return op_; }
    OpKind kind() const { return op_->kind(); }

    const std::vector<ValuePtr> &inputs() const { return inputs_; }
    const ValuePtr &input(size_t i) const { return inputs_.at(i); }

    size_t num_outputs() const { return outputs_.size(); }
    ValuePtr output(size_t i = 0) const;
    std::vector<ValuePtr> outputs() const;

    uint64_t id() const { return id_; }

    std::string repr() const;

  private:
    Node(OperatorPtr op, std::vector<ValuePtr> inputs,
         const std::vector<ValueType> &output_types);

    OperatorPtr op_;
    std::vector<ValuePtr> inputs_;
    std::vector<Value> outputs_;
    uint64_t id_;

    static uint64_t next_id() {
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1);
    }
};

// Builds a node and returns its first output
ValuePtr apply(OperatorPtr op, std::vector<ValuePtr> inputs);

} // namespace graph
} // namespace dnnlift
