#include "dnnlift/graph/graph_node.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/fnv.hpp"

#include <sstream>

namespace dnnlift {
namespace graph {

// ============================================================================
// Operator defaults
// ============================================================================

std::vector<ValuePtr> Operator::grad(const Node &,
                                     const std::vector<ValuePtr> &) const {
    throw RuntimeError::not_implemented("gradient of " + name());
}

std::vector<bool> Operator::connection_pattern(const Node &node) const {
    return std::vector<bool>(node.inputs().size(), true);
}

uint64_t Operator::hash() const {
    uint64_t h = fnv_hash_u64(FNV_OFFSET, static_cast<uint64_t>(kind()));
    return hash_params(h);
}

// ============================================================================
// Node
// ============================================================================

Node::Node(OperatorPtr op, std::vector<ValuePtr> inputs,
           const std::vector<ValueType> &output_types)
    : op_(std::move(op)), inputs_(std::move(inputs)), id_(next_id()) {
    outputs_.reserve(output_types.size());
    for (size_t i = 0; i < output_types.size(); ++i) {
        outputs_.emplace_back(output_types[i], this, i);
    }
}

NodePtr Node::make(OperatorPtr op, std::vector<ValuePtr> inputs) {
    if (!op)
        throw RuntimeError::internal("Node::make called without an operator");
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (!inputs[i]) {
            throw TypeError(op->name() + " input " + std::to_string(i) +
                            " is null");
        }
    }
    auto types = op->make_outputs(inputs);
    return NodePtr(new Node(std::move(op), std::move(inputs), types));
}

ValuePtr Node::output(size_t i) const {
    // Aliasing constructor: the value shares ownership of its node
    return ValuePtr(shared_from_this(), &outputs_.at(i));
}

std::vector<ValuePtr> Node::outputs() const {
    std::vector<ValuePtr> result;
    result.reserve(outputs_.size());
    for (size_t i = 0; i < outputs_.size(); ++i)
        result.push_back(output(i));
    return result;
}

std::string Node::repr() const {
    std::ostringstream oss;
    oss << op_->name() << "(";
    for (size_t i = 0; i < inputs_.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << inputs_[i]->repr();
    }
    oss << ")";
    return oss.str();
}

ValuePtr apply(OperatorPtr op, std::vector<ValuePtr> inputs) {
    return Node::make(std::move(op), std::move(inputs))->output(0);
}

// ============================================================================
// OpKind names
// ============================================================================

std::string op_kind_name(OpKind op) {
    switch (op) {
    case OpKind::Contiguous:
        return "Contiguous";
    case OpKind::AllocEmpty:
        return "AllocEmpty";
    case OpKind::ShapeOf:
        return "ShapeOf";
    case OpKind::ConvOutputShape:
        return "ConvOutputShape";
    case OpKind::DimShuffle:
        return "DimShuffle";
    case OpKind::Flip:
        return "Flip";
    case OpKind::Add:
        return "Add";
    case OpKind::Sub:
        return "Sub";
    case OpKind::Mul:
        return "Mul";
    case OpKind::Div:
        return "Div";
    case OpKind::Log:
        return "Log";
    case OpKind::Exp:
        return "Exp";
    case OpKind::Conv:
        return "Conv";
    case OpKind::Pool:
        return "Pool";
    case OpKind::MaxPoolGrad:
        return "MaxPoolGrad";
    case OpKind::AveragePoolGrad:
        return "AveragePoolGrad";
    case OpKind::Softmax:
        return "Softmax";
    case OpKind::SoftmaxGrad:
        return "SoftmaxGrad";
    case OpKind::GradUndefined:
        return "GradUndefined";
    case OpKind::DnnConvDesc:
        return "DnnConvDesc";
    case OpKind::DnnConv:
        return "DnnConv";
    case OpKind::DnnConvGradW:
        return "DnnConvGradW";
    case OpKind::DnnConvGradI:
        return "DnnConvGradI";
    case OpKind::DnnPoolDesc:
        return "DnnPoolDesc";
    case OpKind::DnnPool:
        return "DnnPool";
    case OpKind::DnnPoolGrad:
        return "DnnPoolGrad";
    case OpKind::DnnSoftmax:
        return "DnnSoftmax";
    case OpKind::DnnSoftmaxGrad:
        return "DnnSoftmaxGrad";
    case OpKind::_Count:
        break;
    }
    return "Unknown";
}

} // namespace graph
} // namespace dnnlift
