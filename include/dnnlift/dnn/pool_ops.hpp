#pragma once

#include <string>
#include <vector>

#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/graph/graph_node.hpp"

namespace dnnlift {
namespace dnn {

using graph::Datum;
using graph::ExecContext;
using graph::Node;
using graph::OpKind;
using graph::ValuePtr;
using graph::ValueType;

// DnnPool(img, desc). The image rank must be the descriptor's spatial rank
// plus 2.
class DnnPool : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::DnnPool; }

    OpKind kind() const override { return OpKind::DnnPool; }
    std::string name() const override { return "DnnPool"; }
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<bool> connection_pattern(const Node &node) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;
};

// DnnPoolGrad(inp, out, out_grad, desc) -> gradient wrt inp. Average modes
// only look at the shape of `out`. Not differentiable.
class DnnPoolGrad : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::DnnPoolGrad; }

    OpKind kind() const override { return OpKind::DnnPoolGrad; }
    std::string name() const override { return "DnnPoolGrad"; }
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;
};

ValuePtr dnn_pool(const ValuePtr &img, const ValuePtr &desc);
ValuePtr dnn_pool_grad(const ValuePtr &inp, const ValuePtr &out,
                       const ValuePtr &out_grad, const ValuePtr &desc);

} // namespace dnn
} // namespace dnnlift
