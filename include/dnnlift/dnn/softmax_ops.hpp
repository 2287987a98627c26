#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dnnlift/backends/availability_gate.hpp"
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

// Softmax over the channel axis (Channel) or over all of C, H, W at once
// (Instance) of a rank 4 tensor
class DnnSoftmax : public graph::Operator {
  public:
    DnnSoftmax(SoftmaxAlgo algo, SoftmaxMode mode) : algo_(algo), mode_(mode) {}

    // The log algorithm needs the log-softmax feature level
    static std::shared_ptr<const DnnSoftmax>
    create(const backends::AvailabilityGate &gate, SoftmaxAlgo algo,
           SoftmaxMode mode);

    static bool matches(OpKind k) { return k == OpKind::DnnSoftmax; }

    SoftmaxAlgo algo() const { return algo_; }
    SoftmaxMode mode() const { return mode_; }

    OpKind kind() const override { return OpKind::DnnSoftmax; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    SoftmaxAlgo algo_;
    SoftmaxMode mode_;
};

// (dy, sm) -> dx with the configuration of the forward node
class DnnSoftmaxGrad : public graph::Operator {
  public:
    DnnSoftmaxGrad(SoftmaxAlgo algo, SoftmaxMode mode)
        : algo_(algo), mode_(mode) {}

    static std::shared_ptr<const DnnSoftmaxGrad>
    create(const backends::AvailabilityGate &gate, SoftmaxAlgo algo,
           SoftmaxMode mode);

    static bool matches(OpKind k) { return k == OpKind::DnnSoftmaxGrad; }

    SoftmaxAlgo algo() const { return algo_; }
    SoftmaxMode mode() const { return mode_; }

    OpKind kind() const override { return OpKind::DnnSoftmaxGrad; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    SoftmaxAlgo algo_;
    SoftmaxMode mode_;
};

ValuePtr dnn_softmax(const backends::AvailabilityGate &gate, const ValuePtr &x,
                     SoftmaxAlgo algo, SoftmaxMode mode);
ValuePtr dnn_softmax_grad(const backends::AvailabilityGate &gate,
                          const ValuePtr &dy, const ValuePtr &sm,
                          SoftmaxAlgo algo, SoftmaxMode mode);

} // namespace dnn
} // namespace dnnlift
