#include "dnnlift/dnn/softmax_ops.hpp"
#include "dnnlift/backends/versions.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "ops/op_checks.hpp"

namespace dnnlift {
namespace dnn {

using ops::detail::require_arity;
using ops::detail::require_float_tensor;
using ops::detail::require_rank;

namespace {

void check_softmax_gate(const backends::AvailabilityGate &gate,
                        SoftmaxAlgo algo) {
    if (algo == SoftmaxAlgo::Log)
        gate.require_version("log softmax", backends::kLogSoftmaxVersion);
    else
        gate.version();
}

std::string softmax_name(const std::string &op, SoftmaxAlgo algo,
                         SoftmaxMode mode) {
    return op + "{algo=" + softmax_algo_name(algo) +
           ", mode=" + softmax_mode_name(mode) + "}";
}

uint64_t hash_softmax(uint64_t h, SoftmaxAlgo algo, SoftmaxMode mode) {
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(algo));
    return graph::fnv_hash_u64(h, static_cast<uint64_t>(mode));
}

} // namespace

// ============================================================================
// DnnSoftmax
// ============================================================================

std::shared_ptr<const DnnSoftmax>
DnnSoftmax::create(const backends::AvailabilityGate &gate, SoftmaxAlgo algo,
                   SoftmaxMode mode) {
    check_softmax_gate(gate, algo);
    return std::make_shared<const DnnSoftmax>(algo, mode);
}

std::string DnnSoftmax::name() const {
    return softmax_name("DnnSoftmax", algo_, mode_);
}

bool DnnSoftmax::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const DnnSoftmax &>(other);
    return algo_ == o.algo_ && mode_ == o.mode_;
}

uint64_t DnnSoftmax::hash_params(uint64_t h) const {
    return hash_softmax(h, algo_, mode_);
}

std::vector<ValueType>
DnnSoftmax::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    require_float_tensor("DnnSoftmax input", inputs[0]);
    return {require_rank("DnnSoftmax input", inputs[0], 4)};
}

std::vector<ValuePtr>
DnnSoftmax::grad(const Node &node,
                 const std::vector<ValuePtr> &output_grads) const {
    return {graph::apply(std::make_shared<const DnnSoftmaxGrad>(algo_, mode_),
                         {output_grads[0], node.output(0)})};
}

std::vector<Datum> DnnSoftmax::perform(const Node &,
                                       const std::vector<Datum> &inputs,
                                       ExecContext &ctx) const {
    const auto &x = graph::datum_tensor(inputs[0], "DnnSoftmax input");
    auto y = std::make_shared<HostTensor>(x->dtype, x->shape);
    ctx.backend().softmax_forward(algo_, mode_, *x, *y);
    return {y};
}

// ============================================================================
// DnnSoftmaxGrad
// ============================================================================

std::shared_ptr<const DnnSoftmaxGrad>
DnnSoftmaxGrad::create(const backends::AvailabilityGate &gate,
                       SoftmaxAlgo algo, SoftmaxMode mode) {
    check_softmax_gate(gate, algo);
    return std::make_shared<const DnnSoftmaxGrad>(algo, mode);
}

std::string DnnSoftmaxGrad::name() const {
    return softmax_name("DnnSoftmaxGrad", algo_, mode_);
}

bool DnnSoftmaxGrad::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const DnnSoftmaxGrad &>(other);
    return algo_ == o.algo_ && mode_ == o.mode_;
}

uint64_t DnnSoftmaxGrad::hash_params(uint64_t h) const {
    return hash_softmax(h, algo_, mode_);
}

std::vector<ValueType>
DnnSoftmaxGrad::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    require_float_tensor("DnnSoftmaxGrad output gradient", inputs[0]);
    require_rank("DnnSoftmaxGrad output gradient", inputs[0], 4);
    require_float_tensor("DnnSoftmaxGrad softmax output", inputs[1]);
    return {require_rank("DnnSoftmaxGrad softmax output", inputs[1], 4)};
}

std::vector<Datum> DnnSoftmaxGrad::perform(const Node &,
                                           const std::vector<Datum> &inputs,
                                           ExecContext &ctx) const {
    const auto &dy = graph::datum_tensor(inputs[0], "DnnSoftmaxGrad gradient");
    const auto &sm = graph::datum_tensor(inputs[1], "DnnSoftmaxGrad softmax");
    if (dy->shape != sm->shape)
        throw ShapeError::mismatch(sm->shape, dy->shape);
    auto dx = std::make_shared<HostTensor>(sm->dtype, sm->shape);
    ctx.backend().softmax_backward(algo_, mode_, *dy, *sm, *dx);
    return {dx};
}

// ============================================================================
// Builders
// ============================================================================

ValuePtr dnn_softmax(const backends::AvailabilityGate &gate, const ValuePtr &x,
                     SoftmaxAlgo algo, SoftmaxMode mode) {
    return graph::apply(DnnSoftmax::create(gate, algo, mode), {x});
}

ValuePtr dnn_softmax_grad(const backends::AvailabilityGate &gate,
                          const ValuePtr &dy, const ValuePtr &sm,
                          SoftmaxAlgo algo, SoftmaxMode mode) {
    return graph::apply(DnnSoftmaxGrad::create(gate, algo, mode), {dy, sm});
}

} // namespace dnn
} // namespace dnnlift
