#include "dnnlift/dnn/pool_ops.hpp"
#include "dnnlift/backends/backend.hpp"
#include "dnnlift/dnn/descriptors.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/ops/tensor_ops.hpp"
#include "ops/op_checks.hpp"

namespace dnnlift {
namespace dnn {

using ops::detail::kind_name;
using ops::detail::require_arity;
using ops::detail::require_float_tensor;
using ops::detail::require_rank;

namespace {

void require_pool_descriptor(const std::string &op, const ValuePtr &desc) {
    const auto &t = desc->type();
    if (!t.is_opaque() || t.native_type != backends::kPoolDescriptorType) {
        throw TypeError::kind_mismatch(op + " descriptor",
                                       std::string("a ") +
                                           backends::kPoolDescriptorType,
                                       kind_name(t));
    }
}

// Rank check against the descriptor when its builder is visible, else the
// generic 4-or-5 rule
void check_pool_rank(const std::string &op, const ValueType &img,
                     const ValuePtr &desc) {
    if (const auto *builder = pool_descriptor_of(desc)) {
        if (img.rank() != builder->spatial_rank() + 2)
            throw ShapeError::rank_mismatch(op + " input",
                                            builder->spatial_rank() + 2,
                                            img.rank());
    } else if (img.rank() != 4 && img.rank() != 5) {
        throw ShapeError::unsupported_rank(op, img.rank());
    }
}

} // namespace

// ============================================================================
// DnnPool
// ============================================================================

std::vector<ValueType>
DnnPool::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    const auto &img = require_float_tensor("DnnPool input", inputs[0]);
    require_pool_descriptor(name(), inputs[1]);
    check_pool_rank(name(), img, inputs[1]);

    const auto *builder = pool_descriptor_of(inputs[1]);
    Shape spatial(img.dims.begin() + 2, img.dims.end());
    Shape dims;
    if (builder && ShapeUtils::is_fully_known(spatial)) {
        dims = builder->output_dims(img.dims);
        dims[0] = img.dims[0];
        dims[1] = img.dims[1];
    } else {
        dims = {img.dims[0], img.dims[1]};
        dims.resize(img.rank(), kUnknownDim);
    }
    return {ValueType::tensor(img.dtype, dims)};
}

std::vector<ValuePtr>
DnnPool::grad(const Node &node,
              const std::vector<ValuePtr> &output_grads) const {
    const auto &img = node.input(0);
    const auto &desc = node.input(1);
    return {dnn_pool_grad(img, node.output(0),
                          ops::contiguous(output_grads[0]), desc),
            nullptr};
}

std::vector<bool> DnnPool::connection_pattern(const Node &) const {
    return {true, false};
}

std::vector<Datum> DnnPool::perform(const Node &,
                                    const std::vector<Datum> &inputs,
                                    ExecContext &ctx) const {
    const auto &img = graph::datum_tensor(inputs[0], "DnnPool input");
    const auto &desc = graph::datum_descriptor(inputs[1], "DnnPool descriptor");
    auto &backend = ctx.backend();
    auto out = HostTensor::zeros(img->dtype,
                                 backend.pooling_output_shape(*desc, img->shape));
    backend.pooling_forward(*desc, *img, *out);
    return {out};
}

// ============================================================================
// DnnPoolGrad
// ============================================================================

std::vector<ValueType>
DnnPoolGrad::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 4);
    const auto &inp = require_float_tensor("DnnPoolGrad input", inputs[0]);
    require_float_tensor("DnnPoolGrad pooled output", inputs[1]);
    require_float_tensor("DnnPoolGrad output gradient", inputs[2]);
    require_pool_descriptor(name(), inputs[3]);
    check_pool_rank(name(), inp, inputs[3]);
    require_rank("DnnPoolGrad pooled output", inputs[1], inp.rank());
    require_rank("DnnPoolGrad output gradient", inputs[2], inp.rank());
    return {inp};
}

std::vector<Datum> DnnPoolGrad::perform(const Node &,
                                        const std::vector<Datum> &inputs,
                                        ExecContext &ctx) const {
    const auto &inp = graph::datum_tensor(inputs[0], "DnnPoolGrad input");
    const auto &out = graph::datum_tensor(inputs[1], "DnnPoolGrad output");
    const auto &out_grad =
        graph::datum_tensor(inputs[2], "DnnPoolGrad output gradient");
    const auto &desc =
        graph::datum_descriptor(inputs[3], "DnnPoolGrad descriptor");
    if (out->shape != out_grad->shape)
        throw ShapeError::mismatch(out->shape, out_grad->shape);

    auto inp_grad = HostTensor::zeros(inp->dtype, inp->shape);
    ctx.backend().pooling_backward(*desc, *inp, *out, *out_grad, *inp_grad);
    return {inp_grad};
}

// ============================================================================
// Builders
// ============================================================================

ValuePtr dnn_pool(const ValuePtr &img, const ValuePtr &desc) {
    return graph::apply(std::make_shared<const DnnPool>(), {img, desc});
}

ValuePtr dnn_pool_grad(const ValuePtr &inp, const ValuePtr &out,
                       const ValuePtr &out_grad, const ValuePtr &desc) {
    return graph::apply(std::make_shared<const DnnPoolGrad>(),
                        {inp, out, out_grad, desc});
}

} // namespace dnn
} // namespace dnnlift
