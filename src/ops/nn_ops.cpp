#include "dnnlift/ops/nn_ops.hpp"
#include "backends/reference/host_kernels.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "op_checks.hpp"

#include <sstream>

namespace dnnlift {
namespace ops {

using detail::require_arity;
using detail::require_float_tensor;
using detail::require_rank;

namespace {

std::string tuple_repr(const std::vector<int64_t> &v) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0)
            oss << ",";
        oss << v[i];
    }
    oss << ")";
    return oss.str();
}

Shape spatial_of(const Shape &s) { return Shape(s.begin() + 2, s.end()); }

backends::host::PoolGeometry pool_geometry(const PoolParams &p) {
    backends::host::PoolGeometry g;
    g.window = p.window;
    g.strides = p.resolved_strides();
    g.pads = p.resolved_pads();
    g.mode = p.mode;
    g.ignore_border = p.ignore_border;
    return g;
}

} // namespace

// ============================================================================
// Conv
// ============================================================================

std::vector<int64_t> Conv::strides(size_t spatial_rank) const {
    if (params_.subsample.empty())
        return std::vector<int64_t>(spatial_rank, 1);
    if (params_.subsample.size() != spatial_rank) {
        throw ConfigurationError("subsample " + tuple_repr(params_.subsample) +
                                 " does not describe " +
                                 std::to_string(spatial_rank) +
                                 " spatial dimensions");
    }
    for (auto s : params_.subsample) {
        if (s <= 0) {
            throw ConfigurationError::invalid_value(
                "subsample", tuple_repr(params_.subsample), "positive strides");
        }
    }
    return params_.subsample;
}

std::string Conv::name() const {
    std::ostringstream oss;
    oss << "Conv{" << params_.border.repr()
        << ", subsample=" << tuple_repr(params_.subsample) << ", "
        << (params_.filter_flip ? "conv" : "cross")
        << ", hint=" << dnn::direction_hint_name(params_.hint) << "}";
    return oss.str();
}

bool Conv::params_equal(const graph::Operator &other) const {
    return static_cast<const Conv &>(other).params_ == params_;
}

uint64_t Conv::hash_params(uint64_t h) const {
    h = hash_padding(h, params_.border);
    h = graph::fnv_hash_dims(h, params_.subsample);
    h = graph::fnv_hash_bool(h, params_.filter_flip);
    return graph::fnv_hash_u64(h, static_cast<uint64_t>(params_.hint));
}

std::vector<ValueType>
Conv::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    const auto &img = require_float_tensor("Conv image", inputs[0]);
    const auto &kern = require_float_tensor("Conv kernel", inputs[1]);
    if (img.rank() != 4 && img.rank() != 5)
        throw ShapeError::unsupported_rank("convolution", img.rank());
    if (kern.rank() != img.rank())
        throw ShapeError::rank_mismatch("Conv kernel", img.rank(), kern.rank());
    if (img.dtype != kern.dtype)
        throw TypeError::dtype_mismatch(dtype_name(img.dtype),
                                        dtype_name(kern.dtype));

    const size_t nd = img.rank() - 2;
    auto st = strides(nd);
    auto border = dnn::normalize_padding(params_.border, nd);

    if (img.dims[1] != kUnknownDim && kern.dims[1] != kUnknownDim &&
        img.dims[1] != kern.dims[1]) {
        throw ShapeError("image has " + std::to_string(img.dims[1]) +
                         " channels but the kernel expects " +
                         std::to_string(kern.dims[1]));
    }

    Shape dims = {img.dims[0], kern.dims[0]};
    auto img_sp = spatial_of(img.dims);
    auto kern_sp = spatial_of(kern.dims);
    if (ShapeUtils::is_fully_known(img_sp) &&
        ShapeUtils::is_fully_known(kern_sp)) {
        auto pads = dnn::resolve_pads(border, kern_sp);
        for (auto d :
             backends::host::conv_spatial_output(img_sp, kern_sp, pads, st))
            dims.push_back(d);
    } else {
        dims.resize(img.rank(), kUnknownDim);
    }
    return {ValueType::tensor(img.dtype, dims)};
}

std::vector<Datum> Conv::perform(const Node &, const std::vector<Datum> &inputs,
                                 ExecContext &) const {
    const auto &img = graph::datum_tensor(inputs[0], "Conv image");
    const auto &kern = graph::datum_tensor(inputs[1], "Conv kernel");
    const size_t nd = img->ndim() - 2;
    auto kern_sp = spatial_of(kern->shape);

    backends::host::ConvGeometry g;
    g.strides = strides(nd);
    g.pads = dnn::resolve_pads(dnn::normalize_padding(params_.border, nd),
                               kern_sp);
    g.flip = params_.filter_flip;

    Shape out_shape = {img->shape[0], kern->shape[0]};
    for (auto d : backends::host::conv_spatial_output(spatial_of(img->shape),
                                                      kern_sp, g.pads,
                                                      g.strides))
        out_shape.push_back(d);

    auto out = HostTensor::zeros(img->dtype, out_shape);
    backends::host::conv_forward(*img, *kern, g, 1.0, 0.0, *out);
    return {out};
}

// ============================================================================
// Pool parameters
// ============================================================================

std::vector<int64_t> PoolParams::resolved_strides() const {
    return strides.empty() ? window : strides;
}

std::vector<int64_t> PoolParams::resolved_pads() const {
    return pads.empty() ? std::vector<int64_t>(window.size(), 0) : pads;
}

std::string PoolParams::repr() const {
    std::ostringstream oss;
    oss << "ws=" << tuple_repr(window)
        << ", stride=" << tuple_repr(resolved_strides())
        << ", pad=" << tuple_repr(resolved_pads())
        << ", mode=" << dnn::pool_mode_name(mode)
        << ", ignore_border=" << (ignore_border ? "true" : "false");
    return oss.str();
}

uint64_t hash_pool_params(uint64_t h, const PoolParams &p) {
    h = graph::fnv_hash_dims(h, p.window);
    h = graph::fnv_hash_dims(h, p.resolved_strides());
    h = graph::fnv_hash_dims(h, p.resolved_pads());
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(p.mode));
    return graph::fnv_hash_bool(h, p.ignore_border);
}

namespace {

ValueType pool_output_type(const std::string &what, const ValuePtr &x,
                           const PoolParams &p) {
    const auto &t = require_float_tensor(what, x);
    if (t.rank() != p.window.size() + 2)
        throw ShapeError::rank_mismatch(what, p.window.size() + 2, t.rank());
    Shape dims = {t.dims[0], t.dims[1]};
    auto sp = spatial_of(t.dims);
    if (ShapeUtils::is_fully_known(sp)) {
        for (auto d : backends::host::pool_spatial_output(sp, pool_geometry(p)))
            dims.push_back(d);
    } else {
        dims.resize(t.rank(), kUnknownDim);
    }
    return ValueType::tensor(t.dtype, dims);
}

} // namespace

// ============================================================================
// Pool
// ============================================================================

Pool::Pool(PoolParams params) : params_(std::move(params)) {
    if (params_.window.empty()) {
        throw ConfigurationError::invalid_value("ws", "()",
                                                "at least one window extent");
    }
    for (auto w : params_.window) {
        if (w <= 0) {
            throw ConfigurationError::invalid_value(
                "ws", tuple_repr(params_.window), "positive window extents");
        }
    }
    if (!params_.strides.empty() &&
        params_.strides.size() != params_.window.size()) {
        throw ConfigurationError::length_mismatch(
            "stride", params_.window.size(), params_.strides.size());
    }
    if (!params_.pads.empty() && params_.pads.size() != params_.window.size()) {
        throw ConfigurationError::length_mismatch("pad", params_.window.size(),
                                                  params_.pads.size());
    }
    for (auto p : params_.resolved_pads()) {
        if (p < 0) {
            throw ConfigurationError::invalid_value(
                "pad", tuple_repr(params_.pads), "non-negative pads");
        }
    }
}

std::string Pool::name() const { return "Pool{" + params_.repr() + "}"; }

bool Pool::params_equal(const graph::Operator &other) const {
    return static_cast<const Pool &>(other).params_ == params_;
}

uint64_t Pool::hash_params(uint64_t h) const {
    return hash_pool_params(h, params_);
}

std::vector<ValueType>
Pool::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    return {pool_output_type("Pool input", inputs[0], params_)};
}

std::vector<ValuePtr>
Pool::grad(const Node &node, const std::vector<ValuePtr> &output_grads) const {
    const auto &x = node.input(0);
    if (params_.mode == dnn::PoolMode::Max)
        return {max_pool_grad(x, node.output(0), output_grads[0], params_)};
    return {average_pool_grad(x, output_grads[0], params_)};
}

std::vector<Datum> Pool::perform(const Node &, const std::vector<Datum> &inputs,
                                 ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "Pool input");
    auto g = pool_geometry(params_);
    Shape out_shape = {x->shape[0], x->shape[1]};
    for (auto d : backends::host::pool_spatial_output(spatial_of(x->shape), g))
        out_shape.push_back(d);
    auto out = HostTensor::zeros(x->dtype, out_shape);
    backends::host::pool_forward(*x, g, *out);
    return {out};
}

// ============================================================================
// Pool gradients
// ============================================================================

std::string MaxPoolGrad::name() const {
    return "MaxPoolGrad{" + params_.repr() + "}";
}

bool MaxPoolGrad::params_equal(const graph::Operator &other) const {
    return static_cast<const MaxPoolGrad &>(other).params_ == params_;
}

uint64_t MaxPoolGrad::hash_params(uint64_t h) const {
    return hash_pool_params(h, params_);
}

std::vector<ValueType>
MaxPoolGrad::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 3);
    auto out_type = pool_output_type("MaxPoolGrad input", inputs[0], params_);
    require_rank("MaxPoolGrad pooled output", inputs[1], out_type.rank());
    require_rank("MaxPoolGrad output gradient", inputs[2], out_type.rank());
    return {inputs[0]->type()};
}

std::vector<Datum> MaxPoolGrad::perform(const Node &,
                                        const std::vector<Datum> &inputs,
                                        ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "MaxPoolGrad input");
    const auto &out = graph::datum_tensor(inputs[1], "MaxPoolGrad output");
    const auto &gz = graph::datum_tensor(inputs[2], "MaxPoolGrad gradient");
    auto dx = HostTensor::zeros(x->dtype, x->shape);
    backends::host::pool_backward(*x, *out, *gz, pool_geometry(params_), *dx);
    return {dx};
}

std::string AveragePoolGrad::name() const {
    return "AveragePoolGrad{" + params_.repr() + "}";
}

bool AveragePoolGrad::params_equal(const graph::Operator &other) const {
    return static_cast<const AveragePoolGrad &>(other).params_ == params_;
}

uint64_t AveragePoolGrad::hash_params(uint64_t h) const {
    return hash_pool_params(h, params_);
}

std::vector<ValueType>
AveragePoolGrad::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    auto out_type =
        pool_output_type("AveragePoolGrad input", inputs[0], params_);
    require_rank("AveragePoolGrad output gradient", inputs[1], out_type.rank());
    return {inputs[0]->type()};
}

std::vector<Datum> AveragePoolGrad::perform(const Node &,
                                            const std::vector<Datum> &inputs,
                                            ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "AveragePoolGrad input");
    const auto &gz = graph::datum_tensor(inputs[1], "AveragePoolGrad gradient");
    auto dx = HostTensor::zeros(x->dtype, x->shape);
    backends::host::pool_backward(*x, *gz, *gz, pool_geometry(params_), *dx);
    return {dx};
}

// ============================================================================
// Softmax
// ============================================================================

std::vector<ValueType>
Softmax::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    require_float_tensor("Softmax input", inputs[0]);
    return {require_rank("Softmax input", inputs[0], 2)};
}

std::vector<ValuePtr>
Softmax::grad(const Node &node,
              const std::vector<ValuePtr> &output_grads) const {
    return {softmax_grad(output_grads[0], node.output(0))};
}

std::vector<Datum> Softmax::perform(const Node &,
                                    const std::vector<Datum> &inputs,
                                    ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "Softmax input");
    auto y = std::make_shared<HostTensor>(x->dtype, x->shape);
    backends::host::softmax_forward(*x, dnn::SoftmaxAlgo::Accurate,
                                    dnn::SoftmaxMode::Channel, *y);
    return {y};
}

std::vector<ValueType>
SoftmaxGrad::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    require_rank("SoftmaxGrad output gradient", inputs[0], 2);
    require_float_tensor("SoftmaxGrad softmax output", inputs[1]);
    return {require_rank("SoftmaxGrad softmax output", inputs[1], 2)};
}

std::vector<Datum> SoftmaxGrad::perform(const Node &,
                                        const std::vector<Datum> &inputs,
                                        ExecContext &) const {
    const auto &dy = graph::datum_tensor(inputs[0], "SoftmaxGrad gradient");
    const auto &sm = graph::datum_tensor(inputs[1], "SoftmaxGrad softmax");
    auto dx = std::make_shared<HostTensor>(sm->dtype, sm->shape);
    backends::host::softmax_backward(*dy, *sm, dnn::SoftmaxAlgo::Accurate,
                                     dnn::SoftmaxMode::Channel, *dx);
    return {dx};
}

// ============================================================================
// Builders
// ============================================================================

ValuePtr conv(const ValuePtr &img, const ValuePtr &kern, ConvParams params) {
    return graph::apply(std::make_shared<const Conv>(std::move(params)),
                        {img, kern});
}

ValuePtr pool(const ValuePtr &x, PoolParams params) {
    return graph::apply(std::make_shared<const Pool>(std::move(params)), {x});
}

ValuePtr max_pool_grad(const ValuePtr &x, const ValuePtr &out,
                       const ValuePtr &g, PoolParams params) {
    return graph::apply(std::make_shared<const MaxPoolGrad>(std::move(params)),
                        {x, out, g});
}

ValuePtr average_pool_grad(const ValuePtr &x, const ValuePtr &g,
                           PoolParams params) {
    return graph::apply(
        std::make_shared<const AveragePoolGrad>(std::move(params)), {x, g});
}

ValuePtr softmax(const ValuePtr &x) {
    return graph::apply(std::make_shared<const Softmax>(), {x});
}

ValuePtr softmax_grad(const ValuePtr &dy, const ValuePtr &sm) {
    return graph::apply(std::make_shared<const SoftmaxGrad>(), {dy, sm});
}

} // namespace ops
} // namespace dnnlift
