#include "dnnlift/dnn/descriptors.hpp"
#include "backends/reference/host_kernels.hpp"
#include "dnnlift/backends/versions.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "dnnlift/ops/tensor_ops.hpp"
#include "ops/op_checks.hpp"

#include <sstream>

namespace dnnlift {
namespace dnn {

namespace {

std::string tuple_repr(const std::vector<int64_t> &v) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << v[i];
    }
    oss << ")";
    return oss.str();
}

void check_positive(const std::string &param, const std::vector<int64_t> &v) {
    for (auto x : v) {
        if (x <= 0) {
            throw ConfigurationError::invalid_value(param, tuple_repr(v),
                                                    "positive integers");
        }
    }
}

} // namespace

// ============================================================================
// ConvDescriptor
// ============================================================================

ConvDescriptor::ConvDescriptor(Padding padding, std::vector<int64_t> strides,
                               ConvMode mode)
    : strides_(std::move(strides)), mode_(mode) {
    if (strides_.size() != 2 && strides_.size() != 3)
        throw ConfigurationError::spatial_rank("subsample", strides_.size());
    check_positive("subsample", strides_);
    padding_ = normalize_padding(padding, strides_.size());
}

std::shared_ptr<const ConvDescriptor>
ConvDescriptor::create(const backends::AvailabilityGate &gate, Padding padding,
                       std::vector<int64_t> strides, ConvMode mode) {
    auto op = std::make_shared<const ConvDescriptor>(std::move(padding),
                                                     std::move(strides), mode);
    if (op->spatial_rank() == 3)
        gate.require_version("3d convolution",
                             backends::kNdDescriptorVersion);
    else
        gate.version();
    return op;
}

std::string ConvDescriptor::name() const {
    return "DnnConvDesc{border_mode=" + padding_.repr() +
           ", subsample=" + tuple_repr(strides_) +
           ", conv_mode=" + conv_mode_name(mode_) + "}";
}

bool ConvDescriptor::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const ConvDescriptor &>(other);
    return padding_ == o.padding_ && strides_ == o.strides_ &&
           mode_ == o.mode_;
}

uint64_t ConvDescriptor::hash_params(uint64_t h) const {
    h = ops::hash_padding(h, padding_);
    h = graph::fnv_hash_dims(h, strides_);
    return graph::fnv_hash_u64(h, static_cast<uint64_t>(mode_));
}

std::vector<ValueType>
ConvDescriptor::make_outputs(const std::vector<ValuePtr> &inputs) const {
    ops::detail::require_arity(name(), inputs, 1);
    const auto &shape =
        ops::detail::require_shape_vector("kernel shape", inputs[0]);
    if (shape.shape_length() != spatial_rank() + 2) {
        throw ShapeError("kernel shape has " +
                         std::to_string(shape.shape_length()) +
                         " entries but the descriptor describes " +
                         std::to_string(spatial_rank()) +
                         " spatial dimensions");
    }
    return {ValueType::opaque(backends::kConvDescriptorType)};
}

std::vector<Datum> ConvDescriptor::perform(const Node &node,
                                           const std::vector<Datum> &inputs,
                                           ExecContext &ctx) const {
    const auto &kern = graph::datum_shape(inputs[0], "kernel shape");
    std::vector<int64_t> kern_sp(kern.begin() + 2, kern.end());

    backends::ConvDescriptorParams params;
    params.pads = resolve_pads(padding_, kern_sp);
    params.strides = strides_;
    params.mode = mode_;

    uint64_t h = graph::fnv_hash_dims(graph::FNV_OFFSET, params.pads);
    auto desc = ctx.descriptor(node, h, [&](backends::Backend &backend) {
        return backend.create_convolution_descriptor(params);
    });
    return {desc};
}

// ============================================================================
// PoolDescriptor
// ============================================================================

PoolDescriptor::PoolDescriptor(std::vector<int64_t> window,
                               std::vector<int64_t> strides,
                               std::vector<int64_t> pads, PoolMode mode)
    : window_(std::move(window)), strides_(std::move(strides)),
      pads_(std::move(pads)), mode_(mode) {
    if (strides_.size() != 2 && strides_.size() != 3)
        throw ConfigurationError::spatial_rank("stride", strides_.size());
    if (window_.size() != strides_.size())
        throw ConfigurationError::length_mismatch("ws", strides_.size(),
                                                  window_.size());
    if (pads_.size() != strides_.size())
        throw ConfigurationError::length_mismatch("pad", strides_.size(),
                                                  pads_.size());
    check_positive("ws", window_);
    check_positive("stride", strides_);
    for (auto p : pads_) {
        if (p < 0) {
            throw ConfigurationError::invalid_value("pad", tuple_repr(pads_),
                                                    "non-negative integers");
        }
    }
}

std::shared_ptr<const PoolDescriptor>
PoolDescriptor::create(const backends::AvailabilityGate &gate,
                       std::vector<int64_t> window,
                       std::vector<int64_t> strides, std::vector<int64_t> pads,
                       PoolMode mode) {
    auto op = std::make_shared<const PoolDescriptor>(
        std::move(window), std::move(strides), std::move(pads), mode);
    if (op->spatial_rank() == 3)
        gate.require_version("3d pooling", backends::kNdDescriptorVersion);
    else
        gate.version();
    return op;
}

PoolDescState migrate_pool_state(const PoolDescState &state) {
    PoolDescState out = state;
    switch (state.schema_version) {
    case 1:
        if (!out.pads)
            out.pads = std::vector<int64_t>(out.window.size(), 0);
        out.schema_version = kPoolStateSchemaVersion;
        return out;
    case kPoolStateSchemaVersion:
        if (!state.pads)
            throw ConfigurationError(
                "pooling descriptor state of schema 2 must carry pads");
        return out;
    default:
        throw ConfigurationError(
            "unknown pooling descriptor state schema version " +
            std::to_string(state.schema_version));
    }
}

std::shared_ptr<const PoolDescriptor>
PoolDescriptor::from_state(const backends::AvailabilityGate &gate,
                           const PoolDescState &state) {
    auto current = migrate_pool_state(state);
    return create(gate, current.window, current.strides, *current.pads,
                  current.mode);
}

PoolDescState PoolDescriptor::state() const {
    PoolDescState s;
    s.window = window_;
    s.strides = strides_;
    s.pads = pads_;
    s.mode = mode_;
    return s;
}

Shape PoolDescriptor::output_dims(const Shape &input) const {
    if (input.size() != spatial_rank() + 2)
        throw ShapeError::rank_mismatch("pooling input", spatial_rank() + 2,
                                        input.size());
    backends::host::PoolGeometry g;
    g.window = window_;
    g.strides = strides_;
    g.pads = pads_;
    g.mode = mode_;
    Shape out = {input[0], input[1]};
    for (auto d : backends::host::pool_spatial_output(
             Shape(input.begin() + 2, input.end()), g))
        out.push_back(d);
    return out;
}

std::string PoolDescriptor::name() const {
    return "DnnPoolDesc{ws=" + tuple_repr(window_) +
           ", stride=" + tuple_repr(strides_) + ", pad=" + tuple_repr(pads_) +
           ", mode=" + pool_mode_name(mode_) + "}";
}

bool PoolDescriptor::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const PoolDescriptor &>(other);
    return window_ == o.window_ && strides_ == o.strides_ &&
           pads_ == o.pads_ && mode_ == o.mode_;
}

uint64_t PoolDescriptor::hash_params(uint64_t h) const {
    h = graph::fnv_hash_dims(h, window_);
    h = graph::fnv_hash_dims(h, strides_);
    h = graph::fnv_hash_dims(h, pads_);
    return graph::fnv_hash_u64(h, static_cast<uint64_t>(mode_));
}

std::vector<ValueType>
PoolDescriptor::make_outputs(const std::vector<ValuePtr> &inputs) const {
    ops::detail::require_arity(name(), inputs, 0);
    return {ValueType::opaque(backends::kPoolDescriptorType)};
}

std::vector<Datum> PoolDescriptor::perform(const Node &node,
                                           const std::vector<Datum> &,
                                           ExecContext &ctx) const {
    backends::PoolDescriptorParams params;
    params.window = window_;
    params.strides = strides_;
    params.pads = pads_;
    params.mode = mode_;
    auto desc = ctx.descriptor(node, hash_params(graph::FNV_OFFSET),
                               [&](backends::Backend &backend) {
                                   return backend.create_pooling_descriptor(
                                       params);
                               });
    return {desc};
}

// ============================================================================
// Lookup and builders
// ============================================================================

const ConvDescriptor *conv_descriptor_of(const ValuePtr &desc) {
    if (!desc || desc->is_leaf())
        return nullptr;
    return graph::op_cast<ConvDescriptor>(desc->owner_raw()->op());
}

const PoolDescriptor *pool_descriptor_of(const ValuePtr &desc) {
    if (!desc || desc->is_leaf())
        return nullptr;
    return graph::op_cast<PoolDescriptor>(desc->owner_raw()->op());
}

ValuePtr conv_descriptor(const backends::AvailabilityGate &gate,
                         const Padding &padding,
                         const std::vector<int64_t> &strides, ConvMode mode,
                         const ValuePtr &kernel_shape) {
    return graph::apply(ConvDescriptor::create(gate, padding, strides, mode),
                        {kernel_shape});
}

ValuePtr pool_descriptor(const backends::AvailabilityGate &gate,
                         const std::vector<int64_t> &window,
                         const std::vector<int64_t> &strides,
                         const std::vector<int64_t> &pads, PoolMode mode) {
    return graph::apply(
        PoolDescriptor::create(gate, window, strides, pads, mode), {});
}

Shape conv_output_shape(const Shape &image, const Shape &kernel,
                        const Padding &padding,
                        const std::vector<int64_t> &strides) {
    if (image.size() != 4 && image.size() != 5)
        throw ShapeError::unsupported_rank("convolution", image.size());
    if (kernel.size() != image.size())
        throw ShapeError::rank_mismatch("kernel shape", image.size(),
                                        kernel.size());
    const size_t nd = image.size() - 2;
    if (strides.size() != nd)
        throw ConfigurationError::length_mismatch("subsample", nd,
                                                  strides.size());
    check_positive("subsample", strides);

    std::vector<int64_t> img_sp(image.begin() + 2, image.end());
    std::vector<int64_t> kern_sp(kernel.begin() + 2, kernel.end());
    auto pads = resolve_pads(normalize_padding(padding, nd), kern_sp);

    Shape out = {image[0], kernel[0]};
    for (auto d :
         backends::host::conv_spatial_output(img_sp, kern_sp, pads, strides))
        out.push_back(d);
    return out;
}

} // namespace dnn
} // namespace dnnlift
