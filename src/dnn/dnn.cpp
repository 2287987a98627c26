#include "dnnlift/dnn/dnn.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/ops/tensor_ops.hpp"
#include "ops/op_checks.hpp"

#include <algorithm>

namespace dnnlift {
namespace dnn {

using ops::ConvOutputShape;

namespace {

void require_gate(const backends::AvailabilityGate &gate) {
    if (!gate.is_available())
        throw UnavailableError(gate.reason());
}

// (1, 0, 2, ...) for a tensor of `rank` axes
std::vector<int64_t> swap_batch_channel(size_t rank) {
    std::vector<int64_t> pattern = {1, 0};
    for (size_t i = 2; i < rank; ++i)
        pattern.push_back(static_cast<int64_t>(i));
    return pattern;
}

std::vector<int64_t> spatial_axes(size_t rank) {
    std::vector<int64_t> axes;
    for (size_t i = 2; i < rank; ++i)
        axes.push_back(static_cast<int64_t>(i));
    return axes;
}

std::vector<int64_t> conv_strides(const std::vector<int64_t> &subsample,
                                  size_t nd) {
    if (subsample.empty())
        return std::vector<int64_t>(nd, 1);
    if (subsample.size() != nd) {
        throw ConfigurationError("subsample has " +
                                 std::to_string(subsample.size()) +
                                 " entries but the convolution has " +
                                 std::to_string(nd) + " spatial dimensions");
    }
    return subsample;
}

bool unit_strides(const std::vector<int64_t> &strides) {
    return std::all_of(strides.begin(), strides.end(),
                       [](int64_t s) { return s == 1; });
}

ValuePtr conv_as_weight_grad(const backends::AvailabilityGate &gate,
                             const ValuePtr &img, const ValuePtr &kern,
                             ConvMode mode) {
    const size_t rank = img->type().rank();
    auto img_t = ops::contiguous(ops::dimshuffle(img, swap_batch_channel(rank)));
    ValuePtr k = kern;
    // The weight-gradient kernel does not flip these, so flip by hand
    if (mode == ConvMode::Convolution)
        k = ops::flip(k, spatial_axes(rank));
    auto kern_t = ops::contiguous(ops::dimshuffle(k, swap_batch_channel(rank)));

    std::vector<int64_t> ones(rank - 2, 1);
    auto out_shape = ops::conv_output_shape(
        ConvOutputShape::Rule::WeightGradValid, Padding::valid(), ones,
        ops::shape_of(img_t), ops::shape_of(kern_t));
    auto out = ops::alloc_empty(img->type().dtype, out_shape);
    auto desc = conv_descriptor(gate, Padding::valid(), ones,
                                ConvMode::CrossCorrelation,
                                ops::shape_of(out));
    auto conv = dnn_conv_grad_w(gate, img_t, kern_t, out, desc);
    return ops::dimshuffle(conv, swap_batch_channel(rank));
}

ValuePtr conv_as_input_grad(const backends::AvailabilityGate &gate,
                            const ValuePtr &img, const ValuePtr &kern,
                            ConvMode mode) {
    const size_t rank = img->type().rank();
    auto img_c = ops::contiguous(img);
    auto kern_t =
        ops::contiguous(ops::dimshuffle(kern, swap_batch_channel(rank)));

    std::vector<int64_t> ones(rank - 2, 1);
    auto out_shape = ops::conv_output_shape(
        ConvOutputShape::Rule::InputGradFull, Padding::full(), ones,
        ops::shape_of(img_c), ops::shape_of(kern_t));
    auto out = ops::alloc_empty(img->type().dtype, out_shape);
    auto desc = conv_descriptor(gate, Padding::valid(), ones, complement(mode),
                                ops::shape_of(kern_t));
    return dnn_conv_grad_i(gate, kern_t, img_c, out, desc);
}

ValuePtr conv_forward(const backends::AvailabilityGate &gate,
                      const ValuePtr &img, const ValuePtr &kern,
                      const Padding &border,
                      const std::vector<int64_t> &strides, ConvMode mode,
                      std::optional<ConvAlgo> algo) {
    auto img_c = ops::contiguous(img);
    auto kern_c = ops::contiguous(kern);
    auto desc =
        conv_descriptor(gate, border, strides, mode, ops::shape_of(kern_c));
    auto out_shape = ops::conv_output_shape(
        ConvOutputShape::Rule::Forward, border, strides, ops::shape_of(img_c),
        ops::shape_of(kern_c));
    auto out = ops::alloc_empty(img->type().dtype, out_shape);
    return dnn_conv(gate, img_c, kern_c, out, desc, nullptr, nullptr, algo);
}

} // namespace

// ============================================================================
// Convolution
// ============================================================================

ValuePtr convolution(const backends::AvailabilityGate &gate,
                     const ValuePtr &img, const ValuePtr &kern,
                     const ConvolutionOptions &opts) {
    require_gate(gate);
    if (opts.algo && opts.workmem) {
        throw ConfigurationError(
            "algo and workmem cannot both be given; workmem is a deprecated "
            "alias of algo");
    }
    std::optional<ConvAlgo> algo = opts.algo ? opts.algo : opts.workmem;
    if (opts.workmem)
        trace::diagnostic("dnn", "workmem is deprecated, use algo instead");

    const auto &img_t = ops::detail::require_float_tensor("convolution image",
                                                          img);
    const auto &kern_t =
        ops::detail::require_float_tensor("convolution kernel", kern);
    if (img_t.rank() != 4 && img_t.rank() != 5)
        throw ShapeError::unsupported_rank("convolution", img_t.rank());
    if (kern_t.rank() != img_t.rank())
        throw ShapeError::rank_mismatch("convolution kernel", img_t.rank(),
                                        kern_t.rank());

    const size_t nd = img_t.rank() - 2;
    auto strides = conv_strides(opts.subsample, nd);
    auto border = normalize_padding(opts.border, nd);

    if (border.is_valid() && unit_strides(strides) &&
        opts.direction_hint == DirectionHint::BpropWeights) {
        trace::diagnostic("dnn", "convolution lowered to weight gradient");
        return conv_as_weight_grad(gate, img, kern, opts.mode);
    }
    if (border.is_full() && unit_strides(strides) &&
        opts.direction_hint != DirectionHint::ForceForward) {
        trace::diagnostic("dnn", "convolution lowered to input gradient");
        return conv_as_input_grad(gate, img, kern, opts.mode);
    }
    return conv_forward(gate, img, kern, border, strides, opts.mode, algo);
}

// ============================================================================
// Pooling and softmax
// ============================================================================

ValuePtr pooling(const backends::AvailabilityGate &gate, const ValuePtr &img,
                 const std::vector<int64_t> &window,
                 const std::vector<int64_t> &strides, PoolMode mode,
                 const std::vector<int64_t> &pads) {
    require_gate(gate);
    auto st = strides.empty() ? std::vector<int64_t>(window.size(), 1) : strides;
    auto pd = pads.empty() ? std::vector<int64_t>(window.size(), 0) : pads;
    auto desc = pool_descriptor(gate, window, st, pd, mode);
    return dnn_pool(ops::contiguous(img), desc);
}

ValuePtr softmax(const backends::AvailabilityGate &gate, const ValuePtr &x,
                 SoftmaxAlgo algo, SoftmaxMode mode) {
    require_gate(gate);
    return dnn_softmax(gate, ops::contiguous(x), algo, mode);
}

} // namespace dnn
} // namespace dnnlift
