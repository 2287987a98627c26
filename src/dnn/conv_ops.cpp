#include "dnnlift/dnn/conv_ops.hpp"
#include "dnnlift/backends/versions.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/dnn/descriptors.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "dnnlift/ops/tensor_ops.hpp"
#include "ops/op_checks.hpp"

namespace dnnlift {
namespace dnn {

using ops::detail::kind_name;
using ops::detail::require_arity;
using ops::detail::require_float_tensor;

OpKind conv_kind(ConvDirection direction) {
    switch (direction) {
    case ConvDirection::Forward:
        return OpKind::DnnConv;
    case ConvDirection::BackwardFilter:
        return OpKind::DnnConvGradW;
    case ConvDirection::BackwardData:
        return OpKind::DnnConvGradI;
    }
    throw RuntimeError::internal("unknown convolution direction");
}

ConvDirection conv_direction(OpKind kind) {
    switch (kind) {
    case OpKind::DnnConv:
        return ConvDirection::Forward;
    case OpKind::DnnConvGradW:
        return ConvDirection::BackwardFilter;
    case OpKind::DnnConvGradI:
        return ConvDirection::BackwardData;
    default:
        throw RuntimeError::internal(graph::op_kind_name(kind) +
                                     " is not a convolution kind");
    }
}

namespace {

// Fft and deterministic have no 3d kernels
ConvAlgo usable_for_rank(ConvAlgo algo, size_t rank) {
    if (rank == 5 && (algo == ConvAlgo::Fft || algo == ConvAlgo::Deterministic))
        return ConvAlgo::Plain;
    return algo;
}

ValuePtr gradient_conv(ConvDirection direction, const GradientAlgos &algos,
                       const ValuePtr &primary, const ValuePtr &secondary,
                       const ValuePtr &output, const ValuePtr &desc) {
    ConvAlgo algo = direction == ConvDirection::Forward ? algos.forward
                                                        : algos.backward;
    auto op = std::make_shared<const DnnConvOp>(
        direction, usable_for_rank(algo, primary->type().rank()), false,
        algos);
    return apply_conv(std::move(op), primary, secondary, output, desc);
}

// Configured default for `direction`, or none when the gate's version
// cannot run it
ConvAlgo gradient_default(const backends::AvailabilityGate &gate,
                          ConvDirection direction) {
    ConvAlgo algo = direction == ConvDirection::Forward
                        ? gate.config().default_forward_algorithm
                        : gate.config().default_backward_algorithm;
    int required = 0;
    if (algo == ConvAlgo::Fft)
        required = backends::kFftVersion;
    else if (is_automatic(algo))
        required = backends::kAutoAlgorithmVersion;
    if (gate.supports(required))
        return algo;
    trace::diagnostic("conv", "gradient kernels use none: " +
                                  conv_algo_name(algo) +
                                  " needs backend version " +
                                  std::to_string(required));
    return ConvAlgo::Plain;
}

ValuePtr scale_value(const ValuePtr &v, DType dtype, double fallback) {
    if (!v)
        return graph::constant_scalar(fallback, dtype);
    if (auto c = graph::constant_scalar_value(v))
        return graph::constant_scalar(*c, dtype);
    return v;
}

} // namespace

// ============================================================================
// State migration
// ============================================================================

ConvOpState migrate_conv_state(const ConvOpState &state) {
    ConvOpState out = state;
    switch (state.schema_version) {
    case 1:
        if (!out.algo)
            out.algo = out.workmem;
        out.workmem.reset();
        out.schema_version = kConvStateSchemaVersion;
        return out;
    case kConvStateSchemaVersion:
        if (state.workmem) {
            throw ConfigurationError(
                "convolution state of schema 2 must not carry workmem; use "
                "algo");
        }
        return out;
    default:
        throw ConfigurationError("unknown convolution state schema version " +
                                 std::to_string(state.schema_version));
    }
}

// ============================================================================
// DnnConvOp
// ============================================================================

DnnConvOp::DnnConvOp(ConvDirection direction, ConvAlgo algo, bool inplace,
                     GradientAlgos gradient_algos)
    : direction_(direction), algo_(algo), inplace_(inplace),
      gradient_algos_(gradient_algos) {
    if (!supports_direction(algo, direction)) {
        throw ConfigurationError::invalid_value(
            "algo", conv_algo_name(algo),
            "an algorithm supported by the " + direction_name(direction) +
                " convolution");
    }
    if (!supports_direction(gradient_algos.forward, ConvDirection::Forward) ||
        !supports_direction(gradient_algos.backward,
                            ConvDirection::BackwardData)) {
        throw ConfigurationError::invalid_value(
            "gradient algorithms",
            conv_algo_name(gradient_algos.forward) + "/" +
                conv_algo_name(gradient_algos.backward),
            "a forward and a backward algorithm");
    }
}

std::shared_ptr<const DnnConvOp>
DnnConvOp::create(const backends::AvailabilityGate &gate,
                  ConvDirection direction, std::optional<ConvAlgo> algo,
                  bool inplace) {
    gate.version();
    ConvAlgo chosen = algo ? *algo
                      : direction == ConvDirection::Forward
                          ? gate.config().default_forward_algorithm
                          : gate.config().default_backward_algorithm;
    GradientAlgos gradient_algos{gradient_default(gate, ConvDirection::Forward),
                                 gradient_default(gate,
                                                  ConvDirection::BackwardData)};
    auto op = std::make_shared<const DnnConvOp>(direction, chosen, inplace,
                                                gradient_algos);
    if (chosen == ConvAlgo::Fft)
        gate.require_version("fft convolution", backends::kFftVersion);
    if (is_automatic(chosen)) {
        gate.require_version("automatic algorithm selection",
                             backends::kAutoAlgorithmVersion);
    }
    return op;
}

std::shared_ptr<const DnnConvOp>
DnnConvOp::from_state(const backends::AvailabilityGate &gate,
                      ConvDirection direction, const ConvOpState &state) {
    auto current = migrate_conv_state(state);
    return create(gate, direction, current.algo, current.inplace);
}

std::shared_ptr<const DnnConvOp> DnnConvOp::with_inplace(bool inplace) const {
    return std::make_shared<const DnnConvOp>(direction_, algo_, inplace,
                                             gradient_algos_);
}

ConvOpState DnnConvOp::state() const {
    ConvOpState s;
    s.algo = algo_;
    s.inplace = inplace_;
    return s;
}

std::string DnnConvOp::name() const {
    std::string n = graph::op_kind_name(kind()) +
                    "{algo=" + conv_algo_name(algo_);
    if (inplace_)
        n += ", inplace";
    return n + "}";
}

bool DnnConvOp::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const DnnConvOp &>(other);
    return direction_ == o.direction_ && algo_ == o.algo_ &&
           inplace_ == o.inplace_ &&
           gradient_algos_.forward == o.gradient_algos_.forward &&
           gradient_algos_.backward == o.gradient_algos_.backward;
}

uint64_t DnnConvOp::hash_params(uint64_t h) const {
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(direction_));
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(algo_));
    h = graph::fnv_hash_bool(h, inplace_);
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(gradient_algos_.forward));
    return graph::fnv_hash_u64(h,
                               static_cast<uint64_t>(gradient_algos_.backward));
}

std::vector<ValueType>
DnnConvOp::make_outputs(const std::vector<ValuePtr> &inputs) const {
    const std::string op = graph::op_kind_name(kind());
    require_arity(op, inputs, 6);

    const auto &primary =
        require_float_tensor(op + " primary input", inputs[kConvPrimary]);
    const auto &secondary =
        require_float_tensor(op + " secondary input", inputs[kConvSecondary]);
    const auto &out =
        require_float_tensor(op + " output buffer", inputs[kConvOutput]);

    if (primary.rank() != 4 && primary.rank() != 5)
        throw ShapeError::unsupported_rank(op, primary.rank());
    if (secondary.rank() != primary.rank())
        throw ShapeError::rank_mismatch(op + " secondary input",
                                        primary.rank(), secondary.rank());
    if (out.rank() != primary.rank())
        throw ShapeError::rank_mismatch(op + " output buffer", primary.rank(),
                                        out.rank());
    if (secondary.dtype != primary.dtype)
        throw TypeError::dtype_mismatch(dtype_name(primary.dtype),
                                        dtype_name(secondary.dtype));
    if (out.dtype != primary.dtype)
        throw TypeError::dtype_mismatch(dtype_name(primary.dtype),
                                        dtype_name(out.dtype));

    const auto &desc = inputs[kConvDesc]->type();
    if (!desc.is_opaque() || desc.native_type != backends::kConvDescriptorType) {
        throw TypeError::kind_mismatch(op + " descriptor",
                                       std::string("a ") +
                                           backends::kConvDescriptorType,
                                       kind_name(desc));
    }
    if (const auto *builder = conv_descriptor_of(inputs[kConvDesc])) {
        if (builder->spatial_rank() + 2 != primary.rank()) {
            throw ShapeError::rank_mismatch(op + " descriptor",
                                            primary.rank(),
                                            builder->spatial_rank() + 2);
        }
    }

    for (size_t i : {kConvAlpha, kConvBeta}) {
        const auto &t = inputs[i]->type();
        if (!t.is_scalar()) {
            throw TypeError::kind_mismatch(
                op + (i == kConvAlpha ? " alpha" : " beta"), "a scalar",
                kind_name(t));
        }
        if (t.dtype != primary.dtype)
            throw TypeError::dtype_mismatch(dtype_name(primary.dtype),
                                            dtype_name(t.dtype));
    }

    if (primary.rank() == 5) {
        if (algo_ == ConvAlgo::Fft)
            throw ConfigurationError("fft is not supported for 3d " +
                                     direction_name(direction_) +
                                     " convolution");
        if (algo_ == ConvAlgo::Deterministic)
            throw ConfigurationError("deterministic is not supported for 3d " +
                                     direction_name(direction_) +
                                     " convolution");
    }

    return {out};
}

std::vector<ValuePtr>
DnnConvOp::grad(const Node &node,
                const std::vector<ValuePtr> &output_grads) const {
    const auto &primary = node.input(kConvPrimary);
    const auto &secondary = node.input(kConvSecondary);
    const auto &desc = node.input(kConvDesc);
    const auto &alpha = node.input(kConvAlpha);
    const auto &beta = node.input(kConvBeta);
    auto g = ops::contiguous(output_grads[0]);

    const auto &algos = gradient_algos_;
    ValuePtr d_primary;
    ValuePtr d_secondary;
    switch (direction_) {
    case ConvDirection::Forward:
        // (img, kern)
        d_primary = gradient_conv(ConvDirection::BackwardData, algos,
                                  secondary, g, ops::empty_like(primary),
                                  desc);
        d_secondary = gradient_conv(ConvDirection::BackwardFilter, algos,
                                    primary, g, ops::empty_like(secondary),
                                    desc);
        break;
    case ConvDirection::BackwardFilter:
        // (img, top)
        d_primary = gradient_conv(ConvDirection::BackwardData, algos, g,
                                  secondary, ops::empty_like(primary), desc);
        d_secondary = gradient_conv(ConvDirection::Forward, algos, primary, g,
                                    ops::empty_like(secondary), desc);
        break;
    case ConvDirection::BackwardData:
        // (kern, top)
        d_primary = gradient_conv(ConvDirection::BackwardFilter, algos, g,
                                  secondary, ops::empty_like(primary), desc);
        d_secondary = gradient_conv(ConvDirection::Forward, algos, g, primary,
                                    ops::empty_like(secondary), desc);
        break;
    }

    return {ops::mul(d_primary, alpha),
            ops::mul(d_secondary, alpha),
            ops::mul(g, beta),
            nullptr,
            ops::grad_undefined("gradient of " + name() + " wrt alpha", alpha),
            ops::grad_undefined("gradient of " + name() + " wrt beta", beta)};
}

std::vector<bool> DnnConvOp::connection_pattern(const Node &) const {
    return {true, true, true, false, true, true};
}

graph::DestroyMap DnnConvOp::destroy_map() const {
    if (!inplace_)
        return {};
    return {{0, {kConvOutput}}};
}

std::vector<Datum> DnnConvOp::perform(const Node &node,
                                      const std::vector<Datum> &inputs,
                                      ExecContext &ctx) const {
    const std::string op = graph::op_kind_name(kind());
    const auto &primary = graph::datum_tensor(inputs[kConvPrimary], op);
    const auto &secondary = graph::datum_tensor(inputs[kConvSecondary], op);
    const auto &buffer = graph::datum_tensor(inputs[kConvOutput], op);
    const auto &desc = graph::datum_descriptor(inputs[kConvDesc], op);
    double alpha = graph::datum_scalar(inputs[kConvAlpha], op + " alpha");
    double beta = graph::datum_scalar(inputs[kConvBeta], op + " beta");

    HostTensorPtr out =
        inplace_ ? buffer : std::make_shared<HostTensor>(*buffer);

    auto &backend = ctx.backend();
    ConvAlgo algo = algo_;
    if (is_automatic(algo_)) {
        algo = ctx.resolve_algorithm(
            node, algo_, {primary->shape, secondary->shape}, [&]() {
                return backend.choose_algorithm(direction_, algo_, *primary,
                                                *secondary, *desc, *out);
            });
    }

    switch (direction_) {
    case ConvDirection::Forward:
        backend.convolution_forward(algo, *primary, *secondary, *desc, alpha,
                                    beta, *out);
        break;
    case ConvDirection::BackwardFilter:
        backend.convolution_backward_filter(algo, *primary, *secondary, *desc,
                                            alpha, beta, *out);
        break;
    case ConvDirection::BackwardData:
        backend.convolution_backward_data(algo, *primary, *secondary, *desc,
                                          alpha, beta, *out);
        break;
    }
    return {out};
}

// ============================================================================
// Builders
// ============================================================================

ValuePtr apply_conv(std::shared_ptr<const DnnConvOp> op,
                    const ValuePtr &primary, const ValuePtr &secondary,
                    const ValuePtr &output, const ValuePtr &desc,
                    const ValuePtr &alpha, const ValuePtr &beta) {
    DType dtype = primary->type().dtype;
    return graph::apply(std::move(op),
                        {primary, secondary, output, desc,
                         scale_value(alpha, dtype, 1.0),
                         scale_value(beta, dtype, 0.0)});
}

ValuePtr dnn_conv(const backends::AvailabilityGate &gate, const ValuePtr &img,
                  const ValuePtr &kern, const ValuePtr &output,
                  const ValuePtr &desc, const ValuePtr &alpha,
                  const ValuePtr &beta, std::optional<ConvAlgo> algo) {
    return apply_conv(DnnConvOp::create(gate, ConvDirection::Forward, algo),
                      img, kern, output, desc, alpha, beta);
}

ValuePtr dnn_conv_grad_w(const backends::AvailabilityGate &gate,
                         const ValuePtr &img, const ValuePtr &top,
                         const ValuePtr &output, const ValuePtr &desc,
                         const ValuePtr &alpha, const ValuePtr &beta,
                         std::optional<ConvAlgo> algo) {
    return apply_conv(
        DnnConvOp::create(gate, ConvDirection::BackwardFilter, algo), img, top,
        output, desc, alpha, beta);
}

ValuePtr dnn_conv_grad_i(const backends::AvailabilityGate &gate,
                         const ValuePtr &kern, const ValuePtr &top,
                         const ValuePtr &output, const ValuePtr &desc,
                         const ValuePtr &alpha, const ValuePtr &beta,
                         std::optional<ConvAlgo> algo) {
    return apply_conv(
        DnnConvOp::create(gate, ConvDirection::BackwardData, algo), kern, top,
        output, desc, alpha, beta);
}

} // namespace dnn
} // namespace dnnlift
