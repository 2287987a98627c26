#include "dnnlift/opt/dnn_rules.hpp"
#include "dnnlift/backends/versions.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/dnn/dnn.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/ops/nn_ops.hpp"
#include "dnnlift/ops/tensor_ops.hpp"
#include "dnnlift/opt/constant_folding.hpp"

#include <algorithm>

namespace dnnlift {
namespace opt {

using dnn::DnnConvOp;
using graph::Node;
using graph::OpKind;

namespace {

using Replacement = std::optional<std::vector<ValuePtr>>;

const std::set<std::string> kLiftTags = {"fast_run", "cudnn"};

// Producer of `v` when it is a node of kind `kind`
const Node *producer(const ValuePtr &v, OpKind kind) {
    if (!v || v->is_leaf() || v->owner_raw()->kind() != kind)
        return nullptr;
    return v->owner_raw();
}

// ============================================================================
// Convolution lifting
// ============================================================================

bool unit_strides(const std::vector<int64_t> &strides) {
    return std::all_of(strides.begin(), strides.end(),
                       [](int64_t s) { return s == 1; });
}

Replacement lift_conv(const Node &node, const RewriteContext &ctx,
                      bool alternative) {
    if (!ctx.gate.is_available())
        return std::nullopt;
    const auto *conv = graph::op_cast<ops::Conv>(node.op());
    if (!conv)
        return std::nullopt;
    const auto &p = conv->params();
    if (!p.border.is_valid() && !p.border.is_full())
        return std::nullopt;

    const auto &img = node.input(0);
    const auto &kern = node.input(1);
    const size_t rank = img->type().rank();
    if (rank == 5 && !ctx.gate.supports(backends::kNdDescriptorVersion))
        return std::nullopt;

    dnn::ConvolutionOptions opts;
    opts.border = p.border;
    opts.subsample = conv->strides(rank - 2);
    opts.mode = p.filter_flip ? dnn::ConvMode::Convolution
                              : dnn::ConvMode::CrossCorrelation;
    opts.direction_hint = p.hint;

    if (alternative) {
        if (!unit_strides(opts.subsample))
            return std::nullopt;
        if (p.border.is_full())
            opts.direction_hint = dnn::DirectionHint::ForceForward;
        else if (p.hint == dnn::DirectionHint::BpropWeights)
            opts.direction_hint = dnn::DirectionHint::Forward;
        else
            opts.direction_hint = dnn::DirectionHint::BpropWeights;
    }

    try {
        return std::vector<ValuePtr>{
            dnn::convolution(ctx.gate, img, kern, opts)};
    } catch (const FeatureUnsupportedError &e) {
        // The configured default algorithm needs a newer backend
        trace::diagnostic("rewrite", std::string("conv lift declined: ") +
                                         e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Pooling lifting
// ============================================================================

bool poolable(const ops::PoolParams &p, const RewriteContext &ctx) {
    if (!ctx.gate.is_available() || !p.ignore_border)
        return false;
    const size_t nd = p.window.size();
    if (nd != 2 && nd != 3)
        return false;
    return nd == 2 || ctx.gate.supports(backends::kNdDescriptorVersion);
}

ValuePtr pool_desc(const ops::PoolParams &p, const RewriteContext &ctx) {
    return dnn::pool_descriptor(ctx.gate, p.window, p.resolved_strides(),
                                p.resolved_pads(), p.mode);
}

Replacement lift_pool(const Node &node, const RewriteContext &ctx) {
    const auto *pool = graph::op_cast<ops::Pool>(node.op());
    if (!pool || !poolable(pool->params(), ctx))
        return std::nullopt;
    const auto &p = pool->params();
    return std::vector<ValuePtr>{
        dnn::pooling(ctx.gate, node.input(0), p.window, p.resolved_strides(),
                     p.mode, p.resolved_pads())};
}

Replacement lift_max_pool_grad(const Node &node, const RewriteContext &ctx) {
    const auto *op = graph::op_cast<ops::MaxPoolGrad>(node.op());
    if (!op || !poolable(op->params(), ctx))
        return std::nullopt;
    return std::vector<ValuePtr>{dnn::dnn_pool_grad(
        ops::contiguous(node.input(0)), ops::contiguous(node.input(1)),
        ops::contiguous(node.input(2)), pool_desc(op->params(), ctx))};
}

// The average kernels only read the shape of the forward output, so the
// gradient stands in for it
Replacement lift_average_pool_grad(const Node &node,
                                   const RewriteContext &ctx) {
    const auto *op = graph::op_cast<ops::AveragePoolGrad>(node.op());
    if (!op || !poolable(op->params(), ctx) ||
        op->params().mode == dnn::PoolMode::Max)
        return std::nullopt;
    auto g = ops::contiguous(node.input(1));
    return std::vector<ValuePtr>{
        dnn::dnn_pool_grad(ops::contiguous(node.input(0)), g, g,
                           pool_desc(op->params(), ctx))};
}

// ============================================================================
// Softmax lifting
// ============================================================================

constexpr int64_t kX = ops::DimShuffle::kBroadcastAxis;

// (N, C) -> contiguous (N, C, 1, 1)
ValuePtr as_rank4(const ValuePtr &x) {
    return ops::contiguous(ops::dimshuffle(x, {0, 1, kX, kX}));
}

ValuePtr as_rank2(const ValuePtr &x) { return ops::dimshuffle(x, {0, 1}); }

Replacement lift_softmax(const Node &node, const RewriteContext &ctx) {
    if (!ctx.gate.is_available() || node.input(0)->type().rank() != 2)
        return std::nullopt;
    auto sm = dnn::dnn_softmax(ctx.gate, as_rank4(node.input(0)),
                               dnn::SoftmaxAlgo::Accurate,
                               dnn::SoftmaxMode::Channel);
    return std::vector<ValuePtr>{as_rank2(sm)};
}

Replacement lift_softmax_grad(const Node &node, const RewriteContext &ctx) {
    if (!ctx.gate.is_available() || node.input(0)->type().rank() != 2 ||
        node.input(1)->type().rank() != 2)
        return std::nullopt;
    auto dx = dnn::dnn_softmax_grad(
        ctx.gate, as_rank4(node.input(0)), as_rank4(node.input(1)),
        dnn::SoftmaxAlgo::Accurate, dnn::SoftmaxMode::Channel);
    return std::vector<ValuePtr>{as_rank2(dx)};
}

// log(DnnSoftmax(x)) and log(dimshuffle(DnnSoftmax(x))), the latter being
// what the softmax lift leaves behind
Replacement fuse_log_softmax(const Node &node, const RewriteContext &ctx) {
    if (!ctx.gate.supports(backends::kLogSoftmaxVersion))
        return std::nullopt;
    const auto &in = node.input(0);

    auto fusable = [&](const ValuePtr &v) -> const dnn::DnnSoftmax * {
        const Node *sm_node = producer(v, OpKind::DnnSoftmax);
        if (!sm_node || ctx.graph.num_clients(v) != 1)
            return nullptr;
        const auto *sm = graph::op_cast<dnn::DnnSoftmax>(sm_node->op());
        return sm->algo() == dnn::SoftmaxAlgo::Log ? nullptr : sm;
    };

    if (const auto *sm = fusable(in)) {
        return std::vector<ValuePtr>{
            dnn::dnn_softmax(ctx.gate, in->owner_raw()->input(0),
                             dnn::SoftmaxAlgo::Log, sm->mode())};
    }

    const Node *shuffle = producer(in, OpKind::DimShuffle);
    if (!shuffle || ctx.graph.num_clients(in) != 1)
        return std::nullopt;
    const auto &inner = shuffle->input(0);
    const auto *sm = fusable(inner);
    if (!sm)
        return std::nullopt;
    const auto &pattern =
        graph::op_cast<ops::DimShuffle>(shuffle->op())->pattern();
    auto log_sm = dnn::dnn_softmax(ctx.gate, inner->owner_raw()->input(0),
                                   dnn::SoftmaxAlgo::Log, sm->mode());
    return std::vector<ValuePtr>{ops::dimshuffle(log_sm, pattern)};
}

// ============================================================================
// Convolution fusions
// ============================================================================

std::shared_ptr<const DnnConvOp> conv_op_of(const Node &node) {
    return std::static_pointer_cast<const DnnConvOp>(node.op_ptr());
}

// Constant scalar, or constant tensor whose dims are all 1
std::optional<double> scale_constant(const ValuePtr &v) {
    const auto &t = v->type();
    if (t.is_tensor() && std::any_of(t.dims.begin(), t.dims.end(),
                                     [](int64_t d) { return d != 1; }))
        return std::nullopt;
    return graph::constant_scalar_value(v);
}

ValuePtr scaled(const ValuePtr &v, double s, DType dtype) {
    if (auto c = graph::constant_scalar_value(v))
        return graph::constant_scalar(s * *c, dtype);
    return ops::mul(v, graph::constant_scalar(s, dtype));
}

// mul(conv_out, s) -> conv with alpha * s and beta * s
Replacement merge_alpha(const Node &node, const RewriteContext &ctx,
                        OpKind kind) {
    if (!ctx.gate.is_available() || node.inputs().size() != 2)
        return std::nullopt;
    for (size_t side = 0; side < 2; ++side) {
        const auto &conv_out = node.input(side);
        const Node *target = producer(conv_out, kind);
        if (!target || ctx.graph.num_clients(conv_out) != 1)
            continue;
        auto s = scale_constant(node.input(1 - side));
        if (!s)
            continue;
        if (*s == 1.0)
            return std::vector<ValuePtr>{conv_out};

        DType dtype = target->input(dnn::kConvPrimary)->type().dtype;
        ValuePtr alpha, beta;
        if (*s == 0.0) {
            alpha = graph::constant_scalar(0.0, dtype);
            beta = graph::constant_scalar(0.0, dtype);
        } else {
            alpha = scaled(target->input(dnn::kConvAlpha), *s, dtype);
            beta = scaled(target->input(dnn::kConvBeta), *s, dtype);
        }
        return std::vector<ValuePtr>{dnn::apply_conv(
            conv_op_of(*target), target->input(dnn::kConvPrimary),
            target->input(dnn::kConvSecondary),
            target->input(dnn::kConvOutput), target->input(dnn::kConvDesc),
            alpha, beta)};
    }
    return std::nullopt;
}

// W must fill the output buffer exactly, without broadcasting
bool fills_buffer(const graph::ValueType &w, const graph::ValueType &buffer) {
    if (!w.is_tensor() || w.dtype != buffer.dtype || w.rank() != buffer.rank())
        return false;
    for (size_t i = 0; i < w.rank(); ++i) {
        if (w.dims[i] == 1 && buffer.dims[i] != 1)
            return false;
    }
    return graph::is_compatible(w, buffer);
}

// add(conv_out, W) with beta == 0 -> conv accumulating into contiguous(W)
Replacement merge_output(const Node &node, const RewriteContext &ctx,
                         OpKind kind) {
    if (!ctx.gate.is_available() || node.inputs().size() != 2)
        return std::nullopt;
    for (size_t side = 0; side < 2; ++side) {
        const auto &conv_out = node.input(side);
        const auto &w = node.input(1 - side);
        const Node *target = producer(conv_out, kind);
        if (!target || ctx.graph.num_clients(conv_out) != 1)
            continue;
        auto beta = graph::constant_scalar_value(target->input(dnn::kConvBeta));
        if (!beta || *beta != 0.0)
            continue;
        if (!fills_buffer(w->type(), target->input(dnn::kConvOutput)->type()))
            continue;

        DType dtype = target->input(dnn::kConvPrimary)->type().dtype;
        return std::vector<ValuePtr>{dnn::apply_conv(
            conv_op_of(*target), target->input(dnn::kConvPrimary),
            target->input(dnn::kConvSecondary), ops::contiguous(w),
            target->input(dnn::kConvDesc), target->input(dnn::kConvAlpha),
            graph::constant_scalar(1.0, dtype))};
    }
    return std::nullopt;
}

// Marks the conv as overwriting its output buffer. A shared AllocEmpty
// buffer is first replaced by a private one; any other shared buffer, and
// buffers that are graph inputs or constants, are left alone.
Replacement make_inplace(const Node &node, const RewriteContext &ctx) {
    const auto *op = graph::op_cast<DnnConvOp>(node.op());
    if (!op || op->inplace() || !ctx.gate.is_available())
        return std::nullopt;

    auto buffer = node.input(dnn::kConvOutput);
    if (buffer->is_leaf())
        return std::nullopt;
    if (ctx.graph.num_clients(buffer) > 1) {
        const Node *alloc = producer(buffer, OpKind::AllocEmpty);
        if (!alloc)
            return std::nullopt;
        buffer = graph::apply(alloc->op_ptr(), alloc->inputs());
    }

    auto inputs = node.inputs();
    inputs[dnn::kConvOutput] = buffer;
    return std::vector<ValuePtr>{
        graph::apply(op->with_inplace(true), std::move(inputs))};
}

// ============================================================================
// Hard fail
// ============================================================================

bool raise_if_unavailable(RewriteContext &ctx) {
    if (!ctx.gate.is_available()) {
        throw OptimizationAbortedError(
            "accelerated backend was requested explicitly but is "
            "unavailable: " +
            ctx.gate.reason());
    }
    return false;
}

struct ConvRuleNames {
    OpKind kind;
    const char *alpha_merge;
    const char *output_merge;
    const char *inplace;
};

constexpr ConvRuleNames kConvRules[] = {
    {OpKind::DnnConv, "local_dnn_conv_alpha_merge",
     "local_dnn_conv_output_merge", "local_dnn_conv_inplace"},
    {OpKind::DnnConvGradW, "local_dnn_convw_alpha_merge",
     "local_dnn_convw_output_merge", "local_dnn_convgw_inplace"},
    {OpKind::DnnConvGradI, "local_dnn_convi_alpha_merge",
     "local_dnn_convi_output_merge", "local_dnn_convgi_inplace"},
};

} // namespace

// ============================================================================
// Registry
// ============================================================================

RuleRegistry make_dnn_registry() {
    RuleRegistry registry;

    registry.register_global("gpu_seq", 0, {"cudnn"},
                             make_global_pass("NoDnnRaise",
                                              raise_if_unavailable));

    registry.register_local("canonicalize", 10, {"fast_run"},
                            constant_folding_rule());

    registry.register_local(
        "conv_lift", 20, {"conv_dnn", "fast_compile", "fast_run", "cudnn"},
        make_local_rule("local_conv_dnn", {OpKind::Conv},
                        [](const Node &node, const RewriteContext &ctx) {
                            return lift_conv(node, ctx, false);
                        }));
    registry.register_local(
        "conv_lift", 30, {"conv_dnn_alternative", "cudnn"},
        make_local_rule("local_conv_dnn_alternative", {OpKind::Conv},
                        [](const Node &node, const RewriteContext &ctx) {
                            return lift_conv(node, ctx, true);
                        }));

    registry.register_local(
        "dnn_lift", 40, kLiftTags,
        make_local_rule("local_pool_dnn", {OpKind::Pool}, lift_pool));
    registry.register_local("dnn_lift", 40, kLiftTags,
                            make_local_rule("local_pool_dnn_grad",
                                            {OpKind::MaxPoolGrad},
                                            lift_max_pool_grad));
    registry.register_local("dnn_lift", 40, kLiftTags,
                            make_local_rule("local_avg_pool_dnn_grad",
                                            {OpKind::AveragePoolGrad},
                                            lift_average_pool_grad));
    registry.register_local(
        "dnn_lift", 40, kLiftTags,
        make_local_rule("local_softmax_dnn", {OpKind::Softmax}, lift_softmax));
    registry.register_local("dnn_lift", 40, kLiftTags,
                            make_local_rule("local_softmax_dnn_grad",
                                            {OpKind::SoftmaxGrad},
                                            lift_softmax_grad));
    registry.register_local("dnn_lift", 40, kLiftTags,
                            make_local_rule("local_log_softmax_dnn",
                                            {OpKind::Log}, fuse_log_softmax));

    for (const auto &names : kConvRules) {
        OpKind kind = names.kind;
        registry.register_local(
            "dnn_fusion", 50, kLiftTags,
            make_local_rule(names.alpha_merge, {OpKind::Mul},
                            [kind](const Node &node, const RewriteContext &ctx) {
                                return merge_alpha(node, ctx, kind);
                            }));
        registry.register_local(
            "dnn_fusion", 50, kLiftTags,
            make_local_rule(names.output_merge, {OpKind::Add},
                            [kind](const Node &node, const RewriteContext &ctx) {
                                return merge_output(node, ctx, kind);
                            }));
    }
    for (const auto &names : kConvRules) {
        registry.register_local("inplace", 70, {"fast_run", "inplace", "cudnn"},
                                make_local_rule(names.inplace, {names.kind},
                                                make_inplace));
    }
    return registry;
}

RuleQuery default_query(const DnnConfig &config) {
    RuleQuery query;
    query.include.insert("fast_run");
    if (config.enabled == EnableMode::True)
        query.include.insert("cudnn");
    if (config.enabled == EnableMode::False)
        query.exclude.insert("cudnn");
    return query;
}

RewriteStats optimize(graph::FunctionGraph &graph,
                      const backends::AvailabilityGate &gate) {
    static const RuleRegistry registry = make_dnn_registry();
    EquilibriumRewriter rewriter;
    return rewriter.optimize(graph, gate, registry,
                             default_query(gate.config()));
}

} // namespace opt
} // namespace dnnlift
