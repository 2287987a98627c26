#include "dnnlift_test_utils.hpp"

using namespace dnnlift;
using namespace dnnlift::testing;
using dnn::ConvAlgo;
using dnn::ConvMode;
using dnn::DirectionHint;
using dnn::Padding;
using graph::OpKind;
using graph::ValuePtr;

namespace {

struct GradCase {
    Shape img;
    Shape kern;
    Padding border;
    std::vector<int64_t> subsample;
    ConvMode mode;
    DirectionHint hint;
    OpKind expected_kind;
};

// Checks d<conv(img, kern), seed> against central differences for both
// operands
void check_gradients(const backends::GatePtr &gate, const GradCase &c) {
    auto img = input4(c.img, "img");
    auto kern = input4(c.kern, "kern");
    dnn::ConvolutionOptions opts;
    opts.border = c.border;
    opts.subsample = c.subsample;
    opts.mode = c.mode;
    opts.direction_hint = c.hint;
    auto out = dnn::convolution(*gate, img, kern, opts);
    {
        graph::FunctionGraph fg({img, kern}, {out});
        ASSERT_EQ(fg.count(c.expected_kind), 1u);
    }

    auto seed = input4(out->type().dims, "seed");
    auto grads = graph::grad(out, seed, {img, kern});
    ASSERT_EQ(grads.size(), 2u);
    ASSERT_NE(grads[0], nullptr);
    ASSERT_NE(grads[1], nullptr);
    EXPECT_EQ(grads[0]->type().dims, c.img);
    EXPECT_EQ(grads[1]->type().dims, c.kern);

    auto x = HostTensor::uniform(DType::Float32, c.img, 11);
    auto k = HostTensor::uniform(DType::Float32, c.kern, 12);
    auto s = HostTensor::uniform(DType::Float32, out->type().dims, 13);

    auto symbolic = evaluate({img, kern, seed}, grads, {x, k, s},
                             gate->backend());

    auto backend = gate->backend();
    auto f = [&](const std::vector<HostTensorPtr> &data) {
        return evaluate({img, kern}, {out}, data, backend)[0];
    };
    auto num_img = numeric_gradient(f, {x, k}, 0, *s, 1e-3);
    auto num_kern = numeric_gradient(f, {x, k}, 1, *s, 1e-3);
    ExpectTensorNear(*symbolic[0], *num_img, 1e-6);
    ExpectTensorNear(*symbolic[1], *num_kern, 1e-6);
}

} // namespace

class ConvGradients : public ReferenceGateTest {};

// ============================================================================
// Each lowering differentiates through its companion kernels
// ============================================================================

TEST_F(ConvGradients, Forward) {
    check_gradients(gate, {{2, 2, 5, 5}, {3, 2, 3, 3}, Padding::valid(), {},
                           ConvMode::Convolution, DirectionHint::Forward,
                           OpKind::DnnConv});
}

TEST_F(ConvGradients, ForwardStridedCrossCorrelation) {
    check_gradients(gate, {{1, 2, 7, 7}, {2, 2, 3, 3}, Padding::uniform(1),
                           {2, 2}, ConvMode::CrossCorrelation,
                           DirectionHint::Forward, OpKind::DnnConv});
}

TEST_F(ConvGradients, WeightGradientLowering) {
    check_gradients(gate, {{2, 2, 5, 5}, {3, 2, 3, 3}, Padding::valid(), {},
                           ConvMode::Convolution, DirectionHint::BpropWeights,
                           OpKind::DnnConvGradW});
    check_gradients(gate, {{2, 2, 5, 5}, {3, 2, 3, 3}, Padding::valid(), {},
                           ConvMode::CrossCorrelation,
                           DirectionHint::BpropWeights, OpKind::DnnConvGradW});
}

TEST_F(ConvGradients, InputGradientLowering) {
    check_gradients(gate, {{1, 2, 4, 4}, {3, 2, 3, 3}, Padding::full(), {},
                           ConvMode::Convolution, DirectionHint::Forward,
                           OpKind::DnnConvGradI});
    check_gradients(gate, {{1, 2, 4, 4}, {3, 2, 3, 3}, Padding::full(), {},
                           ConvMode::CrossCorrelation, DirectionHint::Forward,
                           OpKind::DnnConvGradI});
}

TEST_F(ConvGradients, ThreeDimensional) {
    check_gradients(gate, {{1, 1, 4, 4, 4}, {2, 1, 2, 2, 2}, Padding::valid(),
                           {}, ConvMode::Convolution, DirectionHint::Forward,
                           OpKind::DnnConv});
    check_gradients(gate, {{1, 1, 3, 3, 3}, {2, 1, 2, 2, 2}, Padding::full(),
                           {}, ConvMode::CrossCorrelation,
                           DirectionHint::Forward, OpKind::DnnConvGradI});
    check_gradients(gate, {{1, 1, 4, 4, 4}, {2, 1, 2, 2, 2}, Padding::valid(),
                           {}, ConvMode::Convolution,
                           DirectionHint::BpropWeights, OpKind::DnnConvGradW});
}

// ============================================================================
// Scaling and the output buffer
// ============================================================================

TEST_F(ConvGradients, AlphaScalesOperandsAndBetaScalesBuffer) {
    auto img = input4({1, 2, 5, 5}, "img");
    auto kern = input4({3, 2, 3, 3}, "kern");
    auto w = input4({1, 3, 3, 3}, "w");
    auto desc = dnn::conv_descriptor(*gate, Padding::valid(), {1, 1},
                                     ConvMode::Convolution,
                                     ops::shape_of(kern));
    auto out = dnn::dnn_conv(*gate, img, kern, w, desc,
                             graph::constant_scalar(2.0),
                             graph::constant_scalar(0.5));
    auto plain = dnn::dnn_conv(*gate, img, kern, ops::empty_like(w), desc);

    auto seed = input4({1, 3, 3, 3}, "seed");
    auto scaled = graph::grad(out, seed, {img, kern, w});
    auto unscaled = graph::grad(plain, seed, {img, kern});
    ASSERT_NE(scaled[2], nullptr);

    auto x = HostTensor::uniform(DType::Float32, {1, 2, 5, 5}, 1);
    auto k = HostTensor::uniform(DType::Float32, {3, 2, 3, 3}, 2);
    auto wv = HostTensor::uniform(DType::Float32, {1, 3, 3, 3}, 3);
    auto s = HostTensor::uniform(DType::Float32, {1, 3, 3, 3}, 4);

    auto backend = gate->backend();
    auto a = evaluate({img, kern, w, seed}, scaled, {x, k, wv, s}, backend);
    auto b = evaluate({img, kern, seed}, unscaled, {x, k, s}, backend);

    for (size_t i = 0; i < 2; ++i) {
        ASSERT_EQ(a[i]->shape, b[i]->shape);
        for (size_t j = 0; j < a[i]->size(); ++j)
            EXPECT_NEAR(a[i]->data[j], 2.0 * b[i]->data[j], 1e-9);
    }
    for (size_t j = 0; j < s->size(); ++j)
        EXPECT_NEAR(a[2]->data[j], 0.5 * s->data[j], 1e-12);
}

TEST_F(ConvGradients, GradientKernelsIgnoreTheForwardAlgorithm) {
    auto img = input4({1, 2, 5, 5});
    auto kern = input4({3, 2, 3, 3});
    dnn::ConvolutionOptions opts;
    opts.algo = ConvAlgo::Gemm;
    auto out = dnn::convolution(*gate, img, kern, opts);
    auto seed = input4(out->type().dims);
    auto grads = graph::grad(out, seed, {img, kern});

    graph::FunctionGraph fg({img, kern, seed}, grads);
    for (const auto &node : fg.nodes()) {
        const auto *op = graph::op_cast<dnn::DnnConvOp>(node->op());
        if (!op || op->direction() == dnn::ConvDirection::Forward)
            continue;
        EXPECT_EQ(op->algo(), gate->config().default_backward_algorithm)
            << op->name();
    }
    EXPECT_EQ(fg.count(OpKind::DnnConvGradI), 1u);
    EXPECT_EQ(fg.count(OpKind::DnnConvGradW), 1u);
}

TEST_F(ConvGradients, GradientKernelsUseConfiguredBackwardAlgorithm) {
    DnnConfig config;
    config.default_backward_algorithm = ConvAlgo::Deterministic;
    auto tuned = reference_gate(5000, config);

    auto img = input4({1, 2, 5, 5});
    auto kern = input4({3, 2, 3, 3});
    auto out = dnn::convolution(*tuned, img, kern);
    auto seed = input4(out->type().dims);
    auto grads = graph::grad(out, seed, {img, kern});

    graph::FunctionGraph fg({img, kern, seed}, grads);
    size_t backward = 0;
    for (const auto &node : fg.nodes()) {
        const auto *op = graph::op_cast<dnn::DnnConvOp>(node->op());
        if (!op || op->direction() == dnn::ConvDirection::Forward)
            continue;
        EXPECT_EQ(op->algo(), ConvAlgo::Deterministic) << op->name();
        backward++;
    }
    EXPECT_EQ(backward, 2u);
}

TEST_F(ConvGradients, WeightGradientBuildsForwardKernelWithForwardDefault) {
    DnnConfig config;
    config.default_forward_algorithm = ConvAlgo::Gemm;
    auto tuned = reference_gate(5000, config);

    auto img = input4({1, 2, 5, 5});
    auto kern = input4({3, 2, 3, 3});
    dnn::ConvolutionOptions opts;
    opts.direction_hint = DirectionHint::BpropWeights;
    auto out = dnn::convolution(*tuned, img, kern, opts);
    graph::FunctionGraph lowered({img, kern}, {out});
    ASSERT_EQ(lowered.count(OpKind::DnnConvGradW), 1u);
    auto seed = input4(out->type().dims);
    auto grads = graph::grad(out, seed, {kern});

    graph::FunctionGraph fg({img, kern, seed}, grads);
    ASSERT_EQ(fg.count(OpKind::DnnConv), 1u);
    for (const auto &node : fg.nodes()) {
        if (node->kind() == OpKind::DnnConv) {
            EXPECT_EQ(graph::op_cast<dnn::DnnConvOp>(node->op())->algo(),
                      ConvAlgo::Gemm);
        }
    }
}

TEST_F(ConvGradients, DescriptorIsNotDifferentiated) {
    auto img = input4({1, 2, 5, 5});
    auto kern = input4({3, 2, 3, 3});
    auto out = dnn::convolution(*gate, img, kern);
    auto seed = input4(out->type().dims);
    auto unrelated = input4({1});
    auto grads = graph::grad(out, seed, {unrelated});
    ASSERT_EQ(grads.size(), 1u);
    EXPECT_EQ(grads[0], nullptr);
}

TEST(GenericConvGradient, IsNotDifferentiable) {
    auto img = input4({1, 2, 5, 5});
    auto kern = input4({3, 2, 3, 3});
    auto out = ops::conv(img, kern, ops::ConvParams{});
    auto seed = input4(out->type().dims);
    EXPECT_THROW(graph::grad(out, seed, {img}), RuntimeError);
}
