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

struct LoweringCase {
    Shape img;
    Shape kern;
    Padding border;
    std::vector<int64_t> subsample;
    bool filter_flip;
    DirectionHint hint;
    OpKind expected_kind;
    Shape expected_shape;
};

// Builds conv(img, kern), lifts it and checks the lifted graph computes
// what the generic node computes
void check_lowering(const backends::GatePtr &gate, const LoweringCase &c) {
    auto img = input4(c.img, "img");
    auto kern = input4(c.kern, "kern");
    ops::ConvParams params;
    params.border = c.border;
    params.subsample = c.subsample;
    params.filter_flip = c.filter_flip;
    params.hint = c.hint;
    auto out = ops::conv(img, kern, params);
    EXPECT_EQ(out->type().dims, c.expected_shape);

    auto x = HostTensor::uniform(DType::Float32, c.img, 101);
    auto k = HostTensor::uniform(DType::Float32, c.kern, 202);
    auto expected = evaluate({img, kern}, {out}, {x, k})[0];

    graph::FunctionGraph fg({img, kern}, {out});
    auto stats = opt::optimize(fg, *gate);
    EXPECT_EQ(stats.count("local_conv_dnn"), 1u);
    EXPECT_EQ(fg.count(OpKind::Conv), 0u);
    EXPECT_EQ(fg.count(c.expected_kind), 1u);

    auto got = evaluate(fg, {x, k}, gate->backend())[0];
    EXPECT_EQ(got->shape, c.expected_shape);
    ExpectTensorNear(*got, *expected, 1e-9);
}

} // namespace

class ConvLowering : public ReferenceGateTest {};

// ============================================================================
// End-to-end lifting
// ============================================================================

TEST_F(ConvLowering, ValidForward) {
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::valid(), {},
                          true, DirectionHint::Forward, OpKind::DnnConv,
                          {2, 4, 6, 6}});
}

TEST_F(ConvLowering, FullUsesInputGradient) {
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::full(), {},
                          true, DirectionHint::Forward, OpKind::DnnConvGradI,
                          {2, 4, 10, 10}});
}

TEST_F(ConvLowering, FullCrossCorrelationUsesInputGradient) {
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::full(), {},
                          false, DirectionHint::Forward, OpKind::DnnConvGradI,
                          {2, 4, 10, 10}});
}

TEST_F(ConvLowering, ForceForwardKeepsFullOnForwardKernel) {
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::full(), {},
                          true, DirectionHint::ForceForward, OpKind::DnnConv,
                          {2, 4, 10, 10}});
}

TEST_F(ConvLowering, BpropWeightsHintUsesWeightGradient) {
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::valid(), {},
                          true, DirectionHint::BpropWeights,
                          OpKind::DnnConvGradW, {2, 4, 6, 6}});
    check_lowering(gate, {{2, 3, 8, 8}, {4, 3, 3, 3}, Padding::valid(), {},
                          false, DirectionHint::BpropWeights,
                          OpKind::DnnConvGradW, {2, 4, 6, 6}});
}

TEST_F(ConvLowering, StridedValidStaysForward) {
    check_lowering(gate, {{1, 2, 9, 9}, {3, 2, 3, 3}, Padding::valid(), {2, 2},
                          true, DirectionHint::BpropWeights, OpKind::DnnConv,
                          {1, 3, 4, 4}});
}

TEST_F(ConvLowering, StridedFullStaysForward) {
    check_lowering(gate, {{1, 2, 7, 7}, {3, 2, 3, 3}, Padding::full(), {2, 2},
                          true, DirectionHint::Forward, OpKind::DnnConv,
                          {1, 3, 5, 5}});
}

TEST_F(ConvLowering, ThreeDimensionalLowerings) {
    check_lowering(gate, {{1, 2, 5, 5, 5}, {3, 2, 3, 3, 3}, Padding::valid(),
                          {}, true, DirectionHint::Forward, OpKind::DnnConv,
                          {1, 3, 3, 3, 3}});
    check_lowering(gate, {{1, 2, 5, 5, 5}, {3, 2, 3, 3, 3}, Padding::full(),
                          {}, true, DirectionHint::Forward,
                          OpKind::DnnConvGradI, {1, 3, 7, 7, 7}});
    check_lowering(gate, {{1, 2, 5, 5, 5}, {3, 2, 3, 3, 3}, Padding::valid(),
                          {}, false, DirectionHint::BpropWeights,
                          OpKind::DnnConvGradW, {1, 3, 3, 3, 3}});
}

TEST_F(ConvLowering, SecondRunOnLiftedGraphChangesNothing) {
    for (auto hint : {DirectionHint::Forward, DirectionHint::BpropWeights}) {
        auto img = input4({2, 3, 8, 8}, "img");
        auto kern = input4({4, 3, 3, 3}, "kern");
        ops::ConvParams params;
        params.filter_flip = hint == DirectionHint::Forward;
        params.hint = hint;
        auto out = ops::conv(img, kern, params);
        graph::FunctionGraph fg({img, kern}, {out});

        auto first = opt::optimize(fg, *gate);
        EXPECT_EQ(first.count("local_conv_dnn"), 1u);
        auto lifted_outputs = fg.outputs();
        auto lifted_nodes = fg.nodes().size();

        auto second = opt::optimize(fg, *gate);
        EXPECT_EQ(second.replacements, 0u);
        EXPECT_EQ(fg.outputs(), lifted_outputs);
        EXPECT_EQ(fg.nodes().size(), lifted_nodes);
    }
}

// ============================================================================
// Rule preconditions
// ============================================================================

TEST_F(ConvLowering, UnavailableGateLeavesGraphAlone) {
    auto down = unavailable_gate();
    auto img = input4({2, 3, 8, 8});
    auto kern = input4({4, 3, 3, 3});
    auto out = ops::conv(img, kern, ops::ConvParams{});
    graph::FunctionGraph fg({img, kern}, {out});

    auto stats = opt::optimize(fg, *down);
    EXPECT_EQ(stats.count("local_conv_dnn"), 0u);
    EXPECT_EQ(fg.count(OpKind::Conv), 1u);
    EXPECT_EQ(fg.outputs()[0], out);
}

TEST_F(ConvLowering, ExplicitPadsAreNotLifted) {
    auto img = input4({1, 2, 6, 6});
    auto kern = input4({3, 2, 3, 3});
    ops::ConvParams params;
    params.border = Padding::uniform(1);
    auto out = ops::conv(img, kern, params);
    graph::FunctionGraph fg({img, kern}, {out});

    opt::optimize(fg, *gate);
    EXPECT_EQ(fg.count(OpKind::Conv), 1u);
    EXPECT_EQ(fg.count(OpKind::DnnConv), 0u);
}

TEST_F(ConvLowering, ThreeDimensionalNeedsNdLevel) {
    auto img = input4({1, 2, 5, 5, 5});
    auto kern = input4({3, 2, 3, 3, 3});
    auto out = ops::conv(img, kern, ops::ConvParams{});
    graph::FunctionGraph fg({img, kern}, {out});

    opt::optimize(fg, *old_gate);
    EXPECT_EQ(fg.count(OpKind::Conv), 1u);
}

TEST_F(ConvLowering, DeclinesWhenDefaultAlgorithmNeedsNewerBackend) {
    DnnConfig config;
    config.default_forward_algorithm = ConvAlgo::Fft;
    auto v2 = reference_gate(2000, config);

    auto img = input4({1, 2, 6, 6});
    auto kern = input4({3, 2, 3, 3});
    auto out = ops::conv(img, kern, ops::ConvParams{});
    graph::FunctionGraph fg({img, kern}, {out});

    EXPECT_NO_THROW(opt::optimize(fg, *v2));
    EXPECT_EQ(fg.count(OpKind::Conv), 1u);
}

TEST_F(ConvLowering, AlternativeRuleFlipsTheHint) {
    auto registry = opt::make_dnn_registry();
    opt::EquilibriumRewriter rewriter;
    opt::RuleQuery alternative{{"conv_dnn_alternative"}, {}};

    // valid + forward hint -> weight gradient
    {
        auto img = input4({2, 3, 8, 8});
        auto kern = input4({4, 3, 3, 3});
        auto out = ops::conv(img, kern, ops::ConvParams{});
        graph::FunctionGraph fg({img, kern}, {out});
        auto stats = rewriter.optimize(fg, *gate, registry, alternative);
        EXPECT_EQ(stats.count("local_conv_dnn_alternative"), 1u);
        EXPECT_EQ(fg.count(OpKind::DnnConvGradW), 1u);

        auto x = HostTensor::uniform(DType::Float32, {2, 3, 8, 8}, 1);
        auto k = HostTensor::uniform(DType::Float32, {4, 3, 3, 3}, 2);
        auto expected = evaluate({img, kern}, {out}, {x, k})[0];
        ExpectTensorNear(*evaluate(fg, {x, k}, gate->backend())[0], *expected,
                         1e-9);
    }
    // full -> forced forward
    {
        auto img = input4({2, 3, 8, 8});
        auto kern = input4({4, 3, 3, 3});
        ops::ConvParams params;
        params.border = Padding::full();
        auto out = ops::conv(img, kern, params);
        graph::FunctionGraph fg({img, kern}, {out});
        rewriter.optimize(fg, *gate, registry, alternative);
        EXPECT_EQ(fg.count(OpKind::DnnConv), 1u);
        EXPECT_EQ(fg.count(OpKind::DnnConvGradI), 0u);
    }
    // strided convolutions are left to the main rule
    {
        auto img = input4({1, 2, 9, 9});
        auto kern = input4({3, 2, 3, 3});
        ops::ConvParams params;
        params.subsample = {2, 2};
        auto out = ops::conv(img, kern, params);
        graph::FunctionGraph fg({img, kern}, {out});
        auto stats = rewriter.optimize(fg, *gate, registry, alternative);
        EXPECT_EQ(stats.count("local_conv_dnn_alternative"), 0u);
        EXPECT_EQ(fg.count(OpKind::Conv), 1u);
    }
}

// ============================================================================
// Entry point
// ============================================================================

TEST_F(ConvLowering, EntryPointRequiresGate) {
    auto img = input4({2, 3, 8, 8});
    auto kern = input4({4, 3, 3, 3});
    EXPECT_THROW(dnn::convolution(*unavailable_gate(), img, kern),
                 UnavailableError);
}

TEST_F(ConvLowering, EntryPointValidatesOperands) {
    auto img = input4({2, 3, 8, 8});
    auto kern = input4({4, 3, 3, 3});
    auto kern5 = input4({4, 3, 3, 3, 3});
    EXPECT_THROW(dnn::convolution(*gate, img, kern5), ShapeError);

    dnn::ConvolutionOptions bad_stride;
    bad_stride.subsample = {1, 1, 1};
    EXPECT_THROW(dnn::convolution(*gate, img, kern, bad_stride),
                 ConfigurationError);

    dnn::ConvolutionOptions bad_pad;
    bad_pad.border = Padding::explicit_pads({1, 1, 1});
    EXPECT_THROW(dnn::convolution(*gate, img, kern, bad_pad),
                 ConfigurationError);
}

TEST_F(ConvLowering, WorkmemIsAnAliasOfAlgo) {
    auto img = input4({2, 3, 8, 8});
    auto kern = input4({4, 3, 3, 3});

    dnn::ConvolutionOptions both;
    both.algo = ConvAlgo::Gemm;
    both.workmem = ConvAlgo::Gemm;
    EXPECT_THROW(dnn::convolution(*gate, img, kern, both), ConfigurationError);

    dnn::ConvolutionOptions legacy;
    legacy.workmem = ConvAlgo::Gemm;
    auto out = dnn::convolution(*gate, img, kern, legacy);
    const auto *op = graph::op_cast<dnn::DnnConvOp>(out->owner_raw()->op());
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->algo(), ConvAlgo::Gemm);
}

TEST_F(ConvLowering, EntryPointMatchesGenericConv) {
    auto img = input4({2, 3, 8, 8});
    auto kern = input4({4, 3, 3, 3});
    auto x = HostTensor::uniform(DType::Float32, {2, 3, 8, 8}, 5);
    auto k = HostTensor::uniform(DType::Float32, {4, 3, 3, 3}, 6);

    for (auto mode : {ConvMode::Convolution, ConvMode::CrossCorrelation}) {
        for (auto border : {Padding::valid(), Padding::full()}) {
            dnn::ConvolutionOptions opts;
            opts.border = border;
            opts.mode = mode;
            auto lifted = dnn::convolution(*gate, img, kern, opts);

            ops::ConvParams params;
            params.border = border;
            params.filter_flip = mode == ConvMode::Convolution;
            auto generic = ops::conv(img, kern, params);

            auto got = evaluate({img, kern}, {lifted}, {x, k}, gate->backend());
            auto expected = evaluate({img, kern}, {generic}, {x, k});
            ExpectTensorNear(*got[0], *expected[0], 1e-9);
        }
    }
}
