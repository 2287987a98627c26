#include "dnnlift_test_utils.hpp"

using namespace dnnlift;
using namespace dnnlift::testing;
using dnn::ConvAlgo;
using dnn::ConvDirection;
using dnn::ConvMode;
using dnn::DnnConvOp;
using dnn::Padding;
using graph::ValuePtr;

namespace {

struct ConvGraph {
    ValuePtr img;
    ValuePtr kern;
    ValuePtr desc;
    ValuePtr buffer;
};

ConvGraph conv_graph(const backends::AvailabilityGate &gate, Shape img_dims,
                     Shape kern_dims, Padding border = Padding::valid()) {
    ConvGraph g;
    g.img = input4(std::move(img_dims), "img");
    g.kern = input4(std::move(kern_dims), "kern");
    const size_t nd = g.img->type().rank() - 2;
    std::vector<int64_t> strides(nd, 1);
    g.desc = dnn::conv_descriptor(gate, border, strides, ConvMode::Convolution,
                                  ops::shape_of(g.kern));
    g.buffer = ops::alloc_empty(
        DType::Float32,
        ops::conv_output_shape(ops::ConvOutputShape::Rule::Forward, border,
                               strides, ops::shape_of(g.img),
                               ops::shape_of(g.kern)));
    return g;
}

} // namespace

class ConvOps : public ReferenceGateTest {};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ConvOps, DefaultAlgorithmsComeFromConfig) {
    auto fwd = DnnConvOp::create(*gate, ConvDirection::Forward);
    EXPECT_EQ(fwd->algo(), ConvAlgo::Precomputed);
    auto bwd = DnnConvOp::create(*gate, ConvDirection::BackwardFilter);
    EXPECT_EQ(bwd->algo(), ConvAlgo::Plain);

    DnnConfig config;
    config.default_forward_algorithm = ConvAlgo::Gemm;
    config.default_backward_algorithm = ConvAlgo::Deterministic;
    auto tuned = reference_gate(5000, config);
    EXPECT_EQ(DnnConvOp::create(*tuned, ConvDirection::Forward)->algo(),
              ConvAlgo::Gemm);
    EXPECT_EQ(DnnConvOp::create(*tuned, ConvDirection::BackwardData)->algo(),
              ConvAlgo::Deterministic);
}

TEST_F(ConvOps, GradientAlgorithmsComeFromConfig) {
    DnnConfig config;
    config.default_forward_algorithm = ConvAlgo::Gemm;
    config.default_backward_algorithm = ConvAlgo::Deterministic;
    auto tuned = reference_gate(5000, config);
    auto op = DnnConvOp::create(*tuned, ConvDirection::Forward,
                                ConvAlgo::Plain);
    EXPECT_EQ(op->gradient_algos().forward, ConvAlgo::Gemm);
    EXPECT_EQ(op->gradient_algos().backward, ConvAlgo::Deterministic);

    // Part of the operator's identity
    auto other = DnnConvOp::create(*gate, ConvDirection::Forward,
                                   ConvAlgo::Plain);
    EXPECT_FALSE(op->params_equal(*other));
    EXPECT_NE(op->hash_params(0), other->hash_params(0));
    EXPECT_TRUE(op->with_inplace(true)->gradient_algos().backward ==
                ConvAlgo::Deterministic);
}

TEST_F(ConvOps, GradientAlgorithmsFallBackOnOldBackends) {
    DnnConfig config;
    config.default_backward_algorithm = ConvAlgo::Fft;
    auto old = reference_gate(2000, config);
    auto op = DnnConvOp::create(*old, ConvDirection::Forward);
    EXPECT_EQ(op->gradient_algos().backward, ConvAlgo::Plain);
}

TEST_F(ConvOps, AlgorithmMustSuitDirection) {
    EXPECT_THROW(DnnConvOp(ConvDirection::Forward, ConvAlgo::Deterministic),
                 ConfigurationError);
    EXPECT_THROW(DnnConvOp(ConvDirection::BackwardFilter, ConvAlgo::Precomputed),
                 ConfigurationError);
    EXPECT_THROW(DnnConvOp(ConvDirection::BackwardData, ConvAlgo::Gemm),
                 ConfigurationError);
    EXPECT_NO_THROW(DnnConvOp(ConvDirection::BackwardData, ConvAlgo::Fft));
    EXPECT_NO_THROW(DnnConvOp(ConvDirection::Forward, ConvAlgo::TimeOnce));
}

TEST_F(ConvOps, VersionGatedAlgorithms) {
    EXPECT_THROW(DnnConvOp::create(*old_gate, ConvDirection::Forward,
                                   ConvAlgo::Fft),
                 FeatureUnsupportedError);
    EXPECT_THROW(DnnConvOp::create(*old_gate, ConvDirection::BackwardFilter,
                                   ConvAlgo::GuessOnce),
                 FeatureUnsupportedError);
    EXPECT_NO_THROW(DnnConvOp::create(*old_gate, ConvDirection::Forward,
                                      ConvAlgo::Gemm));
    EXPECT_NO_THROW(DnnConvOp::create(*gate, ConvDirection::Forward,
                                      ConvAlgo::TimeOnShapeChange));
    EXPECT_THROW(DnnConvOp::create(*unavailable_gate(), ConvDirection::Forward),
                 UnavailableError);
}

TEST_F(ConvOps, NameAndEquality) {
    DnnConvOp a(ConvDirection::Forward, ConvAlgo::Precomputed);
    DnnConvOp b(ConvDirection::Forward, ConvAlgo::Precomputed);
    DnnConvOp c(ConvDirection::Forward, ConvAlgo::Precomputed, true);
    EXPECT_EQ(a.name(), "DnnConv{algo=small}");
    EXPECT_EQ(c.name(), "DnnConv{algo=small, inplace}");
    EXPECT_TRUE(a.params_equal(b));
    EXPECT_FALSE(a.params_equal(c));
    EXPECT_NE(a.hash_params(graph::FNV_OFFSET), c.hash_params(graph::FNV_OFFSET));
    EXPECT_EQ(DnnConvOp(ConvDirection::BackwardFilter, ConvAlgo::Plain).kind(),
              graph::OpKind::DnnConvGradW);
}

TEST_F(ConvOps, InplaceDeclaresDestroyMap) {
    DnnConvOp plain(ConvDirection::Forward, ConvAlgo::Plain);
    EXPECT_TRUE(plain.destroy_map().empty());

    auto inplace = plain.with_inplace(true);
    auto dm = inplace->destroy_map();
    ASSERT_EQ(dm.size(), 1u);
    EXPECT_EQ(dm.at(0), std::vector<size_t>{dnn::kConvOutput});
}

// ============================================================================
// Type checking
// ============================================================================

TEST_F(ConvOps, OutputHasBufferType) {
    auto g = conv_graph(*gate, {2, 3, 8, 8}, {4, 3, 3, 3});
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc);
    EXPECT_EQ(out->type(), g.buffer->type());
    EXPECT_EQ(out->type().dims, Shape({2, 4, 6, 6}));

    const auto &node = *out->owner_raw();
    EXPECT_TRUE(node.input(dnn::kConvAlpha)->type().is_scalar());
    EXPECT_EQ(graph::constant_scalar_value(node.input(dnn::kConvAlpha)), 1.0);
    EXPECT_EQ(graph::constant_scalar_value(node.input(dnn::kConvBeta)), 0.0);
}

TEST_F(ConvOps, SingleElementConstantBecomesScalar) {
    auto g = conv_graph(*gate, {1, 1, 5, 5}, {1, 1, 3, 3});
    auto alpha = graph::constant_tensor(
        HostTensor::filled(DType::Float32, {1, 1, 1, 1}, 3.0));
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc, alpha);
    const auto &a = out->owner_raw()->input(dnn::kConvAlpha);
    EXPECT_TRUE(a->type().is_scalar());
    EXPECT_EQ(graph::constant_scalar_value(a), 3.0);
}

TEST_F(ConvOps, RejectsMalformedInputs) {
    auto g = conv_graph(*gate, {2, 3, 8, 8}, {4, 3, 3, 3});

    // Non-scalar alpha
    auto tensor_alpha = input4({2, 4, 6, 6});
    EXPECT_THROW(
        dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc, tensor_alpha),
        TypeError);

    // Rank 3 operands
    auto img3 = graph::tensor_input(DType::Float32, {2, 3, 8});
    EXPECT_THROW(dnn::dnn_conv(*gate, img3, g.kern, g.buffer, g.desc),
                 ShapeError);

    // Mismatched ranks
    auto kern5 = graph::tensor_input(DType::Float32, {4, 3, 3, 3, 3});
    EXPECT_THROW(dnn::dnn_conv(*gate, g.img, kern5, g.buffer, g.desc),
                 ShapeError);

    // Pooling descriptor in the descriptor slot
    auto pool_desc = dnn::pool_descriptor(*gate, {2, 2}, {2, 2}, {0, 0},
                                          dnn::PoolMode::Max);
    EXPECT_THROW(dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, pool_desc),
                 TypeError);

    // Integer operands
    auto int_img = graph::tensor_input(DType::Int64, {2, 3, 8, 8});
    EXPECT_THROW(dnn::dnn_conv(*gate, int_img, g.kern, g.buffer, g.desc),
                 TypeError);

    // Runtime scalar of another dtype
    auto wide_alpha = graph::input(graph::ValueType::scalar(DType::Float64));
    EXPECT_THROW(
        dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc, wide_alpha),
        TypeError);
}

TEST_F(ConvOps, ConstantScalarsTakeThePrimaryDtype) {
    auto g = conv_graph(*gate, {1, 1, 5, 5}, {1, 1, 3, 3});
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc,
                             graph::constant_scalar(2.0, DType::Float64),
                             graph::constant_scalar(0.5, DType::Float64));
    for (size_t i : {dnn::kConvAlpha, dnn::kConvBeta}) {
        const auto &v = out->owner_raw()->input(i);
        EXPECT_EQ(v->type().dtype, DType::Float32);
    }
    EXPECT_EQ(graph::constant_scalar_value(
                  out->owner_raw()->input(dnn::kConvAlpha)),
              2.0);
}

TEST_F(ConvOps, ThreeDimensionalRejectsFftAndDeterministic) {
    auto g = conv_graph(*gate, {1, 2, 5, 5, 5}, {3, 2, 3, 3, 3});
    EXPECT_THROW(dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc, nullptr,
                               nullptr, ConvAlgo::Fft),
                 ConfigurationError);
    auto top = graph::tensor_input(DType::Float32, {1, 3, 3, 3, 3});
    EXPECT_THROW(dnn::dnn_conv_grad_w(*gate, g.img, top, ops::empty_like(g.kern),
                                      g.desc, nullptr, nullptr,
                                      ConvAlgo::Deterministic),
                 ConfigurationError);
    EXPECT_NO_THROW(dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc));
}

TEST_F(ConvOps, ConnectionPattern) {
    auto g = conv_graph(*gate, {1, 1, 5, 5}, {1, 1, 3, 3});
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc);
    const auto &node = *out->owner_raw();
    EXPECT_EQ(node.op().connection_pattern(node),
              std::vector<bool>({true, true, true, false, true, true}));
}

// ============================================================================
// State migration
// ============================================================================

TEST(ConvOpState, SchemaOneMovesWorkmemToAlgo) {
    dnn::ConvOpState old;
    old.schema_version = 1;
    old.workmem = ConvAlgo::Gemm;
    auto migrated = dnn::migrate_conv_state(old);
    EXPECT_EQ(migrated.schema_version, dnn::kConvStateSchemaVersion);
    EXPECT_EQ(migrated.algo, ConvAlgo::Gemm);
    EXPECT_FALSE(migrated.workmem.has_value());
}

TEST(ConvOpState, RejectsInvalidRecords) {
    dnn::ConvOpState both;
    both.workmem = ConvAlgo::Gemm;
    EXPECT_THROW(dnn::migrate_conv_state(both), ConfigurationError);

    dnn::ConvOpState future;
    future.schema_version = 7;
    EXPECT_THROW(dnn::migrate_conv_state(future), ConfigurationError);
}

TEST_F(ConvOps, StateRoundTripsThroughFromState) {
    dnn::ConvOpState old;
    old.schema_version = 1;
    old.workmem = ConvAlgo::Gemm;
    old.inplace = true;
    auto op = DnnConvOp::from_state(*gate, ConvDirection::Forward, old);
    EXPECT_EQ(op->algo(), ConvAlgo::Gemm);
    EXPECT_TRUE(op->inplace());

    auto state = op->state();
    EXPECT_EQ(state.schema_version, dnn::kConvStateSchemaVersion);
    EXPECT_EQ(state.algo, ConvAlgo::Gemm);
    EXPECT_FALSE(state.workmem.has_value());
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(ConvOps, AlphaBetaBlendIntoBuffer) {
    auto img = input4({1, 2, 6, 6}, "img");
    auto kern = input4({3, 2, 3, 3}, "kern");
    auto w = input4({1, 3, 4, 4}, "w");
    auto desc = dnn::conv_descriptor(*gate, Padding::valid(), {1, 1},
                                     ConvMode::Convolution, ops::shape_of(kern));
    auto out = dnn::dnn_conv(*gate, img, kern, w, desc,
                             graph::constant_scalar(2.0),
                             graph::constant_scalar(0.5));
    auto reference = ops::conv(img, kern, ops::ConvParams{});

    auto x = HostTensor::uniform(DType::Float32, {1, 2, 6, 6}, 11);
    auto k = HostTensor::uniform(DType::Float32, {3, 2, 3, 3}, 12);
    auto wv = HostTensor::uniform(DType::Float32, {1, 3, 4, 4}, 13);
    auto wv_before = *wv;

    auto got = evaluate({img, kern, w}, {out}, {x, k, wv}, gate->backend());
    auto ref = evaluate({img, kern}, {reference}, {x, k});

    HostTensor expected = *ref[0];
    for (size_t i = 0; i < expected.size(); ++i)
        expected.data[i] = 2.0 * expected.data[i] + 0.5 * wv_before.data[i];
    ExpectTensorNear(*got[0], expected, 1e-9);

    // The caller's buffer is a graph input and stays untouched
    ExpectTensorNear(*wv, wv_before, 0.0);
}

TEST_F(ConvOps, AlgorithmsAgree) {
    auto x = HostTensor::uniform(DType::Float32, {2, 3, 7, 7}, 21);
    auto k = HostTensor::uniform(DType::Float32, {4, 3, 3, 3}, 22);

    std::vector<HostTensorPtr> results;
    for (auto algo : {ConvAlgo::Plain, ConvAlgo::Precomputed, ConvAlgo::Gemm,
                      ConvAlgo::Fft, ConvAlgo::GuessOnce, ConvAlgo::TimeOnce}) {
        auto g = conv_graph(*gate, {2, 3, 7, 7}, {4, 3, 3, 3});
        auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc,
                                 nullptr, nullptr, algo);
        results.push_back(
            evaluate({g.img, g.kern}, {out}, {x, k}, gate->backend())[0]);
    }
    for (size_t i = 1; i < results.size(); ++i)
        ExpectTensorNear(*results[i], *results[0], 1e-9);
}

TEST_F(ConvOps, AutomaticChoiceCachedOncePerNode) {
    Shape dyn = {kUnknownDim, 2, kUnknownDim, kUnknownDim};
    for (auto [algo, expected_choices] :
         {std::pair{ConvAlgo::GuessOnce, size_t{1}},
          std::pair{ConvAlgo::GuessOnShapeChange, size_t{2}}}) {
        auto img = input4(dyn, "img");
        auto kern = input4({3, 2, 3, 3}, "kern");
        auto desc = dnn::conv_descriptor(*gate, Padding::valid(), {1, 1},
                                         ConvMode::Convolution,
                                         ops::shape_of(kern));
        auto buffer = ops::alloc_empty(
            DType::Float32,
            ops::conv_output_shape(ops::ConvOutputShape::Rule::Forward,
                                   Padding::valid(), {1, 1},
                                   ops::shape_of(img), ops::shape_of(kern)));
        auto out = dnn::dnn_conv(*gate, img, kern, buffer, desc, nullptr,
                                 nullptr, algo);

        graph::FunctionGraph fg({img, kern}, {out});
        auto plan = graph::compile(fg, gate->backend());
        auto k = HostTensor::uniform(DType::Float32, {3, 2, 3, 3}, 1);
        graph::GraphExecutor::execute(
            *plan, {HostTensor::uniform(DType::Float32, {1, 2, 6, 6}, 2), k});
        graph::GraphExecutor::execute(
            *plan, {HostTensor::uniform(DType::Float32, {1, 2, 6, 6}, 3), k});
        graph::GraphExecutor::execute(
            *plan, {HostTensor::uniform(DType::Float32, {2, 2, 8, 8}, 4), k});
        EXPECT_EQ(plan->context->algorithm_choices(), expected_choices)
            << dnn::conv_algo_name(algo);
    }
}

TEST_F(ConvOps, ChooserRunsWithoutHoldingTheContextLock) {
    auto g = conv_graph(*gate, {1, 2, 6, 6}, {3, 2, 3, 3});
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc, nullptr,
                             nullptr, ConvAlgo::TimeOnce);
    const auto &node = *out->owner_raw();

    graph::ExecContext ctx(gate->backend());
    size_t seen = 99;
    auto chosen = ctx.resolve_algorithm(node, ConvAlgo::TimeOnce, {}, [&] {
        // Reads back into the context while choosing
        seen = ctx.algorithm_choices();
        return ConvAlgo::Gemm;
    });
    EXPECT_EQ(chosen, ConvAlgo::Gemm);
    EXPECT_EQ(seen, 0u);
    EXPECT_EQ(ctx.algorithm_choices(), 1u);
    EXPECT_EQ(ctx.resolve_algorithm(node, ConvAlgo::TimeOnce, {},
                                    [] { return ConvAlgo::Plain; }),
              ConvAlgo::Gemm);
}

TEST_F(ConvOps, ExecutingWithoutBackendThrows) {
    auto g = conv_graph(*gate, {1, 1, 5, 5}, {1, 1, 3, 3});
    auto out = dnn::dnn_conv(*gate, g.img, g.kern, g.buffer, g.desc);
    auto x = HostTensor::uniform(DType::Float32, {1, 1, 5, 5}, 1);
    auto k = HostTensor::uniform(DType::Float32, {1, 1, 3, 3}, 2);
    EXPECT_THROW(evaluate({g.img, g.kern}, {out}, {x, k}), RuntimeError);
}
