#include "dnnlift_test_utils.hpp"

using namespace dnnlift;
using namespace dnnlift::testing;
using dnn::ConvDescriptor;
using dnn::ConvMode;
using dnn::Padding;
using dnn::PoolDescriptor;
using dnn::PoolMode;

class Descriptors : public ReferenceGateTest {};

// ============================================================================
// Convolution descriptor
// ============================================================================

TEST_F(Descriptors, ConvDescriptorName) {
    auto op = ConvDescriptor::create(*gate, Padding::valid(), {1, 1},
                                     ConvMode::CrossCorrelation);
    EXPECT_EQ(op->name(), "DnnConvDesc{border_mode=valid, subsample=(1, 1), "
                          "conv_mode=cross}");
    EXPECT_EQ(op->spatial_rank(), 2u);
}

TEST_F(Descriptors, UniformPadBroadcastsToStrideLength) {
    auto op = ConvDescriptor::create(*gate, Padding::uniform(2), {1, 1, 1},
                                     ConvMode::Convolution);
    EXPECT_EQ(op->padding(), Padding::explicit_pads({2, 2, 2}));
}

TEST_F(Descriptors, ConvDescriptorValidation) {
    EXPECT_THROW(ConvDescriptor(Padding::valid(), {1}, ConvMode::Convolution),
                 ConfigurationError);
    EXPECT_THROW(
        ConvDescriptor(Padding::valid(), {1, 1, 1, 1}, ConvMode::Convolution),
        ConfigurationError);
    EXPECT_THROW(ConvDescriptor(Padding::valid(), {1, 0}, ConvMode::Convolution),
                 ConfigurationError);
    EXPECT_THROW(ConvDescriptor(Padding::explicit_pads({1, 1, 1}), {1, 1},
                                ConvMode::Convolution),
                 ConfigurationError);
    EXPECT_THROW(ConvDescriptor(Padding::explicit_pads({1, -1}), {1, 1},
                                ConvMode::Convolution),
                 ConfigurationError);
    EXPECT_THROW(
        ConvDescriptor(Padding::uniform(-2), {1, 1}, ConvMode::Convolution),
        ConfigurationError);
}

TEST_F(Descriptors, LengthMismatchNamesTheParameter) {
    try {
        ConvDescriptor(Padding::explicit_pads({1, 1, 1}), {1, 1},
                       ConvMode::Convolution);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_NE(std::string(e.what()).find("border_mode"), std::string::npos);
    }
}

TEST_F(Descriptors, ThreeDimensionalNeedsNdLevel) {
    EXPECT_NO_THROW(ConvDescriptor::create(*gate, Padding::valid(), {1, 1, 1},
                                           ConvMode::Convolution));
    try {
        ConvDescriptor::create(*old_gate, Padding::valid(), {1, 1, 1},
                               ConvMode::Convolution);
        FAIL() << "expected FeatureUnsupportedError";
    } catch (const FeatureUnsupportedError &e) {
        EXPECT_EQ(e.required_version(), backends::kNdDescriptorVersion);
        EXPECT_EQ(e.detected_version(), 2000);
    }
    EXPECT_NO_THROW(ConvDescriptor::create(*old_gate, Padding::valid(), {1, 1},
                                           ConvMode::Convolution));
}

TEST_F(Descriptors, CreateRequiresAvailableGate) {
    auto down = unavailable_gate();
    EXPECT_THROW(ConvDescriptor::create(*down, Padding::valid(), {1, 1},
                                        ConvMode::Convolution),
                 UnavailableError);
}

TEST_F(Descriptors, KernelShapeMustBeShapeVector) {
    auto kern = input4({4, 3, 3, 3});
    EXPECT_THROW(dnn::conv_descriptor(*gate, Padding::valid(), {1, 1},
                                      ConvMode::Convolution, kern),
                 TypeError);

    auto shape = ops::shape_of(kern);
    auto desc = dnn::conv_descriptor(*gate, Padding::valid(), {1, 1},
                                     ConvMode::Convolution, shape);
    EXPECT_TRUE(desc->type().is_opaque());
    EXPECT_EQ(desc->type().native_type, backends::kConvDescriptorType);
    ASSERT_NE(dnn::conv_descriptor_of(desc), nullptr);
    EXPECT_EQ(dnn::conv_descriptor_of(desc)->mode(), ConvMode::Convolution);

    // 3 spatial strides against a rank 4 kernel
    EXPECT_THROW(dnn::conv_descriptor(*gate, Padding::valid(), {1, 1, 1},
                                      ConvMode::Convolution, shape),
                 ShapeError);
}

TEST_F(Descriptors, EqualParametersHashEqual) {
    ConvDescriptor a(Padding::full(), {2, 2}, ConvMode::Convolution);
    ConvDescriptor b(Padding::full(), {2, 2}, ConvMode::Convolution);
    ConvDescriptor c(Padding::full(), {2, 2}, ConvMode::CrossCorrelation);
    EXPECT_TRUE(a.params_equal(b));
    EXPECT_EQ(a.hash_params(graph::FNV_OFFSET), b.hash_params(graph::FNV_OFFSET));
    EXPECT_FALSE(a.params_equal(c));
    EXPECT_NE(a.hash_params(graph::FNV_OFFSET), c.hash_params(graph::FNV_OFFSET));
}

// ============================================================================
// Output shape
// ============================================================================

TEST(ConvOutputShape, FloorFormula) {
    EXPECT_EQ(dnn::conv_output_shape({2, 3, 8, 8}, {4, 3, 3, 3},
                                     Padding::valid(), {1, 1}),
              Shape({2, 4, 6, 6}));
    EXPECT_EQ(dnn::conv_output_shape({2, 3, 8, 8}, {4, 3, 3, 3},
                                     Padding::full(), {1, 1}),
              Shape({2, 4, 10, 10}));
    EXPECT_EQ(dnn::conv_output_shape({1, 1, 7, 9}, {5, 1, 3, 2},
                                     Padding::explicit_pads({1, 0}), {2, 3}),
              Shape({1, 5, 4, 3}));
    EXPECT_EQ(dnn::conv_output_shape({1, 2, 5, 5, 5}, {3, 2, 3, 3, 3},
                                     Padding::uniform(1), {1, 1, 1}),
              Shape({1, 3, 5, 5, 5}));
}

TEST(ConvOutputShape, RejectsBadRanks) {
    EXPECT_THROW(dnn::conv_output_shape({2, 3, 8}, {4, 3, 3}, Padding::valid(),
                                        {1}),
                 ShapeError);
    EXPECT_THROW(dnn::conv_output_shape({2, 3, 8, 8}, {4, 3, 3, 3},
                                        Padding::valid(), {1, 1, 1}),
                 ConfigurationError);
}

// ============================================================================
// Pooling descriptor
// ============================================================================

TEST_F(Descriptors, PoolDescriptorValidation) {
    EXPECT_THROW(PoolDescriptor({2, 2}, {2}, {0, 0}, PoolMode::Max),
                 ConfigurationError);
    EXPECT_THROW(PoolDescriptor({2, 2, 2}, {2, 2}, {0, 0}, PoolMode::Max),
                 ConfigurationError);
    EXPECT_THROW(PoolDescriptor({2, 2}, {2, 2}, {0}, PoolMode::Max),
                 ConfigurationError);
    EXPECT_THROW(PoolDescriptor({2, 0}, {2, 2}, {0, 0}, PoolMode::Max),
                 ConfigurationError);
    EXPECT_THROW(PoolDescriptor({2, 2}, {2, 2}, {-1, 0}, PoolMode::Max),
                 ConfigurationError);
    EXPECT_NO_THROW(
        PoolDescriptor({3, 3}, {1, 1}, {1, 1}, PoolMode::AverageExcludePad));
}

TEST(PoolDescState, SchemaOneGetsZeroPads) {
    dnn::PoolDescState old;
    old.schema_version = 1;
    old.window = {3, 3, 3};
    old.strides = {1, 1, 1};
    auto migrated = dnn::migrate_pool_state(old);
    EXPECT_EQ(migrated.schema_version, dnn::kPoolStateSchemaVersion);
    ASSERT_TRUE(migrated.pads.has_value());
    EXPECT_EQ(*migrated.pads, std::vector<int64_t>({0, 0, 0}));

    // Pads already present survive
    old.pads = std::vector<int64_t>{1, 1, 1};
    EXPECT_EQ(*dnn::migrate_pool_state(old).pads,
              std::vector<int64_t>({1, 1, 1}));
}

TEST(PoolDescState, RejectsInvalidRecords) {
    dnn::PoolDescState missing;
    missing.window = {2, 2};
    missing.strides = {2, 2};
    EXPECT_THROW(dnn::migrate_pool_state(missing), ConfigurationError);

    dnn::PoolDescState future;
    future.schema_version = 3;
    future.pads = std::vector<int64_t>{0, 0};
    EXPECT_THROW(dnn::migrate_pool_state(future), ConfigurationError);
}

TEST_F(Descriptors, PoolDescriptorFromLegacyState) {
    dnn::PoolDescState old;
    old.schema_version = 1;
    old.window = {2, 2};
    old.strides = {2, 2};
    old.mode = PoolMode::AverageIncludePad;
    auto op = PoolDescriptor::from_state(*gate, old);
    EXPECT_EQ(op->pads(), std::vector<int64_t>({0, 0}));
    EXPECT_TRUE(op->params_equal(
        PoolDescriptor({2, 2}, {2, 2}, {0, 0}, PoolMode::AverageIncludePad)));

    auto state = op->state();
    EXPECT_EQ(state.schema_version, dnn::kPoolStateSchemaVersion);
    EXPECT_EQ(*state.pads, std::vector<int64_t>({0, 0}));
}

TEST_F(Descriptors, PoolDescriptorName) {
    PoolDescriptor op({2, 2}, {2, 2}, {0, 0}, dnn::parse_pool_mode("average"));
    EXPECT_EQ(op.mode(), PoolMode::AverageIncludePad);
    EXPECT_EQ(op.name(), "DnnPoolDesc{ws=(2, 2), stride=(2, 2), pad=(0, 0), "
                         "mode=average_inc_pad}");
    EXPECT_THROW(dnn::parse_pool_mode("median"), ConfigurationError);
}

TEST_F(Descriptors, PoolOutputDims) {
    PoolDescriptor op({2, 2}, {2, 2}, {0, 0}, PoolMode::Max);
    EXPECT_EQ(op.output_dims({1, 1, 8, 8}), Shape({1, 1, 4, 4}));
    EXPECT_EQ(op.output_dims({3, 2, 9, 7}), Shape({3, 2, 4, 3}));
    EXPECT_THROW(op.output_dims({1, 1, 8, 8, 8}), ShapeError);

    PoolDescriptor padded({3, 3}, {1, 1}, {1, 1}, PoolMode::Max);
    EXPECT_EQ(padded.output_dims({1, 1, 5, 5}), Shape({1, 1, 5, 5}));
}

TEST_F(Descriptors, ThreeDimensionalPoolingNeedsNdLevel) {
    EXPECT_THROW(PoolDescriptor::create(*old_gate, {2, 2, 2}, {2, 2, 2},
                                        {0, 0, 0}, PoolMode::Max),
                 FeatureUnsupportedError);
    EXPECT_NO_THROW(PoolDescriptor::create(*gate, {2, 2, 2}, {2, 2, 2},
                                           {0, 0, 0}, PoolMode::Max));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(Descriptors, NeverConstantFolded) {
    auto x = input4({1, 1, 8, 8});
    auto desc = dnn::pool_descriptor(*gate, {2, 2}, {2, 2}, {0, 0},
                                     PoolMode::Max);
    auto y = dnn::dnn_pool(x, desc);
    graph::FunctionGraph fg({x}, {y});

    opt::RuleRegistry registry;
    registry.register_local("canonicalize", 10, {"fast_run"},
                            opt::constant_folding_rule());
    opt::EquilibriumRewriter rewriter;
    auto stats = rewriter.optimize(fg, *gate, registry,
                                   opt::RuleQuery{{"fast_run"}, {}});

    EXPECT_EQ(stats.replacements, 0u);
    EXPECT_EQ(fg.count(graph::OpKind::DnnPoolDesc), 1u);
}

TEST_F(Descriptors, CachedPerNodeAndReleasedOnce) {
    const size_t before = backends::live_reference_descriptors();

    auto img = input4({1, 2, 6, 6});
    auto kern = input4({3, 2, 3, 3});
    auto out = dnn::convolution(*gate, img, kern);
    graph::FunctionGraph fg({img, kern}, {out});

    {
        auto plan = graph::compile(fg, gate->backend());
        std::vector<graph::Datum> args = {
            HostTensor::uniform(DType::Float32, {1, 2, 6, 6}, 1),
            HostTensor::uniform(DType::Float32, {3, 2, 3, 3}, 2)};
        graph::GraphExecutor::execute(*plan, args);
        EXPECT_EQ(plan->context->cached_descriptors(), 1u);
        EXPECT_EQ(backends::live_reference_descriptors(), before + 1);

        // A second run reuses the cached handle
        graph::GraphExecutor::execute(*plan, args);
        EXPECT_EQ(plan->context->cached_descriptors(), 1u);
        EXPECT_EQ(backends::live_reference_descriptors(), before + 1);
    }
    EXPECT_EQ(backends::live_reference_descriptors(), before);
}

TEST_F(Descriptors, HandleCarriesBackendVersion) {
    auto desc = dnn::pool_descriptor(*gate, {2, 2}, {2, 2}, {0, 0},
                                     PoolMode::Max);
    graph::ExecContext ctx(gate->backend());
    auto results = desc->owner_raw()->op().perform(*desc->owner_raw(), {}, ctx);
    const auto &handle = graph::datum_descriptor(results[0], "descriptor");
    EXPECT_EQ(handle->backend_version(), 5000);
    EXPECT_EQ(handle->native_type(), backends::kPoolDescriptorType);
}
