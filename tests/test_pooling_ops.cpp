#include "dnnlift_test_utils.hpp"

using namespace dnnlift;
using namespace dnnlift::testing;
using dnn::PoolMode;
using graph::OpKind;

class PoolingOps : public ReferenceGateTest {};

namespace {

HostTensorPtr arange(const Shape &shape) {
    auto t = HostTensor::zeros(DType::Float32, shape);
    for (size_t i = 0; i < t->size(); ++i)
        t->data[i] = static_cast<double>(i + 1);
    return t;
}

} // namespace

// ============================================================================
// Forward
// ============================================================================

TEST_F(PoolingOps, MaxPoolHalvesSpatialDims) {
    auto x = input4({1, 1, 8, 8});
    auto y = dnn::pooling(*gate, x, {2, 2}, {2, 2});
    EXPECT_EQ(y->type().dims, Shape({1, 1, 4, 4}));

    auto out = evaluate({x}, {y}, {arange({1, 1, 8, 8})}, gate->backend())[0];
    ASSERT_EQ(out->shape, Shape({1, 1, 4, 4}));
    // bottom-right element of each 2x2 block
    for (int64_t i = 0; i < 4; ++i) {
        for (int64_t j = 0; j < 4; ++j) {
            EXPECT_DOUBLE_EQ(out->data[i * 4 + j],
                             static_cast<double>((2 * i + 1) * 8 + 2 * j + 2));
        }
    }
}

TEST_F(PoolingOps, StridesDefaultToOne) {
    auto x = input4({1, 1, 5, 5});
    auto y = dnn::pooling(*gate, x, {2, 2});
    EXPECT_EQ(y->type().dims, Shape({1, 1, 4, 4}));
}

TEST_F(PoolingOps, AveragePaddingModes) {
    auto x = input4({1, 1, 2, 2});
    auto data = arange({1, 1, 2, 2});

    auto inc = dnn::pooling(*gate, x, {2, 2}, {1, 1},
                            PoolMode::AverageIncludePad, {1, 1});
    auto exc = dnn::pooling(*gate, x, {2, 2}, {1, 1},
                            PoolMode::AverageExcludePad, {1, 1});
    auto results = evaluate({x}, {inc, exc}, {data}, gate->backend());

    ASSERT_EQ(results[0]->shape, Shape({1, 1, 3, 3}));
    ExpectTensorEquals(*results[0],
                       {0.25, 0.75, 0.5, 1.0, 2.5, 1.5, 0.75, 1.75, 1.0});
    ExpectTensorEquals(*results[1], {1.0, 1.5, 2.0, 2.0, 2.5, 3.0, 3.0, 3.5, 4.0});
}

TEST_F(PoolingOps, MatchesGenericPool) {
    auto x = input4({2, 3, 7, 7});
    auto data = HostTensor::uniform(DType::Float32, {2, 3, 7, 7}, 9);
    for (auto mode : {PoolMode::Max, PoolMode::AverageIncludePad,
                      PoolMode::AverageExcludePad}) {
        ops::PoolParams params;
        params.window = {3, 3};
        params.strides = {2, 2};
        params.pads = {1, 1};
        params.mode = mode;
        auto generic = ops::pool(x, params);
        auto lifted = dnn::pooling(*gate, x, {3, 3}, {2, 2}, mode, {1, 1});
        EXPECT_EQ(lifted->type().dims, generic->type().dims);

        auto expected = evaluate({x}, {generic}, {data})[0];
        auto got = evaluate({x}, {lifted}, {data}, gate->backend())[0];
        ExpectTensorNear(*got, *expected, 1e-12);
    }
}

TEST_F(PoolingOps, ThreeDimensional) {
    auto x = input4({1, 2, 4, 4, 4});
    auto y = dnn::pooling(*gate, x, {2, 2, 2}, {2, 2, 2});
    EXPECT_EQ(y->type().dims, Shape({1, 2, 2, 2, 2}));

    auto out = evaluate({x}, {y}, {arange({1, 2, 4, 4, 4})},
                        gate->backend())[0];
    // last element of the first 2x2x2 block of channel 0
    EXPECT_DOUBLE_EQ(out->data[0], 1.0 + 16 + 4 + 1);

    EXPECT_THROW(dnn::pooling(*old_gate, x, {2, 2, 2}), FeatureUnsupportedError);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(PoolingOps, RankMustMatchWindow) {
    EXPECT_THROW(dnn::pooling(*gate, input4({1, 8, 8}), {2, 2}), ShapeError);
    EXPECT_THROW(dnn::pooling(*gate, input4({1, 1, 8, 8, 8}), {2, 2}),
                 ShapeError);
    EXPECT_THROW(dnn::pooling(*gate, input4({1, 1, 8, 8}), {2, 2, 2}),
                 ShapeError);
}

TEST_F(PoolingOps, RejectsNonFloatInput) {
    auto x = graph::tensor_input(DType::Int64, {1, 1, 8, 8});
    EXPECT_THROW(dnn::pooling(*gate, x, {2, 2}), TypeError);
}

TEST_F(PoolingOps, DescriptorMustBePoolDescriptor) {
    auto x = input4({1, 1, 8, 8});
    auto conv_desc = dnn::conv_descriptor(
        *gate, dnn::Padding::valid(), {1, 1}, dnn::ConvMode::Convolution,
        ops::shape_of(input4({1, 1, 2, 2})));
    EXPECT_THROW(dnn::dnn_pool(x, conv_desc), TypeError);
}

TEST_F(PoolingOps, RequiresGate) {
    EXPECT_THROW(dnn::pooling(*unavailable_gate(), input4({1, 1, 8, 8}), {2, 2}),
                 UnavailableError);
}

// ============================================================================
// Gradient
// ============================================================================

TEST_F(PoolingOps, GradientMatchesFiniteDifferences) {
    auto x = input4({1, 2, 6, 6}, "x");
    auto data = HostTensor::uniform(DType::Float32, {1, 2, 6, 6}, 21);
    auto backend = gate->backend();

    for (auto mode : {PoolMode::Max, PoolMode::AverageIncludePad,
                      PoolMode::AverageExcludePad}) {
        auto y = dnn::pooling(*gate, x, {2, 2}, {2, 2}, mode, {1, 1});
        auto seed = input4(y->type().dims, "seed");
        auto grads = graph::grad(y, seed, {x});
        ASSERT_NE(grads[0], nullptr);
        {
            graph::FunctionGraph fg({x, seed}, grads);
            EXPECT_EQ(fg.count(OpKind::DnnPoolGrad), 1u);
        }

        auto s = HostTensor::uniform(DType::Float32, y->type().dims, 22);
        auto symbolic = evaluate({x, seed}, grads, {data, s}, backend)[0];
        auto f = [&](const std::vector<HostTensorPtr> &in) {
            return evaluate({x}, {y}, in, backend)[0];
        };
        auto numeric = numeric_gradient(f, {data}, 0, *s, 1e-5);
        ExpectTensorNear(*symbolic, *numeric, 1e-6);
    }
}

TEST_F(PoolingOps, VolumetricGradientMatchesFiniteDifferences) {
    auto x = input4({1, 1, 4, 4, 4}, "x");
    auto data = HostTensor::uniform(DType::Float32, {1, 1, 4, 4, 4}, 23);
    auto backend = gate->backend();

    for (auto mode : {PoolMode::Max, PoolMode::AverageIncludePad,
                      PoolMode::AverageExcludePad}) {
        auto y = dnn::pooling(*gate, x, {2, 2, 2}, {2, 2, 2}, mode, {1, 1, 1});
        EXPECT_EQ(y->type().dims, Shape({1, 1, 3, 3, 3}));
        auto seed = input4(y->type().dims, "seed");
        auto grads = graph::grad(y, seed, {x});
        ASSERT_NE(grads[0], nullptr);
        {
            graph::FunctionGraph fg({x, seed}, grads);
            EXPECT_EQ(fg.count(OpKind::DnnPoolGrad), 1u);
        }

        auto s = HostTensor::uniform(DType::Float32, y->type().dims, 24);
        auto symbolic = evaluate({x, seed}, grads, {data, s}, backend)[0];
        auto f = [&](const std::vector<HostTensorPtr> &in) {
            return evaluate({x}, {y}, in, backend)[0];
        };
        auto numeric = numeric_gradient(f, {data}, 0, *s, 1e-5);
        ExpectTensorNear(*symbolic, *numeric, 1e-6);
    }
}

TEST_F(PoolingOps, GradientShapeMismatchAtRuntime) {
    auto x = input4({1, 1, 4, 4});
    auto desc = dnn::pool_descriptor(*gate, {2, 2}, {2, 2}, {0, 0},
                                     PoolMode::Max);
    auto out = input4({1, 1, 2, 2});
    auto g = input4({1, 1, 3, 3});
    auto dx = dnn::dnn_pool_grad(x, out, g, desc);
    EXPECT_THROW(evaluate({x, out, g}, {dx},
                          {HostTensor::zeros(DType::Float32, {1, 1, 4, 4}),
                           HostTensor::zeros(DType::Float32, {1, 1, 2, 2}),
                           HostTensor::zeros(DType::Float32, {1, 1, 3, 3})},
                          gate->backend()),
                 ShapeError);
}
