#pragma once

// Public entry points: build accelerated subgraphs directly from user
// tensors. Every call checks the gate first and throws UnavailableError
// when the backend cannot be used.

#include <cstdint>
#include <optional>
#include <vector>

#include "dnnlift/backends/availability_gate.hpp"
#include "dnnlift/dnn/conv_ops.hpp"
#include "dnnlift/dnn/descriptors.hpp"
#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/dnn/pool_ops.hpp"
#include "dnnlift/dnn/softmax_ops.hpp"

namespace dnnlift {
namespace dnn {

struct ConvolutionOptions {
    Padding border = Padding::valid();
    std::vector<int64_t> subsample; // empty: all ones
    ConvMode mode = ConvMode::Convolution;
    DirectionHint direction_hint = DirectionHint::Forward;
    // Forward algorithm; the configured default when unset
    std::optional<ConvAlgo> algo;
    // Deprecated alias of algo
    std::optional<ConvAlgo> workmem;
};

// Convolution of img [N, C, spatial...] with kern [O, C, kspatial...].
//
// With valid padding, unit strides and the BpropWeights hint the result is
// computed as the weight gradient of a cross-correlation over the
// batch/channel swapped operands. With full padding, unit strides and any
// hint but ForceForward it is computed as the input gradient of a valid
// convolution in the complementary mode. Everything else goes through the
// forward kernel. All three give the same values.
//
// Throws ConfigurationError when both algo and workmem are set.
ValuePtr convolution(const backends::AvailabilityGate &gate,
                     const ValuePtr &img, const ValuePtr &kern,
                     const ConvolutionOptions &opts = {});

// Pooling of img with window `window`. Empty strides default to ones,
// empty pads to zeros.
ValuePtr pooling(const backends::AvailabilityGate &gate, const ValuePtr &img,
                 const std::vector<int64_t> &window,
                 const std::vector<int64_t> &strides = {},
                 PoolMode mode = PoolMode::Max,
                 const std::vector<int64_t> &pads = {});

ValuePtr softmax(const backends::AvailabilityGate &gate, const ValuePtr &x,
                 SoftmaxAlgo algo = SoftmaxAlgo::Accurate,
                 SoftmaxMode mode = SoftmaxMode::Channel);

} // namespace dnn
} // namespace dnnlift
