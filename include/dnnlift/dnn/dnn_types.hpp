#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace dnnlift {
namespace dnn {

// ============================================================================
// Enumerations shared by descriptors, operators, backends and config
// ============================================================================

enum class ConvMode : uint8_t { Convolution, CrossCorrelation };

// Which of the three convolution kernels an algorithm choice applies to
enum class ConvDirection : uint8_t { Forward, BackwardFilter, BackwardData };

enum class ConvAlgo : uint8_t {
    Plain,         // "none"
    Precomputed,   // "small"
    Gemm,          // "large"
    Fft,           // "fft"
    Deterministic, // "deterministic", backward only
    GuessOnce,
    GuessOnShapeChange,
    TimeOnce,
    TimeOnShapeChange,
};

enum class PoolMode : uint8_t { Max, AverageIncludePad, AverageExcludePad };

enum class SoftmaxAlgo : uint8_t { Fast, Accurate, Log };

enum class SoftmaxMode : uint8_t { Channel, Instance };

// Caller hint steering the convolution entry point between its lowerings
enum class DirectionHint : uint8_t { Forward, BpropWeights, ForceForward };

// ============================================================================
// Padding policy
// ============================================================================

struct Padding {
    enum class Kind : uint8_t { Valid, Full, Uniform, Explicit };

    Kind kind = Kind::Valid;
    std::vector<int64_t> pads;

    static Padding valid() { return Padding{Kind::Valid, {}}; }
    static Padding full() { return Padding{Kind::Full, {}}; }
    // A single pad broadcast to every spatial dimension
    static Padding uniform(int64_t pad) { return Padding{Kind::Uniform, {pad}}; }
    static Padding explicit_pads(std::vector<int64_t> pads) {
        return Padding{Kind::Explicit, std::move(pads)};
    }

    bool is_valid() const { return kind == Kind::Valid; }
    bool is_full() const { return kind == Kind::Full; }

    bool operator==(const Padding &o) const {
        return kind == o.kind && pads == o.pads;
    }
    bool operator!=(const Padding &o) const { return !(*this == o); }

    std::string repr() const;
};

// Normalizes a padding policy against a stride tuple: Uniform is broadcast,
// Explicit must match in length and be non-negative. Valid and Full are
// returned unchanged.
Padding normalize_padding(const Padding &padding, size_t spatial_rank);

// Concrete per-dimension pads once the kernel spatial shape is known
std::vector<int64_t> resolve_pads(const Padding &padding,
                                  const std::vector<int64_t> &kernel_spatial);

// ============================================================================
// Names and parsing
// ============================================================================

std::string conv_mode_name(ConvMode mode);
ConvMode complement(ConvMode mode);

std::string conv_algo_name(ConvAlgo algo);
ConvAlgo parse_conv_algo(const std::string &name);

inline bool is_automatic(ConvAlgo algo) {
    return algo == ConvAlgo::GuessOnce || algo == ConvAlgo::GuessOnShapeChange ||
           algo == ConvAlgo::TimeOnce || algo == ConvAlgo::TimeOnShapeChange;
}

inline bool is_timed(ConvAlgo algo) {
    return algo == ConvAlgo::TimeOnce || algo == ConvAlgo::TimeOnShapeChange;
}

inline bool rechecks_on_shape_change(ConvAlgo algo) {
    return algo == ConvAlgo::GuessOnShapeChange ||
           algo == ConvAlgo::TimeOnShapeChange;
}

// Forward accepts none/small/large/fft; the backward kernels accept
// none/deterministic/fft. Automatic choices are valid for every direction.
bool supports_direction(ConvAlgo algo, ConvDirection direction);

std::string direction_name(ConvDirection direction);

std::string pool_mode_name(PoolMode mode);
// "average" is accepted as a legacy alias of average_inc_pad
PoolMode parse_pool_mode(const std::string &name);

std::string softmax_algo_name(SoftmaxAlgo algo);
std::string softmax_mode_name(SoftmaxMode mode);

std::string direction_hint_name(DirectionHint hint);

} // namespace dnn
} // namespace dnnlift
