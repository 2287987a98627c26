#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/error.hpp"

#include <sstream>

namespace dnnlift {
namespace dnn {

std::string Padding::repr() const {
    switch (kind) {
    case Kind::Valid:
        return "valid";
    case Kind::Full:
        return "full";
    case Kind::Uniform:
    case Kind::Explicit: {
        std::ostringstream oss;
        oss << "(";
        for (size_t i = 0; i < pads.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << pads[i];
        }
        oss << ")";
        return oss.str();
    }
    }
    return "?";
}

Padding normalize_padding(const Padding &padding, size_t spatial_rank) {
    switch (padding.kind) {
    case Padding::Kind::Valid:
    case Padding::Kind::Full:
        return padding;
    case Padding::Kind::Uniform: {
        if (padding.pads.size() != 1) {
            throw ConfigurationError::length_mismatch("border_mode", 1,
                                                      padding.pads.size());
        }
        if (padding.pads[0] < 0) {
            throw ConfigurationError::invalid_value(
                "border_mode", std::to_string(padding.pads[0]),
                "a non-negative pad");
        }
        return Padding::explicit_pads(
            std::vector<int64_t>(spatial_rank, padding.pads[0]));
    }
    case Padding::Kind::Explicit: {
        if (padding.pads.size() != spatial_rank) {
            throw ConfigurationError::length_mismatch(
                "border_mode", spatial_rank, padding.pads.size());
        }
        for (auto p : padding.pads) {
            if (p < 0) {
                throw ConfigurationError::invalid_value(
                    "border_mode", padding.repr(),
                    "non-negative pads in every dimension");
            }
        }
        return padding;
    }
    }
    return padding;
}

std::vector<int64_t> resolve_pads(const Padding &padding,
                                  const std::vector<int64_t> &kernel_spatial) {
    switch (padding.kind) {
    case Padding::Kind::Valid:
        return std::vector<int64_t>(kernel_spatial.size(), 0);
    case Padding::Kind::Full: {
        std::vector<int64_t> pads(kernel_spatial.size());
        for (size_t i = 0; i < kernel_spatial.size(); ++i)
            pads[i] = kernel_spatial[i] - 1;
        return pads;
    }
    case Padding::Kind::Uniform:
        return std::vector<int64_t>(kernel_spatial.size(), padding.pads.at(0));
    case Padding::Kind::Explicit:
        return padding.pads;
    }
    return {};
}

std::string conv_mode_name(ConvMode mode) {
    return mode == ConvMode::Convolution ? "conv" : "cross";
}

ConvMode complement(ConvMode mode) {
    return mode == ConvMode::Convolution ? ConvMode::CrossCorrelation
                                         : ConvMode::Convolution;
}

std::string conv_algo_name(ConvAlgo algo) {
    switch (algo) {
    case ConvAlgo::Plain:
        return "none";
    case ConvAlgo::Precomputed:
        return "small";
    case ConvAlgo::Gemm:
        return "large";
    case ConvAlgo::Fft:
        return "fft";
    case ConvAlgo::Deterministic:
        return "deterministic";
    case ConvAlgo::GuessOnce:
        return "guess_once";
    case ConvAlgo::GuessOnShapeChange:
        return "guess_on_shape_change";
    case ConvAlgo::TimeOnce:
        return "time_once";
    case ConvAlgo::TimeOnShapeChange:
        return "time_on_shape_change";
    }
    return "unknown";
}

ConvAlgo parse_conv_algo(const std::string &name) {
    static const ConvAlgo all[] = {
        ConvAlgo::Plain,         ConvAlgo::Precomputed,
        ConvAlgo::Gemm,          ConvAlgo::Fft,
        ConvAlgo::Deterministic, ConvAlgo::GuessOnce,
        ConvAlgo::GuessOnShapeChange, ConvAlgo::TimeOnce,
        ConvAlgo::TimeOnShapeChange};
    for (auto algo : all) {
        if (conv_algo_name(algo) == name)
            return algo;
    }
    throw ConfigurationError::invalid_value(
        "algo", name,
        "one of none, small, large, fft, deterministic, guess_once, "
        "guess_on_shape_change, time_once, time_on_shape_change");
}

bool supports_direction(ConvAlgo algo, ConvDirection direction) {
    if (is_automatic(algo) || algo == ConvAlgo::Plain || algo == ConvAlgo::Fft)
        return true;
    if (direction == ConvDirection::Forward)
        return algo == ConvAlgo::Precomputed || algo == ConvAlgo::Gemm;
    return algo == ConvAlgo::Deterministic;
}

std::string direction_name(ConvDirection direction) {
    switch (direction) {
    case ConvDirection::Forward:
        return "forward";
    case ConvDirection::BackwardFilter:
        return "backward filter";
    case ConvDirection::BackwardData:
        return "backward data";
    }
    return "unknown";
}

std::string pool_mode_name(PoolMode mode) {
    switch (mode) {
    case PoolMode::Max:
        return "max";
    case PoolMode::AverageIncludePad:
        return "average_inc_pad";
    case PoolMode::AverageExcludePad:
        return "average_exc_pad";
    }
    return "unknown";
}

PoolMode parse_pool_mode(const std::string &name) {
    if (name == "max")
        return PoolMode::Max;
    if (name == "average_inc_pad" || name == "average")
        return PoolMode::AverageIncludePad;
    if (name == "average_exc_pad")
        return PoolMode::AverageExcludePad;
    throw ConfigurationError::invalid_value(
        "mode", name, "one of max, average_inc_pad, average_exc_pad");
}

std::string softmax_algo_name(SoftmaxAlgo algo) {
    switch (algo) {
    case SoftmaxAlgo::Fast:
        return "fast";
    case SoftmaxAlgo::Accurate:
        return "accurate";
    case SoftmaxAlgo::Log:
        return "log";
    }
    return "unknown";
}

std::string softmax_mode_name(SoftmaxMode mode) {
    return mode == SoftmaxMode::Channel ? "channel" : "instance";
}

std::string direction_hint_name(DirectionHint hint) {
    switch (hint) {
    case DirectionHint::Forward:
        return "forward";
    case DirectionHint::BpropWeights:
        return "bprop weights";
    case DirectionHint::ForceForward:
        return "forward!";
    }
    return "unknown";
}

} // namespace dnn
} // namespace dnnlift
