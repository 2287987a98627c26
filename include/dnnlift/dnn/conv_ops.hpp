#pragma once

// Accelerated forward, weight-gradient and input-gradient convolution.
// All three share the input layout
//   (primary, secondary, output buffer, descriptor, alpha, beta)
// and compute output := alpha * op(primary, secondary) + beta * output.
//
//   DnnConv:       primary = image,  secondary = kernel
//   DnnConvGradW:  primary = image,  secondary = top gradient
//   DnnConvGradI:  primary = kernel, secondary = top gradient

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dnnlift/backends/availability_gate.hpp"
#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/graph/graph_node.hpp"

namespace dnnlift {
namespace dnn {

using graph::Datum;
using graph::ExecContext;
using graph::Node;
using graph::OpKind;
using graph::ValuePtr;
using graph::ValueType;

// Input positions shared by the three convolution kinds
inline constexpr size_t kConvPrimary = 0;
inline constexpr size_t kConvSecondary = 1;
inline constexpr size_t kConvOutput = 2;
inline constexpr size_t kConvDesc = 3;
inline constexpr size_t kConvAlpha = 4;
inline constexpr size_t kConvBeta = 5;

OpKind conv_kind(ConvDirection direction);
ConvDirection conv_direction(OpKind kind);

// ============================================================================
// Persisted operator state
// ============================================================================

inline constexpr int kConvStateSchemaVersion = 2;

// Stored form of a convolution operator. Schema 1 records only know the
// deprecated `workmem` field; schema 2 replaced it with `algo`.
struct ConvOpState {
    int schema_version = kConvStateSchemaVersion;
    std::optional<ConvAlgo> workmem;
    std::optional<ConvAlgo> algo;
    bool inplace = false;
};

// Upgrades `state` to the current schema. Throws ConfigurationError for
// unknown schema versions and for schema 2 records carrying `workmem`.
ConvOpState migrate_conv_state(const ConvOpState &state);

// ============================================================================
// DnnConvOp
// ============================================================================

// Algorithms of the convolutions a gradient request builds: `forward` for
// DnnConv nodes, `backward` for DnnConvGradW and DnnConvGradI nodes
struct GradientAlgos {
    ConvAlgo forward = ConvAlgo::Plain;
    ConvAlgo backward = ConvAlgo::Plain;
};

class DnnConvOp : public graph::Operator {
  public:
    // Throws ConfigurationError when `algo` is not valid for `direction`
    DnnConvOp(ConvDirection direction, ConvAlgo algo, bool inplace = false,
              GradientAlgos gradient_algos = {});

    // Without `algo` the configured default for the direction is used.
    // Fft and the automatic algorithms are checked against the gate's
    // version. Gradient algorithms are the configured defaults, or none
    // where the gate's version cannot run them.
    static std::shared_ptr<const DnnConvOp>
    create(const backends::AvailabilityGate &gate, ConvDirection direction,
           std::optional<ConvAlgo> algo = std::nullopt, bool inplace = false);

    static std::shared_ptr<const DnnConvOp>
    from_state(const backends::AvailabilityGate &gate,
               ConvDirection direction, const ConvOpState &state);

    static bool matches(OpKind k) { return graph::is_dnn_conv(k); }

    ConvDirection direction() const { return direction_; }
    ConvAlgo algo() const { return algo_; }
    bool inplace() const { return inplace_; }
    const GradientAlgos &gradient_algos() const { return gradient_algos_; }

    std::shared_ptr<const DnnConvOp> with_inplace(bool inplace) const;
    ConvOpState state() const;

    OpKind kind() const override { return conv_kind(direction_); }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<bool> connection_pattern(const Node &node) const override;
    graph::DestroyMap destroy_map() const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    ConvDirection direction_;
    ConvAlgo algo_;
    bool inplace_;
    GradientAlgos gradient_algos_;
};

// ============================================================================
// Builders
// ============================================================================

// Applies `op` to the six inputs. A null alpha (beta) becomes the constant
// 1 (0); constant single-element tensors are converted to scalars of the
// primary's dtype.
ValuePtr apply_conv(std::shared_ptr<const DnnConvOp> op,
                    const ValuePtr &primary, const ValuePtr &secondary,
                    const ValuePtr &output, const ValuePtr &desc,
                    const ValuePtr &alpha = nullptr,
                    const ValuePtr &beta = nullptr);

ValuePtr dnn_conv(const backends::AvailabilityGate &gate, const ValuePtr &img,
                  const ValuePtr &kern, const ValuePtr &output,
                  const ValuePtr &desc, const ValuePtr &alpha = nullptr,
                  const ValuePtr &beta = nullptr,
                  std::optional<ConvAlgo> algo = std::nullopt);

ValuePtr dnn_conv_grad_w(const backends::AvailabilityGate &gate,
                         const ValuePtr &img, const ValuePtr &top,
                         const ValuePtr &output, const ValuePtr &desc,
                         const ValuePtr &alpha = nullptr,
                         const ValuePtr &beta = nullptr,
                         std::optional<ConvAlgo> algo = std::nullopt);

ValuePtr dnn_conv_grad_i(const backends::AvailabilityGate &gate,
                         const ValuePtr &kern, const ValuePtr &top,
                         const ValuePtr &output, const ValuePtr &desc,
                         const ValuePtr &alpha = nullptr,
                         const ValuePtr &beta = nullptr,
                         std::optional<ConvAlgo> algo = std::nullopt);

} // namespace dnn
} // namespace dnnlift
