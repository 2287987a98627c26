#pragma once

// Graph operators producing the native configuration handles the
// accelerated convolution and pooling kernels consume. Neither is ever
// constant folded: the handle only exists inside an execution.

#include <cstdint>
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

// ============================================================================
// Convolution descriptor
// ============================================================================

// DnnConvDesc(padding, strides, mode)(kernel_shape). The kernel shape is
// needed because "full" padding resolves to kernel extent - 1.
class ConvDescriptor : public graph::Operator {
  public:
    // Validates the tuples. Throws ConfigurationError.
    ConvDescriptor(Padding padding, std::vector<int64_t> strides,
                   ConvMode mode);

    // Also checks the gate: 3 spatial dimensions need the N-d descriptor
    // feature level.
    static std::shared_ptr<const ConvDescriptor>
    create(const backends::AvailabilityGate &gate, Padding padding,
           std::vector<int64_t> strides, ConvMode mode);

    static bool matches(OpKind k) { return k == OpKind::DnnConvDesc; }

    const Padding &padding() const { return padding_; }
    const std::vector<int64_t> &strides() const { return strides_; }
    ConvMode mode() const { return mode_; }
    size_t spatial_rank() const { return strides_.size(); }

    OpKind kind() const override { return OpKind::DnnConvDesc; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    Padding padding_;
    std::vector<int64_t> strides_;
    ConvMode mode_;
};

// ============================================================================
// Pooling descriptor
// ============================================================================

inline constexpr int kPoolStateSchemaVersion = 2;

// Stored form of a pooling descriptor. Schema 1 records may lack `pads`.
struct PoolDescState {
    int schema_version = kPoolStateSchemaVersion;
    std::vector<int64_t> window;
    std::vector<int64_t> strides;
    std::optional<std::vector<int64_t>> pads;
    PoolMode mode = PoolMode::Max;
};

// Upgrades `state` to the current schema; a schema 1 record without pads
// gets zero pads of the window length. Throws ConfigurationError for
// unknown schema versions and for schema 2 records without pads.
PoolDescState migrate_pool_state(const PoolDescState &state);

// DnnPoolDesc(window, strides, pads, mode)(), no inputs
class PoolDescriptor : public graph::Operator {
  public:
    PoolDescriptor(std::vector<int64_t> window, std::vector<int64_t> strides,
                   std::vector<int64_t> pads, PoolMode mode);

    static std::shared_ptr<const PoolDescriptor>
    create(const backends::AvailabilityGate &gate, std::vector<int64_t> window,
           std::vector<int64_t> strides, std::vector<int64_t> pads,
           PoolMode mode);

    static std::shared_ptr<const PoolDescriptor>
    from_state(const backends::AvailabilityGate &gate,
               const PoolDescState &state);

    static bool matches(OpKind k) { return k == OpKind::DnnPoolDesc; }

    const std::vector<int64_t> &window() const { return window_; }
    const std::vector<int64_t> &strides() const { return strides_; }
    const std::vector<int64_t> &pads() const { return pads_; }
    PoolMode mode() const { return mode_; }
    size_t spatial_rank() const { return window_.size(); }
    PoolDescState state() const;

    // Output dims of pooling an input of static dims `input`
    Shape output_dims(const Shape &input) const;

    OpKind kind() const override { return OpKind::DnnPoolDesc; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    std::vector<int64_t> window_;
    std::vector<int64_t> strides_;
    std::vector<int64_t> pads_;
    PoolMode mode_;
};

// Descriptor operator that produced `desc`, or null when `desc` is a free
// input of descriptor type
const ConvDescriptor *conv_descriptor_of(const ValuePtr &desc);
const PoolDescriptor *pool_descriptor_of(const ValuePtr &desc);

// ============================================================================
// Builders
// ============================================================================

ValuePtr conv_descriptor(const backends::AvailabilityGate &gate,
                         const Padding &padding,
                         const std::vector<int64_t> &strides, ConvMode mode,
                         const ValuePtr &kernel_shape);

ValuePtr pool_descriptor(const backends::AvailabilityGate &gate,
                         const std::vector<int64_t> &window,
                         const std::vector<int64_t> &strides,
                         const std::vector<int64_t> &pads, PoolMode mode);

// Output shape of a convolution from static image and kernel shapes:
// out[i] = floor((in[i] + 2p[i] - k[i]) / s[i]) + 1, batch and output
// channels passed through
Shape conv_output_shape(const Shape &image, const Shape &kernel,
                        const Padding &padding,
                        const std::vector<int64_t> &strides);

} // namespace dnn
} // namespace dnnlift
