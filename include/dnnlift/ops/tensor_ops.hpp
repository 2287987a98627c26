#pragma once

// Generic tensor-layer operators the accelerated layer consumes: buffer
// management, shape arithmetic, layout changes and elementwise math.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/graph/graph_node.hpp"

namespace dnnlift {
namespace ops {

using graph::Datum;
using graph::ExecContext;
using graph::Node;
using graph::OpKind;
using graph::ValuePtr;
using graph::ValueType;

// ============================================================================
// Buffers and shapes
// ============================================================================

// Copy into a fresh dense buffer. Consumers that write into their operand
// in place rely on the copy never aliasing the source.
class Contiguous : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::Contiguous; }

    OpKind kind() const override { return OpKind::Contiguous; }
    std::string name() const override { return "Contiguous"; }
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;
};

// Uninitialized buffer of a given shape. The shape comes from a shape-vector
// input; when its contents are known statically they become the static dims.
class AllocEmpty : public graph::Operator {
  public:
    explicit AllocEmpty(DType dtype) : dtype_(dtype) {}

    static bool matches(OpKind k) { return k == OpKind::AllocEmpty; }

    DType dtype() const { return dtype_; }

    OpKind kind() const override { return OpKind::AllocEmpty; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    DType dtype_;
};

class ShapeOf : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::ShapeOf; }

    OpKind kind() const override { return OpKind::ShapeOf; }
    std::string name() const override { return "ShapeOf"; }
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;
};

// Shape arithmetic over (image shape, kernel shape) shape vectors.
//   Forward:         [N, O, floor((in + 2p - k) / s) + 1 ...]
//   WeightGradValid: [kern[1], img[1], in - k + 1 ...]
//   InputGradFull:   [img[0], kern[1], in + k - 1 ...]
class ConvOutputShape : public graph::Operator {
  public:
    enum class Rule : uint8_t { Forward, WeightGradValid, InputGradFull };

    ConvOutputShape(Rule rule, dnn::Padding padding,
                    std::vector<int64_t> strides);

    static bool matches(OpKind k) { return k == OpKind::ConvOutputShape; }

    Rule rule() const { return rule_; }
    const dnn::Padding &padding() const { return padding_; }
    const std::vector<int64_t> &strides() const { return strides_; }

    // Evaluates the rule on concrete shapes. Throws ShapeError when the
    // kernel does not fit the (padded) image.
    Shape apply_rule(const Shape &img, const Shape &kern) const;

    OpKind kind() const override { return OpKind::ConvOutputShape; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    Rule rule_;
    dnn::Padding padding_;
    std::vector<int64_t> strides_;
};

// ============================================================================
// Layout
// ============================================================================

// Axis permutation with broadcast-axis insertion (kBroadcastAxis) and
// dropping of size-1 axes.
class DimShuffle : public graph::Operator {
  public:
    static constexpr int64_t kBroadcastAxis = -1;

    explicit DimShuffle(std::vector<int64_t> pattern)
        : pattern_(std::move(pattern)) {}

    static bool matches(OpKind k) { return k == OpKind::DimShuffle; }

    const std::vector<int64_t> &pattern() const { return pattern_; }

    OpKind kind() const override { return OpKind::DimShuffle; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    std::vector<int64_t> pattern_;
};

// Reverses the listed axes
class Flip : public graph::Operator {
  public:
    explicit Flip(std::vector<int64_t> axes) : axes_(std::move(axes)) {}

    static bool matches(OpKind k) { return k == OpKind::Flip; }

    const std::vector<int64_t> &axes() const { return axes_; }

    OpKind kind() const override { return OpKind::Flip; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    std::vector<int64_t> axes_;
};

// ============================================================================
// Elementwise
// ============================================================================

// add, sub, mul, div (binary) and log, exp (unary) over floating tensors
// and scalars. Binary operands of equal rank broadcast along size-1 axes;
// a scalar operand broadcasts everywhere.
class Elemwise : public graph::Operator {
  public:
    explicit Elemwise(OpKind kind);

    static bool matches(OpKind k) { return graph::is_elementwise(k); }

    bool is_unary() const {
        return kind_ == OpKind::Log || kind_ == OpKind::Exp;
    }

    OpKind kind() const override { return kind_; }
    std::string name() const override;
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<ValuePtr>
    grad(const Node &node,
         const std::vector<ValuePtr> &output_grads) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    OpKind kind_;
};

// ============================================================================
// Gradient placeholder
// ============================================================================

// Stands in for a gradient nobody implemented. Building it is fine;
// evaluating it throws RuntimeError.
class GradUndefined : public graph::Operator {
  public:
    explicit GradUndefined(std::string reason) : reason_(std::move(reason)) {}

    static bool matches(OpKind k) { return k == OpKind::GradUndefined; }

    const std::string &reason() const { return reason_; }

    OpKind kind() const override { return OpKind::GradUndefined; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    std::string reason_;
};

// ============================================================================
// Builders
// ============================================================================

ValuePtr contiguous(const ValuePtr &x);
ValuePtr alloc_empty(DType dtype, const ValuePtr &shape);
// AllocEmpty with the dtype and shape of `like`
ValuePtr empty_like(const ValuePtr &like);
ValuePtr shape_of(const ValuePtr &x);
ValuePtr conv_output_shape(ConvOutputShape::Rule rule,
                           const dnn::Padding &padding,
                           const std::vector<int64_t> &strides,
                           const ValuePtr &img_shape,
                           const ValuePtr &kern_shape);
ValuePtr dimshuffle(const ValuePtr &x, std::vector<int64_t> pattern);
ValuePtr flip(const ValuePtr &x, std::vector<int64_t> axes);

ValuePtr add(const ValuePtr &a, const ValuePtr &b);
ValuePtr sub(const ValuePtr &a, const ValuePtr &b);
ValuePtr mul(const ValuePtr &a, const ValuePtr &b);
ValuePtr div(const ValuePtr &a, const ValuePtr &b);
ValuePtr log(const ValuePtr &x);
ValuePtr exp(const ValuePtr &x);

ValuePtr grad_undefined(const std::string &reason, const ValuePtr &like);

uint64_t hash_padding(uint64_t h, const dnn::Padding &padding);

} // namespace ops
} // namespace dnnlift
