#pragma once

// Generic (unaccelerated) convolution, pooling and softmax. These are what
// user graphs are written in; the lifting rules replace them with the
// accelerated operators.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/ops/tensor_ops.hpp"

namespace dnnlift {
namespace ops {

// ============================================================================
// Convolution
// ============================================================================

struct ConvParams {
    dnn::Padding border = dnn::Padding::valid();
    std::vector<int64_t> subsample; // empty: all ones
    bool filter_flip = true;        // true: convolution, false: correlation
    dnn::DirectionHint hint = dnn::DirectionHint::Forward;

    bool operator==(const ConvParams &o) const {
        return border == o.border && subsample == o.subsample &&
               filter_flip == o.filter_flip && hint == o.hint;
    }
};

class Conv : public graph::Operator {
  public:
    explicit Conv(ConvParams params) : params_(std::move(params)) {}

    static bool matches(OpKind k) { return k == OpKind::Conv; }

    const ConvParams &params() const { return params_; }

    // Subsample tuple expanded to `spatial_rank` entries
    std::vector<int64_t> strides(size_t spatial_rank) const;

    OpKind kind() const override { return OpKind::Conv; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    ConvParams params_;
};

// ============================================================================
// Pooling
// ============================================================================

struct PoolParams {
    std::vector<int64_t> window;
    std::vector<int64_t> strides; // empty: same as window
    std::vector<int64_t> pads;    // empty: zeros
    dnn::PoolMode mode = dnn::PoolMode::Max;
    bool ignore_border = true;

    bool operator==(const PoolParams &o) const {
        return window == o.window && strides == o.strides && pads == o.pads &&
               mode == o.mode && ignore_border == o.ignore_border;
    }

    std::vector<int64_t> resolved_strides() const;
    std::vector<int64_t> resolved_pads() const;
    std::string repr() const;
};

uint64_t hash_pool_params(uint64_t h, const PoolParams &p);

class Pool : public graph::Operator {
  public:
    explicit Pool(PoolParams params);

    static bool matches(OpKind k) { return k == OpKind::Pool; }

    const PoolParams &params() const { return params_; }

    OpKind kind() const override { return OpKind::Pool; }
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
    PoolParams params_;
};

// (x, pool(x), g) -> dx for max pooling
class MaxPoolGrad : public graph::Operator {
  public:
    explicit MaxPoolGrad(PoolParams params) : params_(std::move(params)) {}

    static bool matches(OpKind k) { return k == OpKind::MaxPoolGrad; }

    const PoolParams &params() const { return params_; }

    OpKind kind() const override { return OpKind::MaxPoolGrad; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    PoolParams params_;
};

// (x, g) -> dx for average pooling
class AveragePoolGrad : public graph::Operator {
  public:
    explicit AveragePoolGrad(PoolParams params) : params_(std::move(params)) {}

    static bool matches(OpKind k) { return k == OpKind::AveragePoolGrad; }

    const PoolParams &params() const { return params_; }

    OpKind kind() const override { return OpKind::AveragePoolGrad; }
    std::string name() const override;
    bool params_equal(const graph::Operator &other) const override;
    uint64_t hash_params(uint64_t h) const override;

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;

  private:
    PoolParams params_;
};

// ============================================================================
// Softmax over the rows of a matrix
// ============================================================================

class Softmax : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::Softmax; }

    OpKind kind() const override { return OpKind::Softmax; }
    std::string name() const override { return "Softmax"; }
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

// (dy, softmax(x)) -> dx
class SoftmaxGrad : public graph::Operator {
  public:
    static bool matches(OpKind k) { return k == OpKind::SoftmaxGrad; }

    OpKind kind() const override { return OpKind::SoftmaxGrad; }
    std::string name() const override { return "SoftmaxGrad"; }
    bool params_equal(const graph::Operator &) const override { return true; }
    uint64_t hash_params(uint64_t h) const override { return h; }

    std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const override;
    std::vector<Datum> perform(const Node &node,
                               const std::vector<Datum> &inputs,
                               ExecContext &ctx) const override;
};

// ============================================================================
// Builders
// ============================================================================

ValuePtr conv(const ValuePtr &img, const ValuePtr &kern, ConvParams params);
ValuePtr pool(const ValuePtr &x, PoolParams params);
ValuePtr max_pool_grad(const ValuePtr &x, const ValuePtr &out,
                       const ValuePtr &g, PoolParams params);
ValuePtr average_pool_grad(const ValuePtr &x, const ValuePtr &g,
                           PoolParams params);
ValuePtr softmax(const ValuePtr &x);
ValuePtr softmax_grad(const ValuePtr &dy, const ValuePtr &sm);

} // namespace ops
} // namespace dnnlift
