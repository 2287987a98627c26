#include "dnnlift/ops/tensor_ops.hpp"
#include "backends/reference/host_kernels.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "op_checks.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace dnnlift {
namespace ops {

using detail::require_arity;
using detail::require_float_tensor;
using detail::require_shape_vector;
using detail::require_tensor;

namespace {

std::string join(const std::vector<int64_t> &v) {
    std::ostringstream oss;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0)
            oss << ",";
        oss << v[i];
    }
    return oss.str();
}

// Visits every multi-index of `dims` in row-major order together with its
// linear position
template <typename F> void for_each_index(const Shape &dims, F &&f) {
    size_t total = ShapeUtils::size(dims);
    std::vector<int64_t> idx(dims.size(), 0);
    for (size_t lin = 0; lin < total; ++lin) {
        f(idx, lin);
        for (int d = static_cast<int>(dims.size()) - 1; d >= 0; --d) {
            if (++idx[d] < dims[d])
                break;
            idx[d] = 0;
        }
    }
}

} // namespace

uint64_t hash_padding(uint64_t h, const dnn::Padding &padding) {
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(padding.kind));
    return graph::fnv_hash_dims(h, padding.pads);
}

// ============================================================================
// Contiguous
// ============================================================================

std::vector<ValueType>
Contiguous::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    return {require_tensor("Contiguous input", inputs[0])};
}

std::vector<ValuePtr>
Contiguous::grad(const Node &, const std::vector<ValuePtr> &output_grads) const {
    return {output_grads[0]};
}

std::vector<Datum> Contiguous::perform(const Node &,
                                       const std::vector<Datum> &inputs,
                                       ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "Contiguous input");
    return {std::make_shared<HostTensor>(*x)};
}

// ============================================================================
// AllocEmpty
// ============================================================================

std::string AllocEmpty::name() const {
    return "AllocEmpty{" + dtype_name(dtype_) + "}";
}

bool AllocEmpty::params_equal(const graph::Operator &other) const {
    return static_cast<const AllocEmpty &>(other).dtype_ == dtype_;
}

uint64_t AllocEmpty::hash_params(uint64_t h) const {
    return graph::fnv_hash_u64(h, static_cast<uint64_t>(dtype_));
}

std::vector<ValueType>
AllocEmpty::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    const auto &shape = require_shape_vector("AllocEmpty shape", inputs[0]);
    if (shape.contents)
        return {ValueType::tensor(dtype_, *shape.contents)};
    return {ValueType::tensor(dtype_, shape.shape_length())};
}

std::vector<Datum> AllocEmpty::perform(const Node &,
                                       const std::vector<Datum> &inputs,
                                       ExecContext &) const {
    const auto &shape = graph::datum_shape(inputs[0], "AllocEmpty shape");
    for (auto d : shape) {
        if (d < 0) {
            throw ShapeError("cannot allocate a buffer of shape " +
                             ShapeUtils::to_string(shape));
        }
    }
    return {HostTensor::zeros(dtype_, shape)};
}

// ============================================================================
// ShapeOf
// ============================================================================

std::vector<ValueType>
ShapeOf::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    const auto &t = require_tensor("ShapeOf input", inputs[0]);
    if (!ShapeUtils::is_fully_known(t.dims))
        return {ValueType::shape_vector(t.rank())};
    return {ValueType::shape_vector(t.rank(), t.dims)};
}

std::vector<Datum> ShapeOf::perform(const Node &,
                                    const std::vector<Datum> &inputs,
                                    ExecContext &) const {
    return {graph::datum_tensor(inputs[0], "ShapeOf input")->shape};
}

// ============================================================================
// ConvOutputShape
// ============================================================================

ConvOutputShape::ConvOutputShape(Rule rule, dnn::Padding padding,
                                 std::vector<int64_t> strides)
    : rule_(rule), strides_(std::move(strides)) {
    for (auto s : strides_) {
        if (s <= 0) {
            throw ConfigurationError::invalid_value(
                "subsample", join(strides_), "positive strides");
        }
    }
    padding_ = dnn::normalize_padding(padding, strides_.size());
}

Shape ConvOutputShape::apply_rule(const Shape &img, const Shape &kern) const {
    if (img.size() != kern.size())
        throw ShapeError::rank_mismatch("kernel shape", img.size(), kern.size());
    const size_t nd = img.size() - 2;
    if (strides_.size() != nd) {
        throw ConfigurationError::length_mismatch("subsample", nd,
                                                  strides_.size());
    }
    Shape img_sp(img.begin() + 2, img.end());
    Shape kern_sp(kern.begin() + 2, kern.end());

    Shape out;
    switch (rule_) {
    case Rule::Forward: {
        if (img[1] != kern[1]) {
            throw ShapeError("image has " + std::to_string(img[1]) +
                             " channels but the kernel expects " +
                             std::to_string(kern[1]));
        }
        out = {img[0], kern[0]};
        auto pads = dnn::resolve_pads(padding_, kern_sp);
        for (auto d :
             backends::host::conv_spatial_output(img_sp, kern_sp, pads, strides_))
            out.push_back(d);
        break;
    }
    case Rule::WeightGradValid:
        out = {kern[1], img[1]};
        for (size_t i = 0; i < nd; ++i) {
            if (kern_sp[i] > img_sp[i]) {
                throw ShapeError("gradient extent " + std::to_string(kern_sp[i]) +
                                 " exceeds image extent " +
                                 std::to_string(img_sp[i]));
            }
            out.push_back(img_sp[i] - kern_sp[i] + 1);
        }
        break;
    case Rule::InputGradFull:
        out = {img[0], kern[1]};
        for (size_t i = 0; i < nd; ++i)
            out.push_back(img_sp[i] + kern_sp[i] - 1);
        break;
    }
    return out;
}

std::string ConvOutputShape::name() const {
    static const char *rules[] = {"forward", "weight_grad_valid",
                                  "input_grad_full"};
    return std::string("ConvOutputShape{") +
           rules[static_cast<size_t>(rule_)] + ", " + padding_.repr() +
           ", subsample=(" + join(strides_) + ")}";
}

bool ConvOutputShape::params_equal(const graph::Operator &other) const {
    const auto &o = static_cast<const ConvOutputShape &>(other);
    return rule_ == o.rule_ && padding_ == o.padding_ && strides_ == o.strides_;
}

uint64_t ConvOutputShape::hash_params(uint64_t h) const {
    h = graph::fnv_hash_u64(h, static_cast<uint64_t>(rule_));
    h = hash_padding(h, padding_);
    return graph::fnv_hash_dims(h, strides_);
}

std::vector<ValueType>
ConvOutputShape::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 2);
    const auto &img = require_shape_vector("image shape", inputs[0]);
    const auto &kern = require_shape_vector("kernel shape", inputs[1]);
    size_t len = img.shape_length();
    if (len != 4 && len != 5)
        throw ShapeError::unsupported_rank("convolution", len);
    if (kern.shape_length() != len)
        throw ShapeError::rank_mismatch("kernel shape", len,
                                        kern.shape_length());
    if (strides_.size() != len - 2) {
        throw ConfigurationError::length_mismatch("subsample", len - 2,
                                                  strides_.size());
    }
    if (img.contents && kern.contents)
        return {ValueType::shape_vector(len,
                                        apply_rule(*img.contents, *kern.contents))};
    return {ValueType::shape_vector(len)};
}

std::vector<Datum> ConvOutputShape::perform(const Node &,
                                            const std::vector<Datum> &inputs,
                                            ExecContext &) const {
    return {apply_rule(graph::datum_shape(inputs[0], "image shape"),
                       graph::datum_shape(inputs[1], "kernel shape"))};
}

// ============================================================================
// DimShuffle
// ============================================================================

std::string DimShuffle::name() const {
    std::ostringstream oss;
    oss << "DimShuffle{";
    for (size_t i = 0; i < pattern_.size(); ++i) {
        if (i > 0)
            oss << ",";
        if (pattern_[i] == kBroadcastAxis)
            oss << "x";
        else
            oss << pattern_[i];
    }
    oss << "}";
    return oss.str();
}

bool DimShuffle::params_equal(const graph::Operator &other) const {
    return static_cast<const DimShuffle &>(other).pattern_ == pattern_;
}

uint64_t DimShuffle::hash_params(uint64_t h) const {
    return graph::fnv_hash_dims(h, pattern_);
}

std::vector<ValueType>
DimShuffle::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    const auto &t = require_tensor("DimShuffle input", inputs[0]);
    const size_t rank = t.rank();

    std::vector<bool> kept(rank, false);
    Shape dims;
    for (auto axis : pattern_) {
        if (axis == kBroadcastAxis) {
            dims.push_back(1);
            continue;
        }
        if (axis < 0 || axis >= static_cast<int64_t>(rank))
            throw ShapeError::invalid_axis(static_cast<int>(axis), rank);
        if (kept[axis]) {
            throw ShapeError("DimShuffle pattern repeats axis " +
                             std::to_string(axis));
        }
        kept[axis] = true;
        dims.push_back(t.dims[axis]);
    }
    for (size_t i = 0; i < rank; ++i) {
        if (!kept[i] && t.dims[i] != 1 && t.dims[i] != kUnknownDim) {
            throw ShapeError("DimShuffle cannot drop axis " + std::to_string(i) +
                             " of size " + std::to_string(t.dims[i]));
        }
    }
    return {ValueType::tensor(t.dtype, dims)};
}

std::vector<ValuePtr>
DimShuffle::grad(const Node &node,
                 const std::vector<ValuePtr> &output_grads) const {
    const size_t rank = node.input(0)->type().rank();
    std::vector<int64_t> inverse(rank, kBroadcastAxis);
    for (size_t j = 0; j < pattern_.size(); ++j) {
        if (pattern_[j] != kBroadcastAxis)
            inverse[pattern_[j]] = static_cast<int64_t>(j);
    }
    return {dimshuffle(output_grads[0], inverse)};
}

std::vector<Datum> DimShuffle::perform(const Node &,
                                       const std::vector<Datum> &inputs,
                                       ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "DimShuffle input");
    std::vector<bool> kept(x->ndim(), false);
    Shape out_shape;
    for (auto axis : pattern_) {
        if (axis == kBroadcastAxis) {
            out_shape.push_back(1);
        } else {
            kept[axis] = true;
            out_shape.push_back(x->shape[axis]);
        }
    }
    for (size_t i = 0; i < x->ndim(); ++i) {
        if (!kept[i] && x->shape[i] != 1) {
            throw ShapeError("DimShuffle cannot drop axis " + std::to_string(i) +
                             " of size " + std::to_string(x->shape[i]));
        }
    }

    auto in_strides = ShapeUtils::calculate_strides(x->shape);
    auto out = std::make_shared<HostTensor>(x->dtype, out_shape);
    for_each_index(out_shape, [&](const std::vector<int64_t> &idx, size_t lin) {
        int64_t off = 0;
        for (size_t j = 0; j < pattern_.size(); ++j) {
            if (pattern_[j] != kBroadcastAxis)
                off += idx[j] * in_strides[pattern_[j]];
        }
        out->data[lin] = x->data[off];
    });
    return {out};
}

// ============================================================================
// Flip
// ============================================================================

std::string Flip::name() const { return "Flip{" + join(axes_) + "}"; }

bool Flip::params_equal(const graph::Operator &other) const {
    return static_cast<const Flip &>(other).axes_ == axes_;
}

uint64_t Flip::hash_params(uint64_t h) const {
    return graph::fnv_hash_dims(h, axes_);
}

std::vector<ValueType>
Flip::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    const auto &t = require_tensor("Flip input", inputs[0]);
    for (auto axis : axes_) {
        if (axis < 0 || axis >= static_cast<int64_t>(t.rank()))
            throw ShapeError::invalid_axis(static_cast<int>(axis), t.rank());
    }
    return {t};
}

std::vector<ValuePtr>
Flip::grad(const Node &, const std::vector<ValuePtr> &output_grads) const {
    return {flip(output_grads[0], axes_)};
}

std::vector<Datum> Flip::perform(const Node &, const std::vector<Datum> &inputs,
                                 ExecContext &) const {
    const auto &x = graph::datum_tensor(inputs[0], "Flip input");
    std::vector<bool> flipped(x->ndim(), false);
    for (auto axis : axes_)
        flipped[axis] = true;

    auto strides = ShapeUtils::calculate_strides(x->shape);
    auto out = std::make_shared<HostTensor>(x->dtype, x->shape);
    for_each_index(x->shape, [&](const std::vector<int64_t> &idx, size_t lin) {
        int64_t off = 0;
        for (size_t d = 0; d < idx.size(); ++d) {
            int64_t i = flipped[d] ? x->shape[d] - 1 - idx[d] : idx[d];
            off += i * strides[d];
        }
        out->data[lin] = x->data[off];
    });
    return {out};
}

// ============================================================================
// Elemwise
// ============================================================================

Elemwise::Elemwise(OpKind kind) : kind_(kind) {
    if (!graph::is_elementwise(kind)) {
        throw RuntimeError::internal(graph::op_kind_name(kind) +
                                     " is not an elementwise kind");
    }
}

std::string Elemwise::name() const { return graph::op_kind_name(kind_); }

std::vector<ValueType>
Elemwise::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, is_unary() ? 1 : 2);

    for (const auto &in : inputs) {
        const auto &t = in->type();
        if (!t.is_tensor() && !t.is_scalar()) {
            throw TypeError::kind_mismatch(name() + " operand",
                                           "a tensor or a scalar",
                                           detail::kind_name(t));
        }
        if (!is_floating(t.dtype))
            throw TypeError::unsupported_dtype(dtype_name(t.dtype), name());
    }
    if (is_unary())
        return {inputs[0]->type()};

    const auto &a = inputs[0]->type();
    const auto &b = inputs[1]->type();
    if (a.is_scalar() && b.is_scalar())
        return {a};
    if (a.is_scalar())
        return {b};
    if (b.is_scalar())
        return {a};

    if (a.dtype != b.dtype)
        throw TypeError::dtype_mismatch(dtype_name(a.dtype), dtype_name(b.dtype));
    if (a.rank() != b.rank())
        throw ShapeError::rank_mismatch(name() + " operand", a.rank(), b.rank());

    Shape dims(a.rank());
    for (size_t i = 0; i < a.rank(); ++i) {
        int64_t da = a.dims[i], db = b.dims[i];
        if (da == db || db == 1)
            dims[i] = da;
        else if (da == 1)
            dims[i] = db;
        else if (da == kUnknownDim || db == kUnknownDim)
            dims[i] = da == kUnknownDim ? db : da;
        else
            throw ShapeError::mismatch(a.dims, b.dims);
    }
    return {ValueType::tensor(a.dtype, dims)};
}

std::vector<ValuePtr>
Elemwise::grad(const Node &node,
               const std::vector<ValuePtr> &output_grads) const {
    const auto &g = output_grads[0];
    const auto out = node.output(0);
    const auto &a = node.input(0);

    // Operands that were broadcast would need a reduction we do not have
    auto fits = [&](const ValuePtr &operand) {
        return operand->type().kind == out->type().kind &&
               operand->type().dims == out->type().dims;
    };
    auto undefined = [&](const ValuePtr &operand) {
        return grad_undefined("gradient of a broadcast operand of " + name(),
                              operand);
    };

    switch (kind_) {
    case OpKind::Log:
        return {div(g, a)};
    case OpKind::Exp:
        return {mul(g, out)};
    default:
        break;
    }

    const auto &b = node.input(1);
    auto minus_one = graph::constant_scalar(-1.0, g->type().dtype);
    ValuePtr ga, gb;
    switch (kind_) {
    case OpKind::Add:
        ga = fits(a) ? g : undefined(a);
        gb = fits(b) ? g : undefined(b);
        break;
    case OpKind::Sub:
        ga = fits(a) ? g : undefined(a);
        gb = fits(b) ? mul(g, minus_one) : undefined(b);
        break;
    case OpKind::Mul:
        ga = fits(a) ? mul(g, b) : undefined(a);
        gb = fits(b) ? mul(g, a) : undefined(b);
        break;
    case OpKind::Div:
        ga = fits(a) ? div(g, b) : undefined(a);
        gb = fits(b) ? mul(div(mul(g, a), mul(b, b)), minus_one) : undefined(b);
        break;
    default:
        throw RuntimeError::internal("unhandled elementwise kind " + name());
    }
    return {ga, gb};
}

namespace {

double apply_binary(OpKind kind, double x, double y) {
    switch (kind) {
    case OpKind::Add:
        return x + y;
    case OpKind::Sub:
        return x - y;
    case OpKind::Mul:
        return x * y;
    case OpKind::Div:
        return x / y;
    default:
        throw RuntimeError::internal("not a binary elementwise kind");
    }
}

double apply_unary(OpKind kind, double x) {
    return kind == OpKind::Log ? std::log(x) : std::exp(x);
}

// Row-major strides with zeros on broadcast axes
Shape broadcast_strides(const Shape &shape, const Shape &out_shape) {
    auto strides = ShapeUtils::calculate_strides(shape);
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == 1 && out_shape[i] != 1)
            strides[i] = 0;
    }
    return strides;
}

} // namespace

std::vector<Datum> Elemwise::perform(const Node &,
                                     const std::vector<Datum> &inputs,
                                     ExecContext &) const {
    const std::string what = name() + " operand";

    if (is_unary()) {
        if (const auto *s = std::get_if<double>(&inputs[0]))
            return {apply_unary(kind_, *s)};
        const auto &x = graph::datum_tensor(inputs[0], what);
        auto out = std::make_shared<HostTensor>(x->dtype, x->shape);
        std::transform(x->data.begin(), x->data.end(), out->data.begin(),
                       [&](double v) { return apply_unary(kind_, v); });
        return {out};
    }

    const auto *sa = std::get_if<double>(&inputs[0]);
    const auto *sb = std::get_if<double>(&inputs[1]);
    if (sa && sb)
        return {apply_binary(kind_, *sa, *sb)};

    if (sa || sb) {
        const auto &t = graph::datum_tensor(inputs[sa ? 1 : 0], what);
        double s = sa ? *sa : *sb;
        auto out = std::make_shared<HostTensor>(t->dtype, t->shape);
        for (size_t i = 0; i < t->size(); ++i) {
            out->data[i] = sa ? apply_binary(kind_, s, t->data[i])
                              : apply_binary(kind_, t->data[i], s);
        }
        return {out};
    }

    const auto &a = graph::datum_tensor(inputs[0], what);
    const auto &b = graph::datum_tensor(inputs[1], what);
    if (a->ndim() != b->ndim())
        throw ShapeError::rank_mismatch(what, a->ndim(), b->ndim());

    Shape out_shape(a->ndim());
    for (size_t i = 0; i < a->ndim(); ++i) {
        int64_t da = a->shape[i], db = b->shape[i];
        if (da != db && da != 1 && db != 1)
            throw ShapeError::mismatch(a->shape, b->shape);
        out_shape[i] = da == 1 ? db : da;
    }

    auto sa_strides = broadcast_strides(a->shape, out_shape);
    auto sb_strides = broadcast_strides(b->shape, out_shape);
    auto out = std::make_shared<HostTensor>(a->dtype, out_shape);
    for_each_index(out_shape, [&](const std::vector<int64_t> &idx, size_t lin) {
        int64_t oa = 0, ob = 0;
        for (size_t d = 0; d < idx.size(); ++d) {
            oa += idx[d] * sa_strides[d];
            ob += idx[d] * sb_strides[d];
        }
        out->data[lin] = apply_binary(kind_, a->data[oa], b->data[ob]);
    });
    return {out};
}

// ============================================================================
// GradUndefined
// ============================================================================

std::string GradUndefined::name() const {
    return "GradUndefined{" + reason_ + "}";
}

bool GradUndefined::params_equal(const graph::Operator &other) const {
    return static_cast<const GradUndefined &>(other).reason_ == reason_;
}

uint64_t GradUndefined::hash_params(uint64_t h) const {
    return graph::fnv_hash_string(h, reason_);
}

std::vector<ValueType>
GradUndefined::make_outputs(const std::vector<ValuePtr> &inputs) const {
    require_arity(name(), inputs, 1);
    return {inputs[0]->type()};
}

std::vector<Datum> GradUndefined::perform(const Node &,
                                          const std::vector<Datum> &,
                                          ExecContext &) const {
    throw RuntimeError::not_implemented(reason_);
}

// ============================================================================
// Builders
// ============================================================================

ValuePtr contiguous(const ValuePtr &x) {
    return graph::apply(std::make_shared<const Contiguous>(), {x});
}

ValuePtr alloc_empty(DType dtype, const ValuePtr &shape) {
    return graph::apply(std::make_shared<const AllocEmpty>(dtype), {shape});
}

ValuePtr empty_like(const ValuePtr &like) {
    const auto &t = require_tensor("empty_like argument", like);
    if (ShapeUtils::is_fully_known(t.dims))
        return alloc_empty(t.dtype, graph::constant_shape(t.dims));
    return alloc_empty(t.dtype, shape_of(like));
}

ValuePtr shape_of(const ValuePtr &x) {
    return graph::apply(std::make_shared<const ShapeOf>(), {x});
}

ValuePtr conv_output_shape(ConvOutputShape::Rule rule,
                           const dnn::Padding &padding,
                           const std::vector<int64_t> &strides,
                           const ValuePtr &img_shape,
                           const ValuePtr &kern_shape) {
    return graph::apply(
        std::make_shared<const ConvOutputShape>(rule, padding, strides),
        {img_shape, kern_shape});
}

ValuePtr dimshuffle(const ValuePtr &x, std::vector<int64_t> pattern) {
    return graph::apply(std::make_shared<const DimShuffle>(std::move(pattern)),
                        {x});
}

ValuePtr flip(const ValuePtr &x, std::vector<int64_t> axes) {
    return graph::apply(std::make_shared<const Flip>(std::move(axes)), {x});
}

ValuePtr add(const ValuePtr &a, const ValuePtr &b) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Add), {a, b});
}

ValuePtr sub(const ValuePtr &a, const ValuePtr &b) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Sub), {a, b});
}

ValuePtr mul(const ValuePtr &a, const ValuePtr &b) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Mul), {a, b});
}

ValuePtr div(const ValuePtr &a, const ValuePtr &b) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Div), {a, b});
}

ValuePtr log(const ValuePtr &x) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Log), {x});
}

ValuePtr exp(const ValuePtr &x) {
    return graph::apply(std::make_shared<const Elemwise>(OpKind::Exp), {x});
}

ValuePtr grad_undefined(const std::string &reason, const ValuePtr &like) {
    return graph::apply(std::make_shared<const GradUndefined>(reason), {like});
}

} // namespace ops
} // namespace dnnlift
