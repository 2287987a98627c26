#include "dnnlift/graph/value.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/graph_node.hpp"

#include <sstream>

namespace dnnlift {
namespace graph {

// ============================================================================
// ValueType
// ============================================================================

ValueType ValueType::tensor(DType dtype, size_t rank) {
    return tensor(dtype, Shape(rank, kUnknownDim));
}

ValueType ValueType::tensor(DType dtype, Shape dims) {
    ValueType t;
    t.kind = ValueKind::Tensor;
    t.dtype = dtype;
    t.dims = std::move(dims);
    return t;
}

ValueType ValueType::scalar(DType dtype) {
    ValueType t;
    t.kind = ValueKind::Scalar;
    t.dtype = dtype;
    return t;
}

ValueType ValueType::shape_vector(size_t length, std::optional<Shape> contents) {
    ValueType t;
    t.kind = ValueKind::ShapeVector;
    t.dtype = DType::Int64;
    t.dims = {static_cast<int64_t>(length)};
    if (contents && contents->size() == length &&
        ShapeUtils::is_fully_known(*contents))
        t.contents = std::move(contents);
    return t;
}

ValueType ValueType::opaque(std::string native_type) {
    ValueType t;
    t.kind = ValueKind::Opaque;
    t.dtype = DType::Int64;
    t.native_type = std::move(native_type);
    return t;
}

std::string ValueType::repr() const {
    switch (kind) {
    case ValueKind::Tensor:
        return "Tensor<" + dtype_name(dtype) + ", " +
               ShapeUtils::to_string(dims) + ">";
    case ValueKind::Scalar:
        return "Scalar<" + dtype_name(dtype) + ">";
    case ValueKind::ShapeVector:
        if (contents)
            return "Shape" + ShapeUtils::to_string(*contents);
        return "Shape<" + std::to_string(shape_length()) + ">";
    case ValueKind::Opaque:
        return "Opaque<" + native_type + ">";
    }
    return "?";
}

bool is_compatible(const ValueType &a, const ValueType &b) {
    if (a.kind != b.kind || a.dtype != b.dtype)
        return false;
    switch (a.kind) {
    case ValueKind::Tensor:
        return ShapeUtils::compatible(a.dims, b.dims);
    case ValueKind::Scalar:
        return true;
    case ValueKind::ShapeVector:
        return a.dims == b.dims;
    case ValueKind::Opaque:
        return a.native_type == b.native_type;
    }
    return false;
}

// ============================================================================
// Datum accessors
// ============================================================================

const HostTensorPtr &datum_tensor(const Datum &d, const std::string &what) {
    const auto *t = std::get_if<HostTensorPtr>(&d);
    if (t == nullptr || *t == nullptr)
        throw TypeError::kind_mismatch(what, "a tensor", "another value kind");
    return *t;
}

double datum_scalar(const Datum &d, const std::string &what) {
    if (const auto *s = std::get_if<double>(&d))
        return *s;
    if (const auto *t = std::get_if<HostTensorPtr>(&d)) {
        if (*t && (*t)->size() == 1)
            return (*t)->data[0];
    }
    throw TypeError::kind_mismatch(what, "a scalar", "another value kind");
}

const Shape &datum_shape(const Datum &d, const std::string &what) {
    const auto *s = std::get_if<Shape>(&d);
    if (s == nullptr)
        throw TypeError::kind_mismatch(what, "a shape vector",
                                       "another value kind");
    return *s;
}

const DescriptorPtr &datum_descriptor(const Datum &d, const std::string &what) {
    const auto *p = std::get_if<DescriptorPtr>(&d);
    if (p == nullptr || *p == nullptr)
        throw TypeError::kind_mismatch(what, "a native descriptor",
                                       "another value kind");
    return *p;
}

// ============================================================================
// Value
// ============================================================================

Value::Value(ValueType type, const Node *owner, size_t index, std::string name)
    : type_(std::move(type)), owner_(owner), index_(index), id_(next_id()),
      name_(std::move(name)) {}

NodePtr Value::owner() const {
    if (owner_ == nullptr)
        return nullptr;
    return owner_->shared_from_this();
}

const Datum &Value::constant_value() const {
    if (!constant_)
        throw RuntimeError::internal("value " + repr() + " is not a constant");
    return *constant_;
}

std::string Value::repr() const {
    std::ostringstream oss;
    if (!name_.empty())
        oss << name_;
    else if (is_constant())
        oss << "const#" << id_;
    else if (owner_)
        oss << op_kind_name(owner_->kind()) << "#" << owner_->id() << "."
            << index_;
    else
        oss << "input#" << id_;
    oss << ":" << type_.repr();
    return oss.str();
}

ValuePtr input(ValueType type, std::string name) {
    return std::make_shared<const Value>(std::move(type), nullptr, 0,
                                         std::move(name));
}

ValuePtr tensor_input(DType dtype, Shape dims, std::string name) {
    return input(ValueType::tensor(dtype, std::move(dims)), std::move(name));
}

ValuePtr make_constant(ValueType type, Datum value) {
    auto v = std::make_shared<Value>(std::move(type), nullptr, 0);
    v->constant_ = std::move(value);
    return v;
}

ValuePtr constant_scalar(double value, DType dtype) {
    return make_constant(ValueType::scalar(dtype), value);
}

ValuePtr constant_shape(Shape value) {
    auto type = ValueType::shape_vector(value.size(), value);
    return make_constant(std::move(type), std::move(value));
}

ValuePtr constant_tensor(HostTensorPtr value) {
    if (!value)
        throw RuntimeError::internal("constant_tensor given a null tensor");
    auto type = ValueType::tensor(value->dtype, value->shape);
    return make_constant(std::move(type), std::move(value));
}

std::optional<double> constant_scalar_value(const ValuePtr &value) {
    if (!value || !value->is_constant())
        return std::nullopt;
    const auto &d = value->constant_value();
    if (const auto *s = std::get_if<double>(&d))
        return *s;
    if (const auto *t = std::get_if<HostTensorPtr>(&d)) {
        if (*t && (*t)->size() == 1)
            return (*t)->data[0];
    }
    return std::nullopt;
}

} // namespace graph
} // namespace dnnlift
