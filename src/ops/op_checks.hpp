#pragma once

// Input validation shared by the operators' make_outputs() and perform()

#include <string>
#include <vector>

#include "dnnlift/error.hpp"
#include "dnnlift/graph/value.hpp"

namespace dnnlift {
namespace ops {
namespace detail {

inline void require_arity(const std::string &op,
                          const std::vector<graph::ValuePtr> &inputs,
                          size_t expected) {
    if (inputs.size() != expected)
        throw TypeError::arity(op, expected, inputs.size());
}

inline std::string kind_name(const graph::ValueType &type) {
    switch (type.kind) {
    case graph::ValueKind::Tensor:
        return "a tensor";
    case graph::ValueKind::Scalar:
        return "a scalar";
    case graph::ValueKind::ShapeVector:
        return "a shape vector";
    case graph::ValueKind::Opaque:
        return "a " + type.native_type;
    }
    return "an unknown value";
}

inline const graph::ValueType &require_tensor(const std::string &what,
                                              const graph::ValuePtr &v) {
    if (!v->type().is_tensor())
        throw TypeError::kind_mismatch(what, "a tensor", kind_name(v->type()));
    return v->type();
}

inline const graph::ValueType &
require_float_tensor(const std::string &what, const graph::ValuePtr &v) {
    const auto &t = require_tensor(what, v);
    if (!is_floating(t.dtype))
        throw TypeError::unsupported_dtype(dtype_name(t.dtype), what);
    return t;
}

inline const graph::ValueType &require_rank(const std::string &what,
                                            const graph::ValuePtr &v,
                                            size_t rank) {
    const auto &t = require_tensor(what, v);
    if (t.rank() != rank)
        throw ShapeError::rank_mismatch(what, rank, t.rank());
    return t;
}

inline const graph::ValueType &
require_shape_vector(const std::string &what, const graph::ValuePtr &v) {
    if (!v->type().is_shape()) {
        throw TypeError::kind_mismatch(what, "a shape vector",
                                       kind_name(v->type()));
    }
    return v->type();
}

} // namespace detail
} // namespace ops
} // namespace dnnlift
