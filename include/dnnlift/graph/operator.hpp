#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "op_traits.hpp"
#include "value.hpp"

namespace dnnlift {
namespace graph {

class ExecContext;

// output index -> input indices that output overwrites in place
using DestroyMap = std::map<size_t, std::vector<size_t>>;

// Immutable description of a computation kind plus its fixed parameters.
// Equality and hashing are by (kind, parameters), never by graph position.
class Operator {
  public:
    virtual ~Operator() = default;

    virtual OpKind kind() const = 0;

    // Human readable name including parameters, e.g. "DnnConv{algo=small}"
    virtual std::string name() const = 0;

    // Parameter equality. Only called when both kinds match.
    virtual bool params_equal(const Operator &other) const = 0;

    virtual uint64_t hash_params(uint64_t h) const = 0;

    // Validates arity, value kinds, ranks and dtypes of `inputs` and returns
    // the output types. Throws ShapeError, TypeError or ConfigurationError.
    virtual std::vector<ValueType>
    make_outputs(const std::vector<ValuePtr> &inputs) const = 0;

    // One gradient per input (null for disconnected inputs) given one
    // gradient per output. Builds graph nodes, never evaluates.
    virtual std::vector<ValuePtr>
    grad(const Node &node, const std::vector<ValuePtr> &output_grads) const;

    // Which inputs the outputs depend on differentiably
    virtual std::vector<bool> connection_pattern(const Node &node) const;

    virtual DestroyMap destroy_map() const { return {}; }

    virtual std::vector<Datum> perform(const Node &node,
                                       const std::vector<Datum> &inputs,
                                       ExecContext &ctx) const = 0;

    bool equals(const Operator &other) const {
        return kind() == other.kind() && params_equal(other);
    }

    uint64_t hash() const;

    const OpTraits &traits() const { return op_traits(kind()); }
};

using OperatorPtr = std::shared_ptr<const Operator>;

// Tag-checked downcast. Each concrete operator exposes a static
// matches(OpKind) predicate.
template <typename T> const T *op_cast(const Operator &op) {
    return T::matches(op.kind()) ? static_cast<const T *>(&op) : nullptr;
}

} // namespace graph
} // namespace dnnlift
