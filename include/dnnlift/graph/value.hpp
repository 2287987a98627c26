#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dnnlift/dtype.hpp"
#include "dnnlift/host_tensor.hpp"
#include "dnnlift/shape.hpp"

namespace dnnlift {

namespace backends {
class DescriptorResource;
} // namespace backends

namespace graph {

class Node;
using NodePtr = std::shared_ptr<const Node>;

// ============================================================================
// Value types
// ============================================================================

enum class ValueKind : uint8_t { Tensor, Scalar, ShapeVector, Opaque };

struct ValueType {
    ValueKind kind = ValueKind::Tensor;
    DType dtype = DType::Float32;
    // Tensor: per-axis static size (kUnknownDim when unknown).
    // ShapeVector: a single entry holding the vector length.
    Shape dims;
    // ShapeVector whose entries are known while building the graph
    std::optional<Shape> contents;
    // Opaque: native resource type, e.g. "ConvolutionDescriptor"
    std::string native_type;

    static ValueType tensor(DType dtype, size_t rank);
    static ValueType tensor(DType dtype, Shape dims);
    static ValueType scalar(DType dtype);
    static ValueType shape_vector(size_t length,
                                  std::optional<Shape> contents = std::nullopt);
    static ValueType opaque(std::string native_type);

    bool is_tensor() const { return kind == ValueKind::Tensor; }
    bool is_scalar() const { return kind == ValueKind::Scalar; }
    bool is_shape() const { return kind == ValueKind::ShapeVector; }
    bool is_opaque() const { return kind == ValueKind::Opaque; }

    size_t rank() const { return is_tensor() ? dims.size() : 0; }
    size_t shape_length() const {
        return is_shape() ? static_cast<size_t>(dims.at(0)) : 0;
    }

    std::string repr() const;

    bool operator==(const ValueType &o) const {
        return kind == o.kind && dtype == o.dtype && dims == o.dims &&
               contents == o.contents && native_type == o.native_type;
    }
    bool operator!=(const ValueType &o) const { return !(*this == o); }
};

// Same kind, dtype, rank and native type; static dims agree where both known
bool is_compatible(const ValueType &a, const ValueType &b);

// ============================================================================
// Runtime payloads
// ============================================================================

using DescriptorPtr = std::shared_ptr<backends::DescriptorResource>;

using Datum =
    std::variant<std::monostate, HostTensorPtr, double, Shape, DescriptorPtr>;

const HostTensorPtr &datum_tensor(const Datum &d, const std::string &what);
double datum_scalar(const Datum &d, const std::string &what);
const Shape &datum_shape(const Datum &d, const std::string &what);
const DescriptorPtr &datum_descriptor(const Datum &d, const std::string &what);

// ============================================================================
// Value: typed edge of the graph
// ============================================================================

class Value {
  public:
    Value(ValueType type, const Node *owner, size_t index,
          std::string name = "");

    const ValueType &type() const { return type_; }
    uint64_t id() const { return id_; }
    const std::string &name() const { return name_; }
    size_t index() const { return index_; }

    // Producing node, null for graph inputs and constants
    NodePtr owner() const;
    const Node *owner_raw() const { return owner_; }
    bool is_leaf() const { return owner_ == nullptr; }

    bool is_constant() const { return constant_.has_value(); }
    const Datum &constant_value() const;

    std::string repr() const;

  private:
    friend std::shared_ptr<const Value> make_constant(ValueType type,
                                                      Datum value);

    ValueType type_;
    const Node *owner_;
    size_t index_;
    uint64_t id_;
    std::string name_;
    std::optional<Datum> constant_;

    static uint64_t next_id() {
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1);
    }
};

using ValuePtr = std::shared_ptr<const Value>;

// Free graph input
ValuePtr input(ValueType type, std::string name = "");
ValuePtr tensor_input(DType dtype, Shape dims, std::string name = "");

ValuePtr make_constant(ValueType type, Datum value);
ValuePtr constant_scalar(double value, DType dtype = DType::Float32);
ValuePtr constant_shape(Shape value);
ValuePtr constant_tensor(HostTensorPtr value);

// Value of a constant scalar, or of a constant tensor with a single element
std::optional<double> constant_scalar_value(const ValuePtr &value);

} // namespace graph
} // namespace dnnlift
