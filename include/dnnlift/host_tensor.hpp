#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "dnnlift/dtype.hpp"
#include "dnnlift/shape.hpp"

namespace dnnlift {

// Dense row-major host buffer. Element storage is double regardless of the
// logical dtype; the dtype only travels with the value for type checking.
struct HostTensor {
    DType dtype = DType::Float32;
    Shape shape;
    std::vector<double> data;

    HostTensor() = default;
    HostTensor(DType dtype, Shape shape);
    HostTensor(DType dtype, Shape shape, std::vector<double> values);

    size_t size() const { return data.size(); }
    size_t ndim() const { return shape.size(); }

    static std::shared_ptr<HostTensor> zeros(DType dtype, const Shape &shape);
    static std::shared_ptr<HostTensor> filled(DType dtype, const Shape &shape,
                                              double value);
    // Deterministic pseudo-random values in [-1, 1)
    static std::shared_ptr<HostTensor> uniform(DType dtype, const Shape &shape,
                                               uint64_t seed);
};

using HostTensorPtr = std::shared_ptr<HostTensor>;

} // namespace dnnlift
