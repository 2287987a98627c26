#include "dnnlift/dtype.hpp"
#include "dnnlift/shape.hpp"

#include <sstream>

namespace dnnlift {

std::string dtype_name(DType dtype) {
    switch (dtype) {
    case DType::Int64:
        return "int64";
    case DType::Float16:
        return "float16";
    case DType::Float32:
        return "float32";
    case DType::Float64:
        return "float64";
    }
    return "unknown";
}

size_t ShapeUtils::size(const Shape &shape) {
    size_t total = 1;
    for (auto dim : shape) {
        total *= static_cast<size_t>(dim < 0 ? 0 : dim);
    }
    return total;
}

Shape ShapeUtils::calculate_strides(const Shape &shape) {
    Shape strides(shape.size(), 1);
    for (int i = static_cast<int>(shape.size()) - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

bool ShapeUtils::is_fully_known(const Shape &shape) {
    for (auto dim : shape) {
        if (dim < 0)
            return false;
    }
    return true;
}

bool ShapeUtils::compatible(const Shape &a, const Shape &b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] >= 0 && b[i] >= 0 && a[i] != b[i])
            return false;
    }
    return true;
}

std::string ShapeUtils::to_string(const Shape &shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            oss << ", ";
        if (shape[i] < 0)
            oss << "?";
        else
            oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace dnnlift
