#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dnnlift {

// Element kinds a graph value can carry
enum class DType : uint8_t { Int64, Float16, Float32, Float64 };

constexpr size_t dtype_size(DType dtype) {
    switch (dtype) {
    case DType::Int64:
        return 8;
    case DType::Float16:
        return 2;
    case DType::Float32:
        return 4;
    case DType::Float64:
        return 8;
    }
    return 0;
}

constexpr bool is_floating(DType dtype) { return dtype != DType::Int64; }

std::string dtype_name(DType dtype);

} // namespace dnnlift
