#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dnnlift {

using Shape = std::vector<int64_t>;

// Marker for a dimension whose size is only known at execution time
inline constexpr int64_t kUnknownDim = -1;

class ShapeUtils {
  public:
    static size_t size(const Shape &shape);

    static Shape calculate_strides(const Shape &shape);

    static bool is_fully_known(const Shape &shape);

    // Two dims are compatible when equal or when either is unknown
    static bool compatible(const Shape &a, const Shape &b);

    static std::string to_string(const Shape &shape);
};

} // namespace dnnlift
