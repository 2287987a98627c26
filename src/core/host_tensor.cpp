#include "dnnlift/host_tensor.hpp"
#include "dnnlift/error.hpp"

#include <algorithm>

namespace dnnlift {

HostTensor::HostTensor(DType dtype, Shape shape)
    : dtype(dtype), shape(std::move(shape)) {
    if (!ShapeUtils::is_fully_known(this->shape)) {
        throw ShapeError("cannot allocate a host tensor of shape " +
                         ShapeUtils::to_string(this->shape));
    }
    data.assign(ShapeUtils::size(this->shape), 0.0);
}

HostTensor::HostTensor(DType dtype, Shape shape, std::vector<double> values)
    : dtype(dtype), shape(std::move(shape)), data(std::move(values)) {
    if (data.size() != ShapeUtils::size(this->shape)) {
        throw ShapeError("host tensor of shape " +
                         ShapeUtils::to_string(this->shape) + " needs " +
                         std::to_string(ShapeUtils::size(this->shape)) +
                         " elements but " + std::to_string(data.size()) +
                         " were given");
    }
}

std::shared_ptr<HostTensor> HostTensor::zeros(DType dtype,
                                              const Shape &shape) {
    return std::make_shared<HostTensor>(dtype, shape);
}

std::shared_ptr<HostTensor> HostTensor::filled(DType dtype, const Shape &shape,
                                               double value) {
    auto t = std::make_shared<HostTensor>(dtype, shape);
    std::fill(t->data.begin(), t->data.end(), value);
    return t;
}

std::shared_ptr<HostTensor> HostTensor::uniform(DType dtype,
                                                const Shape &shape,
                                                uint64_t seed) {
    auto t = std::make_shared<HostTensor>(dtype, shape);
    // splitmix64
    uint64_t state = seed + 0x9E3779B97F4A7C15ULL;
    for (auto &v : t->data) {
        state += 0x9E3779B97F4A7C15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        z ^= z >> 31;
        v = static_cast<double>(z >> 11) / static_cast<double>(1ULL << 53) *
                2.0 -
            1.0;
    }
    return t;
}

} // namespace dnnlift
