#include "dnnlift/backends/probes.hpp"

#include <cuda_runtime.h>

namespace dnnlift {
namespace backends {

namespace {

class CudaDeviceBinding : public DeviceBinding {
  public:
    std::optional<DeviceInfo> current_device() const override {
        int count = 0;
        if (cudaGetDeviceCount(&count) != cudaSuccess || count == 0)
            return std::nullopt;
        int device = 0;
        if (cudaGetDevice(&device) != cudaSuccess)
            return std::nullopt;
        cudaDeviceProp prop;
        if (cudaGetDeviceProperties(&prop, device) != cudaSuccess)
            return std::nullopt;
        return DeviceInfo{"cuda",
                          "sm_" + std::to_string(prop.major) +
                              std::to_string(prop.minor),
                          prop.name};
    }
};

} // namespace

DeviceBindingPtr make_cuda_device_binding() {
    return std::make_shared<CudaDeviceBinding>();
}

} // namespace backends
} // namespace dnnlift
