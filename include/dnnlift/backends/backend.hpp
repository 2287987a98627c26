#pragma once

// Abstract interface to an accelerated kernel library. The graph layer only
// ever talks to the library through this interface and through the opaque
// descriptor handles it hands out.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/host_tensor.hpp"

namespace dnnlift {
namespace backends {

inline constexpr const char *kConvDescriptorType = "ConvolutionDescriptor";
inline constexpr const char *kPoolDescriptorType = "PoolingDescriptor";

// ============================================================================
// Descriptor recipes
// ============================================================================

struct ConvDescriptorParams {
    std::vector<int64_t> pads; // resolved against the kernel shape
    std::vector<int64_t> strides;
    dnn::ConvMode mode = dnn::ConvMode::Convolution;
};

struct PoolDescriptorParams {
    std::vector<int64_t> window;
    std::vector<int64_t> strides;
    std::vector<int64_t> pads;
    dnn::PoolMode mode = dnn::PoolMode::Max;
};

// ============================================================================
// DescriptorResource: owned native configuration handle
// ============================================================================

// Owns one native handle and releases it exactly once from the destructor.
// Shared through std::shared_ptr so an execution holding the descriptor
// keeps it alive after the graph that built it is gone.
class DescriptorResource {
  public:
    using Releaser = std::function<void(void *)>;

    DescriptorResource(std::string native_type, void *handle,
                       Releaser release, int backend_version);
    ~DescriptorResource();

    DescriptorResource(const DescriptorResource &) = delete;
    DescriptorResource &operator=(const DescriptorResource &) = delete;
    DescriptorResource(DescriptorResource &&) = delete;
    DescriptorResource &operator=(DescriptorResource &&) = delete;

    void *handle() const { return handle_; }
    const std::string &native_type() const { return native_type_; }
    int backend_version() const { return backend_version_; }

  private:
    std::string native_type_;
    void *handle_;
    Releaser release_;
    int backend_version_;
};

// ============================================================================
// Backend
// ============================================================================

class Backend {
  public:
    virtual ~Backend() = default;

    virtual std::string name() const = 0;

    // Version reported by the loaded library
    virtual int version() const = 0;

    // Version of the headers the session was compiled against
    virtual int header_version() const = 0;

    virtual std::shared_ptr<DescriptorResource>
    create_convolution_descriptor(const ConvDescriptorParams &params) = 0;

    virtual std::shared_ptr<DescriptorResource>
    create_pooling_descriptor(const PoolDescriptorParams &params) = 0;

    // out := alpha * conv(img, kern) + beta * out
    virtual void convolution_forward(dnn::ConvAlgo algo, const HostTensor &img,
                                     const HostTensor &kern,
                                     const DescriptorResource &desc,
                                     double alpha, double beta,
                                     HostTensor &out) = 0;

    // kern_grad := alpha * dW(img, top) + beta * kern_grad
    virtual void convolution_backward_filter(dnn::ConvAlgo algo,
                                             const HostTensor &img,
                                             const HostTensor &top,
                                             const DescriptorResource &desc,
                                             double alpha, double beta,
                                             HostTensor &kern_grad) = 0;

    // img_grad := alpha * dI(kern, top) + beta * img_grad
    virtual void convolution_backward_data(dnn::ConvAlgo algo,
                                           const HostTensor &kern,
                                           const HostTensor &top,
                                           const DescriptorResource &desc,
                                           double alpha, double beta,
                                           HostTensor &img_grad) = 0;

    // Resolves an automatic algorithm request to a fixed algorithm for the
    // given operand shapes. Guess variants use a heuristic, time variants
    // measure.
    virtual dnn::ConvAlgo choose_algorithm(dnn::ConvDirection direction,
                                           dnn::ConvAlgo request,
                                           const HostTensor &primary,
                                           const HostTensor &secondary,
                                           const DescriptorResource &desc,
                                           const HostTensor &output) = 0;

    // Output dims of pooling an input of shape `input` with `desc`
    virtual Shape pooling_output_shape(const DescriptorResource &desc,
                                       const Shape &input) = 0;

    virtual void pooling_forward(const DescriptorResource &desc,
                                 const HostTensor &img, HostTensor &out) = 0;

    virtual void pooling_backward(const DescriptorResource &desc,
                                  const HostTensor &inp, const HostTensor &out,
                                  const HostTensor &out_grad,
                                  HostTensor &inp_grad) = 0;

    virtual void softmax_forward(dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                                 const HostTensor &x, HostTensor &y) = 0;

    virtual void softmax_backward(dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                                  const HostTensor &dy, const HostTensor &sm,
                                  HostTensor &dx) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

} // namespace backends
} // namespace dnnlift
