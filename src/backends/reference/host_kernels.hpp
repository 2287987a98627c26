#pragma once

// Host loops for convolution, pooling and softmax on HostTensor. Shared by
// the generic operators' perform() and by the reference backend.

#include <cstdint>
#include <vector>

#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/host_tensor.hpp"

namespace dnnlift {
namespace backends {
namespace host {

struct ConvGeometry {
    std::vector<int64_t> pads;
    std::vector<int64_t> strides;
    bool flip = true; // convolution (true) or cross-correlation (false)
};

struct PoolGeometry {
    std::vector<int64_t> window;
    std::vector<int64_t> strides;
    std::vector<int64_t> pads;
    dnn::PoolMode mode = dnn::PoolMode::Max;
    bool ignore_border = true;
};

// ============================================================================
// Convolution
// ============================================================================

// Spatial output sizes: floor((in + 2p - k) / s) + 1
std::vector<int64_t> conv_spatial_output(const std::vector<int64_t> &in,
                                         const std::vector<int64_t> &kernel,
                                         const std::vector<int64_t> &pads,
                                         const std::vector<int64_t> &strides);

// out := alpha * conv(img, kern) + beta * out   (direct loops)
void conv_forward(const HostTensor &img, const HostTensor &kern,
                  const ConvGeometry &g, double alpha, double beta,
                  HostTensor &out);

// Same contract, lowered to im2col + cblas_dgemm
void conv_forward_gemm(const HostTensor &img, const HostTensor &kern,
                       const ConvGeometry &g, double alpha, double beta,
                       HostTensor &out);

// dkern := alpha * dW(img, top) + beta * dkern
void conv_backward_filter(const HostTensor &img, const HostTensor &top,
                          const ConvGeometry &g, double alpha, double beta,
                          HostTensor &dkern);

// dimg := alpha * dI(kern, top) + beta * dimg
void conv_backward_data(const HostTensor &kern, const HostTensor &top,
                        const ConvGeometry &g, double alpha, double beta,
                        HostTensor &dimg);

// ============================================================================
// Pooling
// ============================================================================

std::vector<int64_t> pool_spatial_output(const std::vector<int64_t> &in,
                                         const PoolGeometry &g);

void pool_forward(const HostTensor &img, const PoolGeometry &g,
                  HostTensor &out);

void pool_backward(const HostTensor &inp, const HostTensor &out,
                   const HostTensor &out_grad, const PoolGeometry &g,
                   HostTensor &inp_grad);

// ============================================================================
// Softmax (rank 2 rows, or rank 4 channel / instance groups)
// ============================================================================

void softmax_forward(const HostTensor &x, dnn::SoftmaxAlgo algo,
                     dnn::SoftmaxMode mode, HostTensor &y);

void softmax_backward(const HostTensor &dy, const HostTensor &sm,
                      dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                      HostTensor &dx);

} // namespace host
} // namespace backends
} // namespace dnnlift
