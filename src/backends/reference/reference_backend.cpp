#include "dnnlift/backends/reference_backend.hpp"
#include "backends/reference/host_kernels.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"

#include <atomic>
#include <chrono>
#include <limits>

namespace dnnlift {
namespace backends {

namespace {

std::atomic<size_t> g_live_descriptors{0};

const ConvDescriptorParams &conv_params(const DescriptorResource &desc) {
    if (desc.native_type() != kConvDescriptorType) {
        throw TypeError::kind_mismatch("convolution descriptor",
                                       kConvDescriptorType, desc.native_type());
    }
    return *static_cast<const ConvDescriptorParams *>(desc.handle());
}

const PoolDescriptorParams &pool_params(const DescriptorResource &desc) {
    if (desc.native_type() != kPoolDescriptorType) {
        throw TypeError::kind_mismatch("pooling descriptor",
                                       kPoolDescriptorType, desc.native_type());
    }
    return *static_cast<const PoolDescriptorParams *>(desc.handle());
}

host::ConvGeometry conv_geometry(const DescriptorResource &desc) {
    const auto &p = conv_params(desc);
    host::ConvGeometry g;
    g.pads = p.pads;
    g.strides = p.strides;
    g.flip = p.mode == dnn::ConvMode::Convolution;
    return g;
}

host::PoolGeometry pool_geometry(const DescriptorResource &desc) {
    const auto &p = pool_params(desc);
    host::PoolGeometry g;
    g.window = p.window;
    g.strides = p.strides;
    g.pads = p.pads;
    g.mode = p.mode;
    return g;
}

void check_fixed(dnn::ConvAlgo algo, dnn::ConvDirection direction,
                 size_t rank) {
    if (dnn::is_automatic(algo)) {
        throw RuntimeError::internal("automatic algorithm " +
                                     dnn::conv_algo_name(algo) +
                                     " reached the kernel unresolved");
    }
    if (!dnn::supports_direction(algo, direction)) {
        throw ConfigurationError::invalid_value(
            "algo", dnn::conv_algo_name(algo),
            "an algorithm the " + dnn::direction_name(direction) +
                " kernel supports");
    }
    if (algo == dnn::ConvAlgo::Fft && rank == 5) {
        throw ConfigurationError("fft convolution is not available for "
                                 "3d convolutions");
    }
}

class ReferenceBackend : public Backend {
  public:
    ReferenceBackend(int version, int header_version)
        : version_(version), header_version_(header_version) {}

    std::string name() const override { return "reference"; }
    int version() const override { return version_; }
    int header_version() const override { return header_version_; }

    std::shared_ptr<DescriptorResource>
    create_convolution_descriptor(const ConvDescriptorParams &params) override {
        auto *handle = new ConvDescriptorParams(params);
        g_live_descriptors.fetch_add(1);
        return std::make_shared<DescriptorResource>(
            kConvDescriptorType, handle,
            [](void *p) {
                delete static_cast<ConvDescriptorParams *>(p);
                g_live_descriptors.fetch_sub(1);
            },
            version_);
    }

    std::shared_ptr<DescriptorResource>
    create_pooling_descriptor(const PoolDescriptorParams &params) override {
        auto *handle = new PoolDescriptorParams(params);
        g_live_descriptors.fetch_add(1);
        return std::make_shared<DescriptorResource>(
            kPoolDescriptorType, handle,
            [](void *p) {
                delete static_cast<PoolDescriptorParams *>(p);
                g_live_descriptors.fetch_sub(1);
            },
            version_);
    }

    void convolution_forward(dnn::ConvAlgo algo, const HostTensor &img,
                             const HostTensor &kern,
                             const DescriptorResource &desc, double alpha,
                             double beta, HostTensor &out) override {
        check_fixed(algo, dnn::ConvDirection::Forward, img.ndim());
        if (algo == dnn::ConvAlgo::Gemm)
            host::conv_forward_gemm(img, kern, conv_geometry(desc), alpha,
                                    beta, out);
        else
            host::conv_forward(img, kern, conv_geometry(desc), alpha, beta,
                               out);
    }

    void convolution_backward_filter(dnn::ConvAlgo algo, const HostTensor &img,
                                     const HostTensor &top,
                                     const DescriptorResource &desc,
                                     double alpha, double beta,
                                     HostTensor &kern_grad) override {
        check_fixed(algo, dnn::ConvDirection::BackwardFilter, img.ndim());
        host::conv_backward_filter(img, top, conv_geometry(desc), alpha, beta,
                                   kern_grad);
    }

    void convolution_backward_data(dnn::ConvAlgo algo, const HostTensor &kern,
                                   const HostTensor &top,
                                   const DescriptorResource &desc,
                                   double alpha, double beta,
                                   HostTensor &img_grad) override {
        check_fixed(algo, dnn::ConvDirection::BackwardData, kern.ndim());
        host::conv_backward_data(kern, top, conv_geometry(desc), alpha, beta,
                                 img_grad);
    }

    dnn::ConvAlgo choose_algorithm(dnn::ConvDirection direction,
                                   dnn::ConvAlgo request,
                                   const HostTensor &primary,
                                   const HostTensor &secondary,
                                   const DescriptorResource &desc,
                                   const HostTensor &output) override {
        if (!dnn::is_timed(request))
            return guess(direction, secondary);
        return time(direction, primary, secondary, desc, output);
    }

    Shape pooling_output_shape(const DescriptorResource &desc,
                               const Shape &input) override {
        auto g = pool_geometry(desc);
        if (input.size() != g.window.size() + 2) {
            throw ShapeError::rank_mismatch("pooling input", g.window.size() + 2,
                                            input.size());
        }
        Shape out = {input[0], input[1]};
        for (auto d : host::pool_spatial_output(
                 Shape(input.begin() + 2, input.end()), g))
            out.push_back(d);
        return out;
    }

    void pooling_forward(const DescriptorResource &desc, const HostTensor &img,
                         HostTensor &out) override {
        host::pool_forward(img, pool_geometry(desc), out);
    }

    void pooling_backward(const DescriptorResource &desc, const HostTensor &inp,
                          const HostTensor &out, const HostTensor &out_grad,
                          HostTensor &inp_grad) override {
        host::pool_backward(inp, out, out_grad, pool_geometry(desc), inp_grad);
    }

    void softmax_forward(dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                         const HostTensor &x, HostTensor &y) override {
        host::softmax_forward(x, algo, mode, y);
    }

    void softmax_backward(dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                          const HostTensor &dy, const HostTensor &sm,
                          HostTensor &dx) override {
        host::softmax_backward(dy, sm, algo, mode, dx);
    }

  private:
    // Matrix multiply pays off once each output reduces over enough taps
    dnn::ConvAlgo guess(dnn::ConvDirection direction,
                        const HostTensor &secondary) const {
        if (direction != dnn::ConvDirection::Forward)
            return dnn::ConvAlgo::Plain;
        size_t depth = ShapeUtils::size(Shape(secondary.shape.begin() + 1,
                                              secondary.shape.end()));
        return depth >= 64 ? dnn::ConvAlgo::Gemm : dnn::ConvAlgo::Precomputed;
    }

    dnn::ConvAlgo time(dnn::ConvDirection direction, const HostTensor &primary,
                       const HostTensor &secondary,
                       const DescriptorResource &desc,
                       const HostTensor &output) {
        std::vector<dnn::ConvAlgo> candidates;
        if (direction == dnn::ConvDirection::Forward)
            candidates = {dnn::ConvAlgo::Plain, dnn::ConvAlgo::Precomputed,
                          dnn::ConvAlgo::Gemm};
        else
            candidates = {dnn::ConvAlgo::Plain, dnn::ConvAlgo::Deterministic};

        dnn::ConvAlgo best = candidates.front();
        auto best_time = std::chrono::nanoseconds::max();
        for (auto algo : candidates) {
            HostTensor scratch = output;
            auto start = std::chrono::steady_clock::now();
            switch (direction) {
            case dnn::ConvDirection::Forward:
                convolution_forward(algo, primary, secondary, desc, 1.0, 0.0,
                                    scratch);
                break;
            case dnn::ConvDirection::BackwardFilter:
                convolution_backward_filter(algo, primary, secondary, desc, 1.0,
                                            0.0, scratch);
                break;
            case dnn::ConvDirection::BackwardData:
                convolution_backward_data(algo, primary, secondary, desc, 1.0,
                                          0.0, scratch);
                break;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start);
            trace::Tracer::instance().record("algorithm", "time",
                                             dnn::conv_algo_name(algo),
                                             elapsed);
            if (elapsed < best_time) {
                best_time = elapsed;
                best = algo;
            }
        }
        return best;
    }

    int version_;
    int header_version_;
};

} // namespace

BackendPtr make_reference_backend(int version, int header_version) {
    return std::make_shared<ReferenceBackend>(
        version, header_version < 0 ? version : header_version);
}

size_t live_reference_descriptors() { return g_live_descriptors.load(); }

} // namespace backends
} // namespace dnnlift
