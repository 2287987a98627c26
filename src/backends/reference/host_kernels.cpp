#include "host_kernels.hpp"
#include "parallel.hpp"

#include "dnnlift/error.hpp"

#include <cblas.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace dnnlift {
namespace backends {
namespace host {

namespace {

Shape spatial_of(const Shape &s) { return Shape(s.begin() + 2, s.end()); }

template <typename F> void for_each_index(const Shape &dims, F &&f) {
    size_t total = ShapeUtils::size(dims);
    std::vector<int64_t> idx(dims.size(), 0);
    for (size_t lin = 0; lin < total; ++lin) {
        f(idx);
        for (int d = static_cast<int>(dims.size()) - 1; d >= 0; --d) {
            if (++idx[d] < dims[d])
                break;
            idx[d] = 0;
        }
    }
}

// Offsets of one multiply-accumulate in the spatial volumes of the output,
// the input and the kernel
struct Tap {
    int64_t out;
    int64_t in;
    int64_t k;
};

void check_geometry(const std::vector<int64_t> &pads,
                    const std::vector<int64_t> &strides, size_t nd,
                    const char *what) {
    if (pads.size() != nd || strides.size() != nd) {
        throw ConfigurationError(std::string(what) +
                                 " geometry does not match the " +
                                 std::to_string(nd) + " spatial dimensions");
    }
    for (auto s : strides) {
        if (s <= 0)
            throw ConfigurationError::invalid_value(
                "stride", std::to_string(s), "a positive integer");
    }
}

std::vector<Tap> conv_taps(const Shape &in_sp, const Shape &out_sp,
                           const Shape &k_sp, const ConvGeometry &g) {
    const size_t nd = in_sp.size();
    auto in_strides = ShapeUtils::calculate_strides(in_sp);
    auto out_strides = ShapeUtils::calculate_strides(out_sp);
    auto k_strides = ShapeUtils::calculate_strides(k_sp);

    std::vector<Tap> taps;
    for_each_index(out_sp, [&](const std::vector<int64_t> &y) {
        int64_t out_off = 0;
        for (size_t d = 0; d < nd; ++d)
            out_off += y[d] * out_strides[d];

        for_each_index(k_sp, [&](const std::vector<int64_t> &k) {
            int64_t in_off = 0;
            int64_t k_off = 0;
            for (size_t d = 0; d < nd; ++d) {
                int64_t pos = y[d] * g.strides[d] - g.pads[d] + k[d];
                if (pos < 0 || pos >= in_sp[d])
                    return;
                in_off += pos * in_strides[d];
                int64_t kk = g.flip ? k_sp[d] - 1 - k[d] : k[d];
                k_off += kk * k_strides[d];
            }
            taps.push_back({out_off, in_off, k_off});
        });
    });
    return taps;
}

void check_conv_ranks(const HostTensor &a, const HostTensor &b,
                      const HostTensor &c, const char *what) {
    size_t r = a.ndim();
    if (r != 4 && r != 5)
        throw ShapeError::unsupported_rank(what, r);
    if (b.ndim() != r)
        throw ShapeError::rank_mismatch(what, r, b.ndim());
    if (c.ndim() != r)
        throw ShapeError::rank_mismatch(what, r, c.ndim());
}

void check_dim(int64_t expected, int64_t got, const std::string &what) {
    if (expected != got) {
        throw ShapeError(what + ": expected " + std::to_string(expected) +
                         " but got " + std::to_string(got));
    }
}

void blend(const std::vector<double> &result, double alpha, double beta,
           HostTensor &out) {
    for (size_t i = 0; i < out.data.size(); ++i) {
        double prior = beta != 0.0 ? beta * out.data[i] : 0.0;
        out.data[i] = alpha * result[i] + prior;
    }
}

} // namespace

// ============================================================================
// Convolution
// ============================================================================

std::vector<int64_t> conv_spatial_output(const std::vector<int64_t> &in,
                                         const std::vector<int64_t> &kernel,
                                         const std::vector<int64_t> &pads,
                                         const std::vector<int64_t> &strides) {
    std::vector<int64_t> out(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        int64_t span = in[i] + 2 * pads[i] - kernel[i];
        if (span < 0) {
            throw ShapeError("kernel size " + std::to_string(kernel[i]) +
                             " exceeds padded input size " +
                             std::to_string(in[i] + 2 * pads[i]) +
                             " in spatial dimension " + std::to_string(i));
        }
        out[i] = span / strides[i] + 1;
    }
    return out;
}

void conv_forward(const HostTensor &img, const HostTensor &kern,
                  const ConvGeometry &g, double alpha, double beta,
                  HostTensor &out) {
    check_conv_ranks(img, kern, out, "convolution forward");
    auto in_sp = spatial_of(img.shape);
    auto k_sp = spatial_of(kern.shape);
    check_geometry(g.pads, g.strides, in_sp.size(), "convolution");

    const int64_t N = img.shape[0], C = img.shape[1], O = kern.shape[0];
    check_dim(C, kern.shape[1], "kernel input channels");

    Shape expected = {N, O};
    for (auto d : conv_spatial_output(in_sp, k_sp, g.pads, g.strides))
        expected.push_back(d);
    if (out.shape != expected)
        throw ShapeError::mismatch(expected, out.shape);

    auto out_sp = spatial_of(out.shape);
    auto taps = conv_taps(in_sp, out_sp, k_sp, g);
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = ShapeUtils::size(out_sp);
    const int64_t k_vol = ShapeUtils::size(k_sp);

    std::vector<double> result(out.size(), 0.0);
    const bool fan_out = parallel::should_parallelize(
        static_cast<size_t>(N * O * C) * taps.size());
#pragma omp parallel for collapse(2) schedule(static) if (fan_out)
    for (int64_t n = 0; n < N; ++n) {
        for (int64_t o = 0; o < O; ++o) {
            double *dst = result.data() + (n * O + o) * out_vol;
            for (int64_t c = 0; c < C; ++c) {
                const double *src = img.data.data() + (n * C + c) * in_vol;
                const double *w = kern.data.data() + (o * C + c) * k_vol;
                for (const auto &t : taps)
                    dst[t.out] += src[t.in] * w[t.k];
            }
        }
    }
    blend(result, alpha, beta, out);
}

void conv_forward_gemm(const HostTensor &img, const HostTensor &kern,
                       const ConvGeometry &g, double alpha, double beta,
                       HostTensor &out) {
    check_conv_ranks(img, kern, out, "convolution forward");
    auto in_sp = spatial_of(img.shape);
    auto k_sp = spatial_of(kern.shape);
    check_geometry(g.pads, g.strides, in_sp.size(), "convolution");

    const int64_t N = img.shape[0], C = img.shape[1], O = kern.shape[0];
    check_dim(C, kern.shape[1], "kernel input channels");

    Shape expected = {N, O};
    for (auto d : conv_spatial_output(in_sp, k_sp, g.pads, g.strides))
        expected.push_back(d);
    if (out.shape != expected)
        throw ShapeError::mismatch(expected, out.shape);

    auto out_sp = spatial_of(out.shape);
    auto taps = conv_taps(in_sp, out_sp, k_sp, g);
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = ShapeUtils::size(out_sp);
    const int64_t k_vol = ShapeUtils::size(k_sp);
    const int64_t depth = C * k_vol;

    std::vector<double> result(out.size(), 0.0);
    std::vector<double> cols(static_cast<size_t>(depth * out_vol));
    for (int64_t n = 0; n < N; ++n) {
        // im2col: row (c, kernel tap), column output position
        std::fill(cols.begin(), cols.end(), 0.0);
        for (int64_t c = 0; c < C; ++c) {
            const double *src = img.data.data() + (n * C + c) * in_vol;
            double *rows = cols.data() + c * k_vol * out_vol;
            for (const auto &t : taps)
                rows[t.k * out_vol + t.out] = src[t.in];
        }
        cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans,
                    static_cast<int>(O), static_cast<int>(out_vol),
                    static_cast<int>(depth), 1.0, kern.data.data(),
                    static_cast<int>(depth), cols.data(),
                    static_cast<int>(out_vol), 0.0,
                    result.data() + n * O * out_vol, static_cast<int>(out_vol));
    }
    blend(result, alpha, beta, out);
}

void conv_backward_filter(const HostTensor &img, const HostTensor &top,
                          const ConvGeometry &g, double alpha, double beta,
                          HostTensor &dkern) {
    check_conv_ranks(img, top, dkern, "convolution backward filter");
    auto in_sp = spatial_of(img.shape);
    auto k_sp = spatial_of(dkern.shape);
    auto out_sp = spatial_of(top.shape);
    check_geometry(g.pads, g.strides, in_sp.size(), "convolution");

    const int64_t N = img.shape[0], C = img.shape[1], O = top.shape[1];
    check_dim(N, top.shape[0], "gradient batch size");
    check_dim(O, dkern.shape[0], "kernel output channels");
    check_dim(C, dkern.shape[1], "kernel input channels");
    auto expected_sp = conv_spatial_output(in_sp, k_sp, g.pads, g.strides);
    if (out_sp != expected_sp)
        throw ShapeError::mismatch(expected_sp, out_sp);

    auto taps = conv_taps(in_sp, out_sp, k_sp, g);
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = ShapeUtils::size(out_sp);
    const int64_t k_vol = ShapeUtils::size(k_sp);

    std::vector<double> result(dkern.size(), 0.0);
    const bool fan_out = parallel::should_parallelize(
        static_cast<size_t>(N * O * C) * taps.size());
    // Each (o, c) slice of the kernel gradient is owned by one thread
#pragma omp parallel for collapse(2) schedule(static) if (fan_out)
    for (int64_t o = 0; o < O; ++o) {
        for (int64_t c = 0; c < C; ++c) {
            double *dw = result.data() + (o * C + c) * k_vol;
            for (int64_t n = 0; n < N; ++n) {
                const double *dy = top.data.data() + (n * O + o) * out_vol;
                const double *src = img.data.data() + (n * C + c) * in_vol;
                for (const auto &t : taps)
                    dw[t.k] += dy[t.out] * src[t.in];
            }
        }
    }
    blend(result, alpha, beta, dkern);
}

void conv_backward_data(const HostTensor &kern, const HostTensor &top,
                        const ConvGeometry &g, double alpha, double beta,
                        HostTensor &dimg) {
    check_conv_ranks(kern, top, dimg, "convolution backward data");
    auto in_sp = spatial_of(dimg.shape);
    auto k_sp = spatial_of(kern.shape);
    auto out_sp = spatial_of(top.shape);
    check_geometry(g.pads, g.strides, in_sp.size(), "convolution");

    const int64_t N = dimg.shape[0], C = dimg.shape[1], O = kern.shape[0];
    check_dim(N, top.shape[0], "gradient batch size");
    check_dim(O, top.shape[1], "gradient channels");
    check_dim(C, kern.shape[1], "kernel input channels");
    auto expected_sp = conv_spatial_output(in_sp, k_sp, g.pads, g.strides);
    if (out_sp != expected_sp)
        throw ShapeError::mismatch(expected_sp, out_sp);

    auto taps = conv_taps(in_sp, out_sp, k_sp, g);
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = ShapeUtils::size(out_sp);
    const int64_t k_vol = ShapeUtils::size(k_sp);

    std::vector<double> result(dimg.size(), 0.0);
    const bool fan_out = parallel::should_parallelize(
        static_cast<size_t>(N * O * C) * taps.size());
#pragma omp parallel for collapse(2) schedule(static) if (fan_out)
    for (int64_t n = 0; n < N; ++n) {
        for (int64_t c = 0; c < C; ++c) {
            double *dx = result.data() + (n * C + c) * in_vol;
            for (int64_t o = 0; o < O; ++o) {
                const double *dy = top.data.data() + (n * O + o) * out_vol;
                const double *w = kern.data.data() + (o * C + c) * k_vol;
                for (const auto &t : taps)
                    dx[t.in] += dy[t.out] * w[t.k];
            }
        }
    }
    blend(result, alpha, beta, dimg);
}

// ============================================================================
// Pooling
// ============================================================================

std::vector<int64_t> pool_spatial_output(const std::vector<int64_t> &in,
                                         const PoolGeometry &g) {
    check_geometry(g.pads, g.strides, in.size(), "pooling");
    if (g.window.size() != in.size()) {
        throw ConfigurationError::length_mismatch("ws", in.size(),
                                                  g.window.size());
    }
    std::vector<int64_t> out(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (g.ignore_border) {
            int64_t span = in[i] + 2 * g.pads[i] - g.window[i];
            if (span < 0) {
                throw ShapeError("pooling window " +
                                 std::to_string(g.window[i]) +
                                 " exceeds padded input size " +
                                 std::to_string(in[i] + 2 * g.pads[i]));
            }
            out[i] = span / g.strides[i] + 1;
        } else {
            if (g.pads[i] != 0) {
                throw ConfigurationError(
                    "padding requires ignore_border to be true");
            }
            if (g.strides[i] >= g.window[i]) {
                out[i] = (in[i] - 1) / g.strides[i] + 1;
            } else {
                out[i] = std::max<int64_t>(
                             0, (in[i] - 1 - g.window[i] + g.strides[i]) /
                                    g.strides[i]) +
                         1;
            }
        }
    }
    return out;
}

namespace {

// In-bounds input offsets of every pooling window, plus the divisor used by
// the average modes
struct PoolWindow {
    int64_t out;
    std::vector<int64_t> in;
    double divisor;
};

std::vector<PoolWindow> pool_windows(const Shape &in_sp, const Shape &out_sp,
                                     const PoolGeometry &g) {
    const size_t nd = in_sp.size();
    auto in_strides = ShapeUtils::calculate_strides(in_sp);
    auto out_strides = ShapeUtils::calculate_strides(out_sp);
    const double window_volume = static_cast<double>(ShapeUtils::size(g.window));

    std::vector<PoolWindow> windows;
    for_each_index(out_sp, [&](const std::vector<int64_t> &y) {
        PoolWindow w;
        w.out = 0;
        for (size_t d = 0; d < nd; ++d)
            w.out += y[d] * out_strides[d];
        for_each_index(g.window, [&](const std::vector<int64_t> &k) {
            int64_t off = 0;
            for (size_t d = 0; d < nd; ++d) {
                int64_t pos = y[d] * g.strides[d] - g.pads[d] + k[d];
                if (pos < 0 || pos >= in_sp[d])
                    return;
                off += pos * in_strides[d];
            }
            w.in.push_back(off);
        });
        bool include_pad =
            g.mode == dnn::PoolMode::AverageIncludePad && g.ignore_border;
        w.divisor = include_pad ? window_volume
                                : static_cast<double>(std::max<size_t>(
                                      w.in.size(), 1));
        windows.push_back(std::move(w));
    });
    return windows;
}

void check_pool_rank(const HostTensor &t, const PoolGeometry &g) {
    if (t.ndim() != g.window.size() + 2) {
        throw ShapeError::rank_mismatch("pooling input", g.window.size() + 2,
                                        t.ndim());
    }
}

} // namespace

void pool_forward(const HostTensor &img, const PoolGeometry &g,
                  HostTensor &out) {
    check_pool_rank(img, g);
    auto in_sp = spatial_of(img.shape);
    Shape expected = {img.shape[0], img.shape[1]};
    for (auto d : pool_spatial_output(in_sp, g))
        expected.push_back(d);
    if (out.shape != expected)
        throw ShapeError::mismatch(expected, out.shape);

    auto windows = pool_windows(in_sp, spatial_of(out.shape), g);
    const int64_t planes = img.shape[0] * img.shape[1];
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = static_cast<int64_t>(windows.size());

    for (int64_t p = 0; p < planes; ++p) {
        const double *src = img.data.data() + p * in_vol;
        double *dst = out.data.data() + p * out_vol;
        for (const auto &w : windows) {
            if (g.mode == dnn::PoolMode::Max) {
                double best = w.in.empty()
                                  ? 0.0
                                  : -std::numeric_limits<double>::infinity();
                for (auto off : w.in)
                    best = std::max(best, src[off]);
                dst[w.out] = best;
            } else {
                double sum = 0.0;
                for (auto off : w.in)
                    sum += src[off];
                dst[w.out] = sum / w.divisor;
            }
        }
    }
}

void pool_backward(const HostTensor &inp, const HostTensor &out,
                   const HostTensor &out_grad, const PoolGeometry &g,
                   HostTensor &inp_grad) {
    check_pool_rank(inp, g);
    auto in_sp = spatial_of(inp.shape);
    Shape expected = {inp.shape[0], inp.shape[1]};
    for (auto d : pool_spatial_output(in_sp, g))
        expected.push_back(d);
    if (out_grad.shape != expected)
        throw ShapeError::mismatch(expected, out_grad.shape);
    if (out.shape != expected)
        throw ShapeError::mismatch(expected, out.shape);
    if (inp_grad.shape != inp.shape)
        throw ShapeError::mismatch(inp.shape, inp_grad.shape);

    auto windows = pool_windows(in_sp, spatial_of(out_grad.shape), g);
    const int64_t planes = inp.shape[0] * inp.shape[1];
    const int64_t in_vol = ShapeUtils::size(in_sp);
    const int64_t out_vol = static_cast<int64_t>(windows.size());

    std::fill(inp_grad.data.begin(), inp_grad.data.end(), 0.0);
    for (int64_t p = 0; p < planes; ++p) {
        const double *src = inp.data.data() + p * in_vol;
        const double *dy = out_grad.data.data() + p * out_vol;
        double *dx = inp_grad.data.data() + p * in_vol;
        for (const auto &w : windows) {
            if (w.in.empty())
                continue;
            if (g.mode == dnn::PoolMode::Max) {
                int64_t arg = w.in.front();
                for (auto off : w.in) {
                    if (src[off] > src[arg])
                        arg = off;
                }
                dx[arg] += dy[w.out];
            } else {
                double share = dy[w.out] / w.divisor;
                for (auto off : w.in)
                    dx[off] += share;
            }
        }
    }
}

// ============================================================================
// Softmax
// ============================================================================

namespace {

// Softmax runs over `len` elements spaced `inner` apart, for each of
// `outer * inner` groups
struct SoftmaxGroups {
    int64_t outer;
    int64_t len;
    int64_t inner;
};

SoftmaxGroups softmax_groups(const Shape &s, dnn::SoftmaxMode mode) {
    if (s.size() == 2)
        return {s[0], s[1], 1};
    if (s.size() == 4) {
        if (mode == dnn::SoftmaxMode::Channel)
            return {s[0], s[1], s[2] * s[3]};
        return {s[0], s[1] * s[2] * s[3], 1};
    }
    throw ShapeError("softmax expects a rank 2 or rank 4 tensor, got rank " +
                     std::to_string(s.size()));
}

} // namespace

void softmax_forward(const HostTensor &x, dnn::SoftmaxAlgo algo,
                     dnn::SoftmaxMode mode, HostTensor &y) {
    if (y.shape != x.shape)
        throw ShapeError::mismatch(x.shape, y.shape);
    auto g = softmax_groups(x.shape, mode);

    for (int64_t o = 0; o < g.outer; ++o) {
        for (int64_t i = 0; i < g.inner; ++i) {
            const int64_t base = o * g.len * g.inner + i;
            auto at = [&](int64_t j) { return base + j * g.inner; };

            double shift = 0.0;
            if (algo != dnn::SoftmaxAlgo::Fast) {
                shift = -std::numeric_limits<double>::infinity();
                for (int64_t j = 0; j < g.len; ++j)
                    shift = std::max(shift, x.data[at(j)]);
            }
            double sum = 0.0;
            for (int64_t j = 0; j < g.len; ++j)
                sum += std::exp(x.data[at(j)] - shift);

            if (algo == dnn::SoftmaxAlgo::Log) {
                double lse = shift + std::log(sum);
                for (int64_t j = 0; j < g.len; ++j)
                    y.data[at(j)] = x.data[at(j)] - lse;
            } else {
                for (int64_t j = 0; j < g.len; ++j)
                    y.data[at(j)] = std::exp(x.data[at(j)] - shift) / sum;
            }
        }
    }
}

void softmax_backward(const HostTensor &dy, const HostTensor &sm,
                      dnn::SoftmaxAlgo algo, dnn::SoftmaxMode mode,
                      HostTensor &dx) {
    if (dy.shape != sm.shape)
        throw ShapeError::mismatch(sm.shape, dy.shape);
    if (dx.shape != sm.shape)
        throw ShapeError::mismatch(sm.shape, dx.shape);
    auto g = softmax_groups(sm.shape, mode);

    for (int64_t o = 0; o < g.outer; ++o) {
        for (int64_t i = 0; i < g.inner; ++i) {
            const int64_t base = o * g.len * g.inner + i;
            auto at = [&](int64_t j) { return base + j * g.inner; };

            if (algo == dnn::SoftmaxAlgo::Log) {
                double total = 0.0;
                for (int64_t j = 0; j < g.len; ++j)
                    total += dy.data[at(j)];
                for (int64_t j = 0; j < g.len; ++j)
                    dx.data[at(j)] =
                        dy.data[at(j)] - std::exp(sm.data[at(j)]) * total;
            } else {
                double dot = 0.0;
                for (int64_t j = 0; j < g.len; ++j)
                    dot += dy.data[at(j)] * sm.data[at(j)];
                for (int64_t j = 0; j < g.len; ++j)
                    dx.data[at(j)] = sm.data[at(j)] * (dy.data[at(j)] - dot);
            }
        }
    }
}

} // namespace host
} // namespace backends
} // namespace dnnlift
