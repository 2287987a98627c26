// Convolution lowering benchmarks
// Times the three ways the convolution entry point can lower a
// convolution (forward kernel, weight-gradient kernel, input-gradient
// kernel) and the forward algorithms, all on the host reference backend.
//
// Usage:
//   ./build/bench_conv_lowering --benchmark_filter=Lowering

#include <benchmark/benchmark.h>

#include <dnnlift/dnnlift.hpp>

using namespace dnnlift;
using dnn::ConvAlgo;
using dnn::DirectionHint;
using dnn::Padding;

namespace {

backends::GatePtr bench_gate() {
    static backends::GatePtr gate = [] {
        backends::GateEnvironment env;
        env.device = std::make_shared<backends::StaticDeviceBinding>(
            backends::DeviceInfo{"cuda", "sm_70", "benchmark device"});
        env.session_factory = [](const DnnConfig &) {
            return backends::make_reference_backend(5000);
        };
        return backends::make_gate(std::move(env));
    }();
    return gate;
}

struct Prepared {
    std::shared_ptr<graph::CompiledFunction> plan;
    std::vector<graph::Datum> args;
};

Prepared prepare(int64_t size, const dnn::ConvolutionOptions &opts) {
    auto gate = bench_gate();
    Shape img_dims = {8, 16, size, size};
    Shape kern_dims = {32, 16, 3, 3};
    auto img = graph::tensor_input(DType::Float32, img_dims, "img");
    auto kern = graph::tensor_input(DType::Float32, kern_dims, "kern");
    auto out = dnn::convolution(*gate, img, kern, opts);

    graph::FunctionGraph fg({img, kern}, {out});
    Prepared p;
    p.plan = graph::compile(fg, gate->backend());
    p.args = {HostTensor::uniform(DType::Float32, img_dims, 1),
              HostTensor::uniform(DType::Float32, kern_dims, 2)};
    return p;
}

void run(benchmark::State &state, const dnn::ConvolutionOptions &opts) {
    auto p = prepare(state.range(0), opts);

    // Warmup
    for (int i = 0; i < 2; ++i)
        graph::GraphExecutor::execute(*p.plan, p.args);

    for (auto _ : state) {
        auto results = graph::GraphExecutor::execute(*p.plan, p.args);
        benchmark::DoNotOptimize(results);
    }
}

} // namespace

// ============================================================================
// Lowerings
// ============================================================================

static void BM_Lowering_ValidForward(benchmark::State &state) {
    dnn::ConvolutionOptions opts;
    opts.direction_hint = DirectionHint::Forward;
    run(state, opts);
}

static void BM_Lowering_ValidWeightGradient(benchmark::State &state) {
    dnn::ConvolutionOptions opts;
    opts.direction_hint = DirectionHint::BpropWeights;
    run(state, opts);
}

static void BM_Lowering_FullInputGradient(benchmark::State &state) {
    dnn::ConvolutionOptions opts;
    opts.border = Padding::full();
    run(state, opts);
}

static void BM_Lowering_FullForward(benchmark::State &state) {
    dnn::ConvolutionOptions opts;
    opts.border = Padding::full();
    opts.direction_hint = DirectionHint::ForceForward;
    run(state, opts);
}

// ============================================================================
// Forward algorithms
// ============================================================================

static void BM_Algorithm(benchmark::State &state, ConvAlgo algo) {
    dnn::ConvolutionOptions opts;
    opts.algo = algo;
    run(state, opts);
}

BENCHMARK(BM_Lowering_ValidForward)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Lowering_ValidWeightGradient)
    ->Arg(16)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Lowering_FullInputGradient)
    ->Arg(16)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Lowering_FullForward)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond);

BENCHMARK_CAPTURE(BM_Algorithm, none, ConvAlgo::Plain)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(BM_Algorithm, small, ConvAlgo::Precomputed)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(BM_Algorithm, large, ConvAlgo::Gemm)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
BENCHMARK_CAPTURE(BM_Algorithm, fft, ConvAlgo::Fft)
    ->Arg(32)
    ->Unit(benchmark::kMillisecond);
