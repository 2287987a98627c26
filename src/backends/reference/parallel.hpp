#pragma once

#include <cstddef>

#ifdef DNNLIFT_USE_OPENMP
#include <omp.h>
#endif

namespace dnnlift {
namespace backends {
namespace host {
namespace parallel {

// Multiply-accumulates below which a kernel stays on one thread
constexpr size_t MIN_PARALLEL_MACS = 1 << 20;

/// Check if a kernel doing `macs` multiply-accumulates should fan out
inline bool should_parallelize(size_t macs,
                               size_t min_macs = MIN_PARALLEL_MACS) {
#ifdef DNNLIFT_USE_OPENMP
    return macs >= min_macs && omp_get_max_threads() > 1;
#else
    (void)macs;
    (void)min_macs;
    return false;
#endif
}

} // namespace parallel
} // namespace host
} // namespace backends
} // namespace dnnlift
