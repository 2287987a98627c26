#pragma once

// Backend version numbers are MAJOR * 1000 + MINOR * 100 + PATCH, the way
// the kernel library reports them.

namespace dnnlift {
namespace backends {

// Oldest library the layer runs against (v2 final)
inline constexpr int kMinimumVersion = 2000;

// v3 release candidates, rejected: [kReleaseCandidateFirst, kReleaseCandidateEnd)
inline constexpr int kReleaseCandidateFirst = 3000;
inline constexpr int kReleaseCandidateEnd = 3007;

// Feature levels
inline constexpr int kNdDescriptorVersion = 3000;
inline constexpr int kFftVersion = 3000;
inline constexpr int kAutoAlgorithmVersion = 3000;
inline constexpr int kLogSoftmaxVersion = 3000;

// Lowest device compute capability, as XY in "sm_XY"
inline constexpr int kMinComputeCapability = 30;

} // namespace backends
} // namespace dnnlift
