#pragma once

// Host implementation of the kernel-library interface. It is not a tuned
// library: it exists so graphs built by the accelerated layer can be
// evaluated and checked numerically without a device.

#include <cstddef>

#include "dnnlift/backends/backend.hpp"

namespace dnnlift {
namespace backends {

// `header_version` defaults to `version`; pass a different value to model
// a session whose headers and library disagree.
BackendPtr make_reference_backend(int version, int header_version = -1);

// Descriptors created by any reference backend and not yet released
size_t live_reference_descriptors();

} // namespace backends
} // namespace dnnlift
