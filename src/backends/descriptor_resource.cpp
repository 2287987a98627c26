#include "dnnlift/backends/backend.hpp"
#include "dnnlift/debug.hpp"

namespace dnnlift {
namespace backends {

DescriptorResource::DescriptorResource(std::string native_type, void *handle,
                                       Releaser release, int backend_version)
    : native_type_(std::move(native_type)), handle_(handle),
      release_(std::move(release)), backend_version_(backend_version) {
    trace::Tracer::instance().record("descriptor", "create", native_type_);
}

DescriptorResource::~DescriptorResource() {
    if (handle_ != nullptr && release_) {
        release_(handle_);
        trace::Tracer::instance().record("descriptor", "release",
                                         native_type_);
    }
    handle_ = nullptr;
}

} // namespace backends
} // namespace dnnlift
