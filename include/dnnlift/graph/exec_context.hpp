#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dnnlift/backends/backend.hpp"
#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/shape.hpp"

namespace dnnlift {
namespace graph {

class Node;

// Per compiled function execution state: the backend session, the
// descriptor cache and the cached algorithm choices of automatic
// convolution nodes.
class ExecContext {
  public:
    explicit ExecContext(backends::BackendPtr backend = nullptr);

    bool has_backend() const { return backend_ != nullptr; }

    // Throws RuntimeError when the function was compiled without a backend
    backends::Backend &backend() const;

    using DescriptorFactory =
        std::function<std::shared_ptr<backends::DescriptorResource>(
            backends::Backend &)>;

    // Descriptor of `node` for the current backend version, created on
    // first use. Entries are keyed by (node, backend version) so a handle
    // is never reused across versions. `params_hash` identifies the
    // resolved parameters; a different hash replaces the cached handle.
    std::shared_ptr<backends::DescriptorResource>
    descriptor(const Node &node, uint64_t params_hash,
               const DescriptorFactory &create);

    using AlgorithmChooser = std::function<dnn::ConvAlgo()>;

    // Fixed algorithm for an automatic request. The choice is cached per
    // node, either once or until the operand shapes change.
    dnn::ConvAlgo resolve_algorithm(const Node &node, dnn::ConvAlgo request,
                                    const std::vector<Shape> &shapes,
                                    const AlgorithmChooser &choose);

    size_t cached_descriptors() const;
    size_t algorithm_choices() const;

  private:
    struct AlgorithmState {
        dnn::ConvAlgo algo = dnn::ConvAlgo::Plain;
        std::vector<Shape> shapes;
        size_t choices = 0;
    };

    struct DescriptorEntry {
        uint64_t params_hash = 0;
        std::shared_ptr<backends::DescriptorResource> resource;
    };

    backends::BackendPtr backend_;
    mutable std::mutex mutex_;
    std::map<std::pair<uint64_t, int>, DescriptorEntry> descriptors_;
    std::unordered_map<uint64_t, AlgorithmState> algorithms_;
};

} // namespace graph
} // namespace dnnlift
