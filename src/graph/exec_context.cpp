#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/graph_node.hpp"

namespace dnnlift {
namespace graph {

ExecContext::ExecContext(backends::BackendPtr backend)
    : backend_(std::move(backend)) {}

backends::Backend &ExecContext::backend() const {
    if (!backend_) {
        throw RuntimeError("accelerated operator executed without a backend "
                           "session");
    }
    return *backend_;
}

std::shared_ptr<backends::DescriptorResource>
ExecContext::descriptor(const Node &node, uint64_t params_hash,
                        const DescriptorFactory &create) {
    auto &session = backend();
    auto key = std::make_pair(node.id(), session.version());

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(key);
    if (it != descriptors_.end() && it->second.params_hash == params_hash)
        return it->second.resource;

    auto desc = create(session);
    if (!desc) {
        throw RuntimeError(session.name() + " returned no descriptor for " +
                           node.op().name());
    }
    descriptors_[key] = DescriptorEntry{params_hash, desc};
    return desc;
}

dnn::ConvAlgo ExecContext::resolve_algorithm(const Node &node,
                                             dnn::ConvAlgo request,
                                             const std::vector<Shape> &shapes,
                                             const AlgorithmChooser &choose) {
    if (!dnn::is_automatic(request))
        return request;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = algorithms_.find(node.id());
        if (it != algorithms_.end()) {
            bool stale = dnn::rechecks_on_shape_change(request) &&
                         it->second.shapes != shapes;
            if (!stale)
                return it->second.algo;
        }
    }

    // Choose outside the lock; timed choices run backend kernels
    dnn::ConvAlgo chosen = choose();

    std::lock_guard<std::mutex> lock(mutex_);
    auto &state = algorithms_[node.id()];
    state.algo = chosen;
    state.shapes = shapes;
    state.choices++;
    trace::diagnostic("algorithm", node.op().name() + " chose " +
                                       dnn::conv_algo_name(state.algo));
    return state.algo;
}

size_t ExecContext::cached_descriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_.size();
}

size_t ExecContext::algorithm_choices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto &[id, state] : algorithms_)
        total += state.choices;
    return total;
}

} // namespace graph
} // namespace dnnlift
