#include "dnnlift/graph/graph_cache.hpp"

namespace dnnlift {
namespace graph {

GraphCache &GraphCache::instance() {
    static GraphCache cache;
    return cache;
}

std::shared_ptr<CompiledFunction>
GraphCache::get_or_compile(const GraphSignature &key,
                           const FunctionGraph &graph,
                           backends::BackendPtr backend) {
    // Phase 1: lookup under lock
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            hits_++;
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iter);
            return it->second.function;
        }
        misses_++;
    }

    // Phase 2: compile without lock
    auto compiled = compile(graph, std::move(backend));

    // Phase 3: insert under lock
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Another thread may have compiled the same key meanwhile
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iter);
            return it->second.function;
        }

        lru_list_.push_front(key);
        CacheEntry entry;
        entry.function = compiled;
        entry.lru_iter = lru_list_.begin();
        cache_[key] = entry;

        evict_if_needed();
    }

    return compiled;
}

void GraphCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_list_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t GraphCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

size_t GraphCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t GraphCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void GraphCache::evict_if_needed() {
    while (cache_.size() > MAX_SIZE && !lru_list_.empty()) {
        auto &oldest = lru_list_.back();
        cache_.erase(oldest);
        lru_list_.pop_back();
    }
}

} // namespace graph
} // namespace dnnlift
