#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "compiled_function.hpp"
#include "graph_signature.hpp"

namespace dnnlift {
namespace graph {

// Thread-safe LRU cache of compiled functions keyed by cache_key(), so a
// change of backend version never hands out a stale plan.
class GraphCache {
  public:
    static GraphCache &instance();

    // Look up a compiled function by key. On cache miss, compiles `graph`
    // against `backend` and inserts it. The compilation itself happens
    // outside the lock, so concurrent compilations of different keys are
    // allowed.
    std::shared_ptr<CompiledFunction> get_or_compile(const GraphSignature &key,
                                                     const FunctionGraph &graph,
                                                     backends::BackendPtr backend);

    void clear();
    size_t size() const;
    size_t hits() const;
    size_t misses() const;

    static constexpr size_t MAX_SIZE = 256;

  private:
    GraphCache() = default;
    ~GraphCache() = default;
    GraphCache(const GraphCache &) = delete;
    GraphCache &operator=(const GraphCache &) = delete;

    using LRUList = std::list<GraphSignature>;
    LRUList lru_list_;

    struct CacheEntry {
        std::shared_ptr<CompiledFunction> function;
        LRUList::iterator lru_iter;
    };

    std::unordered_map<GraphSignature, CacheEntry, GraphSignatureHash> cache_;

    mutable std::mutex mutex_;
    size_t hits_ = 0;
    size_t misses_ = 0;

    void evict_if_needed();
};

} // namespace graph
} // namespace dnnlift
