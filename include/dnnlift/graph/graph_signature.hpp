#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "value.hpp"

namespace dnnlift {
namespace graph {

struct GraphSignature {
    uint64_t hash;
    bool operator==(const GraphSignature &o) const { return hash == o.hash; }
    bool operator!=(const GraphSignature &o) const { return hash != o.hash; }
};

struct GraphSignatureHash {
    size_t operator()(const GraphSignature &s) const {
        return static_cast<size_t>(s.hash);
    }
};

// Structural signature of the graph computing `outputs` from `inputs`:
// operator kinds and parameters, value types, edges and constant payloads.
// Two graphs with the same structure produce the same signature regardless
// of where their nodes live in memory.
GraphSignature compute_signature(const std::vector<ValuePtr> &inputs,
                                 const std::vector<ValuePtr> &outputs);

// Compiled-artifact cache key: the structural signature combined with the
// detected backend version, so that a backend upgrade invalidates every
// compiled function built against the previous version.
GraphSignature cache_key(const GraphSignature &signature, int backend_version);

} // namespace graph
} // namespace dnnlift
