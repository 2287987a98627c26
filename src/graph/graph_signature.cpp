#include "dnnlift/graph/graph_signature.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "dnnlift/graph/function_graph.hpp"

#include <type_traits>
#include <unordered_map>

namespace dnnlift {
namespace graph {

static uint64_t hash_type(uint64_t h, const ValueType &type) {
    h = fnv_hash_u64(h, static_cast<uint64_t>(type.kind));
    h = fnv_hash_u64(h, static_cast<uint64_t>(type.dtype));
    h = fnv_hash_dims(h, type.dims);
    h = fnv_hash_bool(h, type.contents.has_value());
    if (type.contents)
        h = fnv_hash_dims(h, *type.contents);
    return fnv_hash_string(h, type.native_type);
}

static uint64_t hash_constant(uint64_t h, const Datum &value) {
    h = fnv_hash_u64(h, value.index());
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, HostTensorPtr>) {
                h = fnv_hash_dims(h, v->shape);
                for (double x : v->data)
                    h = fnv_hash_double(h, x);
            } else if constexpr (std::is_same_v<T, double>) {
                h = fnv_hash_double(h, v);
            } else if constexpr (std::is_same_v<T, Shape>) {
                h = fnv_hash_dims(h, v);
            }
            // monostate / descriptors: nothing to hash
        },
        value);
    return h;
}

GraphSignature compute_signature(const std::vector<ValuePtr> &inputs,
                                 const std::vector<ValuePtr> &outputs) {
    auto sorted = topo_sort(outputs);

    // Local indices give every node and leaf a position-independent name
    std::unordered_map<const Node *, uint32_t> node_index;
    for (uint32_t i = 0; i < sorted.size(); ++i) {
        node_index[sorted[i].get()] = i;
    }
    std::unordered_map<const Value *, uint32_t> input_index;
    for (uint32_t i = 0; i < inputs.size(); ++i) {
        input_index[inputs[i].get()] = i;
    }

    uint64_t h = FNV_OFFSET;
    h = fnv_hash_u64(h, inputs.size());
    for (const auto &in : inputs)
        h = hash_type(h, in->type());

    auto hash_edge = [&](uint64_t acc, const ValuePtr &v) {
        if (v->owner_raw()) {
            acc = fnv_hash_byte(acc, 'n');
            acc = fnv_hash_u64(acc, node_index.at(v->owner_raw()));
            return fnv_hash_u64(acc, v->index());
        }
        auto it = input_index.find(v.get());
        if (it != input_index.end()) {
            acc = fnv_hash_byte(acc, 'i');
            return fnv_hash_u64(acc, it->second);
        }
        if (v->is_constant()) {
            acc = fnv_hash_byte(acc, 'c');
            acc = hash_type(acc, v->type());
            return hash_constant(acc, v->constant_value());
        }
        // Free leaf not listed among the inputs
        acc = fnv_hash_byte(acc, 'f');
        return hash_type(acc, v->type());
    };

    h = fnv_hash_u64(h, sorted.size());
    for (const auto &node : sorted) {
        h = node->op().hash_params(
            fnv_hash_u64(h, static_cast<uint64_t>(node->kind())));

        h = fnv_hash_u64(h, node->inputs().size());
        for (const auto &in : node->inputs())
            h = hash_edge(h, in);

        h = fnv_hash_u64(h, node->num_outputs());
        for (size_t i = 0; i < node->num_outputs(); ++i)
            h = hash_type(h, node->output(i)->type());
    }

    h = fnv_hash_u64(h, outputs.size());
    for (const auto &out : outputs)
        h = hash_edge(h, out);

    return GraphSignature{h};
}

GraphSignature cache_key(const GraphSignature &signature,
                         int backend_version) {
    uint64_t h = fnv_hash_u64(FNV_OFFSET, signature.hash);
    h = fnv_hash_i64(h, backend_version);
    return GraphSignature{h};
}

} // namespace graph
} // namespace dnnlift
