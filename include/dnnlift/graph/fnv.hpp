#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace dnnlift {
namespace graph {

// FNV-1a streaming hash
inline constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
inline constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv_hash_byte(uint64_t h, uint8_t b) {
    h ^= b;
    h *= FNV_PRIME;
    return h;
}

inline uint64_t fnv_hash_u64(uint64_t h, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        h = fnv_hash_byte(h, static_cast<uint8_t>(val & 0xFF));
        val >>= 8;
    }
    return h;
}

inline uint64_t fnv_hash_i64(uint64_t h, int64_t val) {
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

inline uint64_t fnv_hash_double(uint64_t h, double val) {
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

inline uint64_t fnv_hash_bool(uint64_t h, bool val) {
    return fnv_hash_byte(h, val ? 1 : 0);
}

inline uint64_t fnv_hash_string(uint64_t h, const std::string &s) {
    h = fnv_hash_u64(h, s.size());
    for (char c : s)
        h = fnv_hash_byte(h, static_cast<uint8_t>(c));
    return h;
}

inline uint64_t fnv_hash_dims(uint64_t h, const std::vector<int64_t> &dims) {
    h = fnv_hash_u64(h, dims.size());
    for (auto d : dims)
        h = fnv_hash_i64(h, d);
    return h;
}

} // namespace graph
} // namespace dnnlift
