#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace patchbench::hash {

// FNV-1a 64. Stable across platforms and runs; used for content-derived
// identifiers (task ids) and the event-log chain. Not a crypto hash.
inline uint64_t fnv1a64(const std::string& s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

inline std::string hex64(uint64_t v) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

inline std::string fnv1a64_hex(const std::string& s) { return hex64(fnv1a64(s)); }

} // namespace patchbench::hash
