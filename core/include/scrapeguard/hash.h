#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace scrapeguard::hash {

// ---------- FNV-1a 64 (stable, non-crypto) ----------
// Identifies code versions in logs and diagnostics; not a security digest.
inline uint64_t fnv1a64_bytes(const uint8_t* data, size_t n) {
    uint64_t h = 1469598103934665603ULL;
    for (size_t i = 0; i < n; i++) { h ^= data[i]; h *= 1099511628211ULL; }
    return h;
}
inline uint64_t fnv1a64(const std::string& s) {
    return fnv1a64_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}
inline std::string hex64(uint64_t v) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

inline std::string code_digest(const std::string& code) {
    return hex64(fnv1a64(code));
}

} // namespace scrapeguard::hash
