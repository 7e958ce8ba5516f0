#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ga {

// Milliseconds on the steady clock, for elapsed times
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// FNV-1a 64-bit
static inline uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

// Ids arrive as strings or numbers; compare them in one form.
static inline std::string id_to_string(const json& id) {
    if (id.is_string()) return id.get<std::string>();
    return id.dump();
}

} // namespace ga
