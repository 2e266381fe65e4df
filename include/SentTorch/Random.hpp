#pragma once

#include <cstdint>
#include <random>

namespace st {

/// Per-thread engine shared by parameter init, dropout masks and sampling.
inline std::mt19937& generator() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

inline void manual_seed(std::uint32_t seed) {
    generator().seed(seed);
}

} // namespace st
