/// @file random_source.cpp
/// @brief RandomSource helpers and the seeded Mersenne-Twister source.

#include "nsim/foundation/random_source.hpp"

#include <cmath>
#include <utility>

namespace nsim::foundation {

int64_t RandomSource::uniformInt(int64_t min, int64_t max) {
    if (max < min) {
        std::swap(min, max);
    }
    auto span = static_cast<double>(max - min + 1);
    return static_cast<int64_t>(std::floor(next() * span)) + min;
}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : seed_(seed), engine_(seed) {}

SeededRandomSource::SeededRandomSource()
    : SeededRandomSource((static_cast<uint64_t>(std::random_device{}()) << 32) |
                         std::random_device{}()) {}

double SeededRandomSource::next() {
    double draw = dist_(engine_);
    // uniform_real_distribution may return its upper bound on some libraries.
    return draw < 1.0 ? draw : std::nextafter(1.0, 0.0);
}

} // namespace nsim::foundation
