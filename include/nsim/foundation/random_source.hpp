#pragma once

/// @file random_source.hpp
/// @brief Injectable uniform [0,1) generator, the engine's only source of chance.

#include <cstdint>
#include <random>

namespace nsim::foundation {

/// Uniform draws in [0,1).
///
/// Every probabilistic rule (random conditions, weighted event picks,
/// effect ranges, follow-up chances) consumes draws from one instance,
/// so a run is reproducible under a fixed seed.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Next uniform draw in [0,1).
    virtual double next() = 0;

    /// Uniform integer in [min, max] (inclusive); consumes one draw.
    int64_t uniformInt(int64_t min, int64_t max);
};

/// Mersenne-Twister backed source for real runs.
class SeededRandomSource final : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    /// Seeded from std::random_device.
    SeededRandomSource();

    double next() override;

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace nsim::foundation
