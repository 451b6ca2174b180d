#pragma once

#include <array>
#include <cstdint>

// Seeded 2D simplex noise.
//
// The permutation table is a Fisher-Yates shuffle driven by the project RNG, so the
// same seed produces the same field on every platform. Everything after
// construction is pure double arithmetic.
class SimplexNoise {
public:
    explicit SimplexNoise(uint32_t seed = 0);

    uint32_t seed() const { return seed_; }

    // Single octave in roughly [-1, 1].
    double sample(double x, double y) const;
    // Single octave mapped to [0, 1].
    double sampleNormalized(double x, double y) const;

    // Fractal sum of `octaves` copies, each at twice the frequency and `persistence`
    // times the amplitude of the previous one, divided by the total amplitude.
    double octaveSample(double x, double y, int octaves, double persistence, double baseFrequency) const;
    // octaveSample mapped to [0, 1].
    double octaveSampleNormalized(double x, double y, int octaves, double persistence, double baseFrequency) const;

private:
    uint32_t seed_ = 0;
    std::array<uint8_t, 512> perm_{};
};
