#include "simplex_noise.hpp"

#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr int kGrad3[12][2] = {
    { 1, 1 }, { -1, 1 }, { 1, -1 }, { -1, -1 },
    { 1, 0 }, { -1, 0 }, { 1, 0 },  { -1, 0 },
    { 0, 1 }, { 0, -1 }, { 0, 1 },  { 0, -1 },
};

const double kF2 = 0.5 * (std::sqrt(3.0) - 1.0);
const double kG2 = (3.0 - std::sqrt(3.0)) / 6.0;

double cornerContribution(int gi, double x, double y) {
    double t = 0.5 - x * x - y * y;
    if (t < 0.0) return 0.0;
    t *= t;
    return t * t * (kGrad3[gi][0] * x + kGrad3[gi][1] * y);
}

double to01(double v) {
    return std::clamp((v + 1.0) * 0.5, 0.0, 1.0);
}

} // namespace

SimplexNoise::SimplexNoise(uint32_t seed) : seed_(seed) {
    std::array<uint8_t, 256> p{};
    for (int i = 0; i < 256; ++i) p[static_cast<size_t>(i)] = static_cast<uint8_t>(i);

    RNG rng(hashCombine(seed, tag32("NOISE")));
    for (int i = 255; i > 0; --i) {
        const int j = rng.range(0, i);
        std::swap(p[static_cast<size_t>(i)], p[static_cast<size_t>(j)]);
    }

    for (int i = 0; i < 512; ++i) perm_[static_cast<size_t>(i)] = p[static_cast<size_t>(i & 255)];
}

double SimplexNoise::sample(double xin, double yin) const {
    // Skew into simplex cell space.
    const double s = (xin + yin) * kF2;
    const int i = static_cast<int>(std::floor(xin + s));
    const int j = static_cast<int>(std::floor(yin + s));
    const double t = static_cast<double>(i + j) * kG2;

    const double x0 = xin - (static_cast<double>(i) - t);
    const double y0 = yin - (static_cast<double>(j) - t);

    int i1 = 0;
    int j1 = 1;
    if (x0 > y0) {
        i1 = 1;
        j1 = 0;
    }

    const double x1 = x0 - i1 + kG2;
    const double y1 = y0 - j1 + kG2;
    const double x2 = x0 - 1.0 + 2.0 * kG2;
    const double y2 = y0 - 1.0 + 2.0 * kG2;

    const int ii = i & 255;
    const int jj = j & 255;
    const int gi0 = perm_[static_cast<size_t>(ii + perm_[static_cast<size_t>(jj)])] % 12;
    const int gi1 = perm_[static_cast<size_t>(ii + i1 + perm_[static_cast<size_t>(jj + j1)])] % 12;
    const int gi2 = perm_[static_cast<size_t>(ii + 1 + perm_[static_cast<size_t>(jj + 1)])] % 12;

    const double n = cornerContribution(gi0, x0, y0) + cornerContribution(gi1, x1, y1) + cornerContribution(gi2, x2, y2);
    return 70.0 * n;
}

double SimplexNoise::sampleNormalized(double x, double y) const {
    return to01(sample(x, y));
}

double SimplexNoise::octaveSample(double x, double y, int octaves, double persistence, double baseFrequency) const {
    if (octaves < 1) octaves = 1;

    double total = 0.0;
    double amplitude = 1.0;
    double maxValue = 0.0;
    double frequency = baseFrequency;

    for (int o = 0; o < octaves; ++o) {
        total += sample(x * frequency, y * frequency) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= 2.0;
    }

    if (maxValue <= 0.0) return 0.0;
    return total / maxValue;
}

double SimplexNoise::octaveSampleNormalized(double x, double y, int octaves, double persistence,
                                            double baseFrequency) const {
    return to01(octaveSample(x, y, octaves, persistence, baseFrequency));
}
