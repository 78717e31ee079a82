/**
 * SimRng — Seeded PRNG for reproducible synthetic traffic.
 *
 * mulberry32 core: 32-bit state, one multiply-xorshift round per draw.
 * Same seed, same traffic, on every platform.
 */

#ifndef SKYTRAFFIC_TRACKING_SIM_RNG_HPP
#define SKYTRAFFIC_TRACKING_SIM_RNG_HPP

#include <cmath>
#include <cstdint>

namespace skytraffic::tracking {

class SimRng {
public:
    explicit SimRng(uint32_t seed = 42) : state_(seed) {}

    /// Next double in [0, 1).
    double random() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = mul32(t ^ (t >> 15), t | 1u);
        t ^= t + mul32(t ^ (t >> 7), t | 61u);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    double uniform(double a, double b) {
        return a + random() * (b - a);
    }

    /// Integer in [lo, hi].
    int uniform_int(int lo, int hi) {
        return lo + static_cast<int>(random() * static_cast<double>(hi - lo + 1));
    }

    bool bernoulli(double p) {
        return random() < p;
    }

    /** Gaussian sample via Box-Muller. */
    double gaussian(double mean = 0.0, double stddev = 1.0) {
        double u1 = random();
        double u2 = random();
        if (u1 < 1e-12) u1 = 1e-12;
        return mean + stddev * std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * M_PI * u2);
    }

private:
    uint32_t state_;

    static uint32_t mul32(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(static_cast<uint64_t>(a) * b);
    }
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_SIM_RNG_HPP
