/**
 * SimRNG - Seeded PRNG for reproducible telemetry simulation.
 *
 * mulberry32 core: a 32-bit state, one multiply-xorshift round per draw.
 * The sequence depends only on the seed, never on the platform or the
 * standard library, so a fixed seed reproduces a run bit-for-bit.
 *
 * Header-only. No dependencies beyond <cstdint> and <cmath>.
 */

#ifndef RXNET_CORE_SIM_RNG_HPP
#define RXNET_CORE_SIM_RNG_HPP

#include <cstdint>
#include <cmath>

namespace rxnet {

class SimRNG {
public:
    explicit SimRNG(int32_t seed = 42)
        : state_(static_cast<uint32_t>(seed ? seed : 1)) {}

    /** Next double in [0, 1). */
    double random() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /**
     * Bernoulli trial: returns true with probability p.
     * Always consumes exactly one draw, so p = 0 and p = 1 keep the
     * stream aligned with every other probability.
     */
    bool bernoulli(double p) {
        return random() < p;
    }

    /** Uniform double in [a, b). Returns a when a == b. */
    double uniform(double a, double b) {
        return a + random() * (b - a);
    }

    /** Gaussian sample via Box-Muller transform. */
    double gaussian(double mean = 0.0, double stddev = 1.0) {
        double u1 = random();
        double u2 = random();
        if (u1 < 1e-10) u1 = 1e-10;
        double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * M_PI * u2);
        return mean + z0 * stddev;
    }

    /** base + offset with 32-bit wraparound (trial i of a batch). */
    static int32_t offset_seed(int32_t base, int offset) {
        return static_cast<int32_t>(static_cast<uint32_t>(base) + static_cast<uint32_t>(offset));
    }

    /**
     * Derive an independent stream seed from a master seed.
     * Used to give each receiver / worker / trial phase its own generator
     * so results do not depend on how work is scheduled across threads.
     * splitmix32-style finalizer over (master, stream).
     */
    static int32_t derive_seed(int32_t master, uint32_t stream) {
        uint32_t z = static_cast<uint32_t>(master) + 0x9E3779B9u * (stream + 1u);
        z = imul(z ^ (z >> 16), 0x85EBCA6Bu);
        z = imul(z ^ (z >> 13), 0xC2B2AE35u);
        z ^= z >> 16;
        return static_cast<int32_t>(z);
    }

private:
    uint32_t state_;

    /** Low 32 bits of the 64-bit product. */
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace rxnet

#endif // RXNET_CORE_SIM_RNG_HPP
