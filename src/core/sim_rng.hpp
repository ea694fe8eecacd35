/**
 * RandomSource / SimRNG: injectable uniform random numbers.
 *
 * Everything in the engine that rolls dice (the outcome draw, the
 * narrative deflection amount) takes a RandomSource& so tests can feed
 * a scripted sequence. SimRNG is the production implementation: a
 * mulberry32 generator, seeded once per run.
 *
 * Header-only.
 */

#ifndef ASTRA_CORE_SIM_RNG_HPP
#define ASTRA_CORE_SIM_RNG_HPP

#include <cstdint>
#include <random>

namespace astra {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** Next value in [0, 1). */
    virtual double random() = 0;

    /** Uniform float in [a, b). */
    double uniform(double a, double b) {
        return a + random() * (b - a);
    }
};

class SimRNG : public RandomSource {
public:
    explicit SimRNG(int32_t seed = 42)
        : state_(seed ? seed : 1) {}

    /** mulberry32 core. */
    double random() override {
        state_ = static_cast<int32_t>(static_cast<uint32_t>(state_) + 0x6D2B79F5u);
        uint32_t t = static_cast<uint32_t>(state_);

        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);

        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /** Fresh seed for interactive runs, which are meant to differ. */
    static int32_t entropy_seed() {
        std::random_device rd;
        return static_cast<int32_t>(rd());
    }

private:
    int32_t state_;

    // Low 32 bits of the 64-bit product
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace astra

#endif // ASTRA_CORE_SIM_RNG_HPP
