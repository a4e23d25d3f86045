#pragma once

#include <cstdint>
#include <random>
#include <vector>

// The one source of randomness a trial hands to its drawing code.
//
// Wraps the 64-bit Mersenne Twister. Every draw is computed from the raw
// engine output with plain arithmetic rather than <random> distributions,
// whose output is not specified across standard libraries. Move-only so a
// stream cannot be forked by accident.
class Rng {
public:
    explicit Rng(uint64_t seed) : engine(seed) {}

    Rng(const Rng&) = delete;
    Rng& operator=(const Rng&) = delete;
    Rng(Rng&&) = default;
    Rng& operator=(Rng&&) = default;

    uint64_t next_u64() { return engine(); }

    // [0, 1) with 53 bits of precision.
    double uniform();
    double uniform(double lo, double hi) { return lo + (hi - lo) * uniform(); }

    // [lo, hi] inclusive, unbiased. Returns lo when hi < lo.
    int64_t uniform_int(int64_t lo, int64_t hi);

    // Box-Muller.
    double normal(double mean = 0.0, double stddev = 1.0);

    bool chance(double p) { return uniform() < p; }

    // Caller must pass a non-empty vector.
    template<typename T>
    const T& pick(const std::vector<T>& items)
    {
        const int64_t i = uniform_int(0, static_cast<int64_t>(items.size()) - 1);
        return items[static_cast<size_t>(i)];
    }

private:
    std::mt19937_64 engine;
};
