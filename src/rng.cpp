#include "rng.hpp"

#include <cmath>

double Rng::uniform()
{
    return static_cast<double>(engine() >> 11) * (1.0 / 9007199254740992.0);
}

int64_t Rng::uniform_int(int64_t lo, int64_t hi)
{
    if (hi <= lo) return lo;
    const uint64_t range = static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo);
    if (range == UINT64_MAX) return static_cast<int64_t>(engine());

    // Reject the tail that would bias the modulo.
    const uint64_t span  = range + 1;
    const uint64_t limit = UINT64_MAX - (UINT64_MAX % span);
    uint64_t x;
    do {
        x = engine();
    } while (x >= limit);
    return static_cast<int64_t>(static_cast<uint64_t>(lo) + x % span);
}

double Rng::normal(double mean, double stddev)
{
    double u1 = uniform();
    while (u1 <= 0.0) u1 = uniform();
    const double u2 = uniform();
    const double z  = std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
    return mean + stddev * z;
}
