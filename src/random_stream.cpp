#include "random_stream.hpp"

StdRandomStream::StdRandomStream(std::mt19937_64& rng) : rng_(rng) {}

double StdRandomStream::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

std::mt19937_64 make_rng(std::optional<std::uint64_t> seed) {
    std::mt19937_64 rng;
    if (seed) {
        rng.seed(*seed);
    } else {
        std::random_device rd;
        rng.seed((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    }
    return rng;
}
