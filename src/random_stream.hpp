#pragma once

#include <cstdint>
#include <optional>
#include <random>

// Uniform source consumed by the samplers. Tests substitute scripted streams.
class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

class StdRandomStream : public RandomStream {
  public:
    explicit StdRandomStream(std::mt19937_64& rng);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64& rng_;
};

// Seeds from std::random_device when `seed` is empty. Every uint64 value,
// including the maximum, is a usable seed.
std::mt19937_64 make_rng(std::optional<std::uint64_t> seed);
