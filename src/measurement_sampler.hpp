#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "circuit/observables.types.hpp"
#include "random_stream.hpp"

// Shot sampling by cumulative-probability inversion. Outcomes are scanned
// in ascending basis-index order; a draw u in [0, 1) selects the first
// outcome whose running sum exceeds u.
class MeasurementSampler {
  public:
    // No seed draws one from std::random_device.
    explicit MeasurementSampler(std::optional<std::uint64_t> seed = std::nullopt);

    void set_random_seed(std::uint64_t seed);

    MeasurementCounts sample(const ProbabilityDistribution& distribution, int shots);

  private:
    std::mt19937_64 rng_;
};

// Basis indices of `shots` independent draws using `rng`.
std::vector<std::size_t> sample_outcomes(
    const ProbabilityDistribution& distribution,
    int shots,
    RandomStream& rng
);

MeasurementCounts sample_counts(
    const ProbabilityDistribution& distribution,
    int shots,
    RandomStream& rng
);
