#include "measurement_sampler.hpp"

#include "observables.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

MeasurementSampler::MeasurementSampler(std::optional<std::uint64_t> seed)
    : rng_(make_rng(seed)) {}

void MeasurementSampler::set_random_seed(std::uint64_t seed) {
    rng_.seed(seed);
}

MeasurementCounts MeasurementSampler::sample(
    const ProbabilityDistribution& distribution,
    int shots
) {
    StdRandomStream stream(rng_);
    return sample_counts(distribution, shots, stream);
}

std::vector<std::size_t> sample_outcomes(
    const ProbabilityDistribution& distribution,
    int shots,
    RandomStream& rng
) {
    if (shots < 0) {
        throw std::invalid_argument("Shot count must be non-negative");
    }
    std::vector<std::size_t> outcomes;
    if (shots == 0) {
        return outcomes;
    }
    const auto& values = distribution.values;
    if (values.empty()) {
        throw std::invalid_argument("Cannot sample from an empty distribution");
    }

    std::vector<double> cumulative(values.size());
    double running = 0.0;
    std::size_t last_supported = values.size();
    for (std::size_t k = 0; k < values.size(); ++k) {
        const double p = values[k];
        if (!(p >= 0.0) || !std::isfinite(p)) {
            throw std::invalid_argument("Distribution contains an invalid probability");
        }
        running += p;
        cumulative[k] = running;
        if (p > 0.0) {
            last_supported = k;
        }
    }
    if (last_supported == values.size()) {
        throw std::invalid_argument("Distribution has zero total probability");
    }

    outcomes.reserve(static_cast<std::size_t>(shots));
    for (int shot = 0; shot < shots; ++shot) {
        const double u = rng.uniform(0.0, 1.0);
        const auto it = std::upper_bound(cumulative.begin(), cumulative.end(), u);
        // Rounding can leave the final running sum just below u.
        const std::size_t index = it == cumulative.end()
            ? last_supported
            : static_cast<std::size_t>(it - cumulative.begin());
        outcomes.push_back(index);
    }
    return outcomes;
}

MeasurementCounts sample_counts(
    const ProbabilityDistribution& distribution,
    int shots,
    RandomStream& rng
) {
    MeasurementCounts counts;
    for (std::size_t index : sample_outcomes(distribution, shots, rng)) {
        counts[outcome_label(index, distribution.n_qubits)] += 1;
    }
    return counts;
}
