#include "measurement_sampler.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

// Replays a fixed list of uniform draws.
class ScriptedStream : public RandomStream {
  public:
    explicit ScriptedStream(std::vector<double> draws)
        : draws_(std::move(draws)) {}

    double uniform(double, double) override {
        const double value = draws_.at(next_ % draws_.size());
        ++next_;
        return value;
    }

  private:
    std::vector<double> draws_;
    std::size_t next_ = 0;
};

ProbabilityDistribution make_dist(int n_qubits, std::vector<double> values) {
    return ProbabilityDistribution{n_qubits, std::move(values)};
}

int total(const MeasurementCounts& counts) {
    int sum = 0;
    for (const auto& [label, count] : counts) {
        sum += count;
    }
    return sum;
}

}  // namespace

TEST(MeasurementSamplerTests, CumulativeInversionPicksFirstOutcomeAboveDraw) {
    const auto dist = make_dist(2, {0.25, 0.25, 0.0, 0.5});
    ScriptedStream stream({0.0, 0.24, 0.25, 0.49, 0.5, 0.99});
    const auto outcomes = sample_outcomes(dist, 6, stream);
    EXPECT_EQ(outcomes, (std::vector<std::size_t>{0, 0, 1, 1, 3, 3}));
}

TEST(MeasurementSamplerTests, DrawBeyondRoundedTotalFallsBackToLastSupportedOutcome) {
    // Running total is slightly below one and the tail is zero.
    const auto dist = make_dist(2, {0.4999999, 0.5, 0.0, 0.0});
    ScriptedStream stream({0.99999999});
    const auto outcomes = sample_outcomes(dist, 1, stream);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0], 1u);
}

TEST(MeasurementSamplerTests, CountsSumToShotsAndUseLabels) {
    const auto dist = make_dist(2, {0.5, 0.0, 0.0, 0.5});
    MeasurementSampler sampler(7);
    const auto counts = sampler.sample(dist, 1000);
    EXPECT_EQ(total(counts), 1000);
    for (const auto& [label, count] : counts) {
        EXPECT_TRUE(label == "00" || label == "11") << label;
        EXPECT_GT(count, 0);
    }
}

TEST(MeasurementSamplerTests, DeterministicDistributionAlwaysHitsItsOutcome) {
    const auto dist = make_dist(2, {0.0, 1.0, 0.0, 0.0});
    MeasurementSampler sampler(3);
    const auto counts = sampler.sample(dist, 50);
    ASSERT_EQ(counts.size(), 1u);
    EXPECT_EQ(counts.at("01"), 50);
}

TEST(MeasurementSamplerTests, ZeroShotsGiveEmptyCounts) {
    MeasurementSampler sampler(1);
    EXPECT_TRUE(sampler.sample(make_dist(1, {0.5, 0.5}), 0).empty());
}

TEST(MeasurementSamplerTests, RejectsInvalidInput) {
    MeasurementSampler sampler(1);
    EXPECT_THROW(sampler.sample(make_dist(1, {0.5, 0.5}), -1), std::invalid_argument);
    EXPECT_THROW(sampler.sample(make_dist(1, {0.0, 0.0}), 10), std::invalid_argument);
    EXPECT_THROW(sampler.sample(make_dist(1, {-0.5, 1.5}), 10), std::invalid_argument);
}

TEST(MeasurementSamplerTests, SameSeedReproducesCounts) {
    const auto dist = make_dist(2, {0.1, 0.2, 0.3, 0.4});
    MeasurementSampler a(1234);
    MeasurementSampler b(1234);
    EXPECT_EQ(a.sample(dist, 500), b.sample(dist, 500));

    MeasurementSampler c(99);
    const auto first = c.sample(dist, 500);
    c.set_random_seed(1234);
    MeasurementSampler d(1234);
    EXPECT_EQ(c.sample(dist, 500), d.sample(dist, 500));
    EXPECT_EQ(total(first), 500);
}

TEST(MeasurementSamplerTests, LargestSeedIsReproducible) {
    const auto dist = make_dist(2, {0.1, 0.2, 0.3, 0.4});
    const std::uint64_t seed = std::numeric_limits<std::uint64_t>::max();
    MeasurementSampler a(seed);
    MeasurementSampler b(seed);
    EXPECT_EQ(a.sample(dist, 500), b.sample(dist, 500));
}

TEST(MeasurementSamplerTests, FrequenciesTrackProbabilities) {
    const auto dist = make_dist(1, {0.25, 0.75});
    MeasurementSampler sampler(42);
    const auto counts = sampler.sample(dist, 20000);
    const double freq_one = static_cast<double>(counts.at("1")) / 20000.0;
    EXPECT_NEAR(freq_one, 0.75, 0.02);
}
