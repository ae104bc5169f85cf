#include "circuit/validator.hpp"
#include "circuit_simulator.hpp"
#include "stabilizer_sampler.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

SimulatorConfig stabilizer_config(std::uint64_t seed) {
    SimulatorConfig cfg;
    cfg.sampler = SamplerKind::kStabilizer;
    cfg.seed = seed;
    return cfg;
}

}  // namespace

#ifdef QLAB_WITH_STIM

TEST(StabilizerSamplerTests, BackendIsAvailable) {
    EXPECT_TRUE(has_stabilizer_backend());
}

TEST(StabilizerSamplerTests, BellCountsOnlyCorrelatedOutcomes) {
    CircuitSimulator simulator(stabilizer_config(3));
    const auto snapshot = simulator.simulate({{"h", {0}}, {"cx", {0, 1}}}, 2, 500);
    int total = 0;
    for (const auto& [label, count] : snapshot.counts) {
        EXPECT_TRUE(label == "00" || label == "11") << label;
        total += count;
    }
    EXPECT_EQ(total, 500);
}

TEST(StabilizerSamplerTests, LabelsMatchStatevectorConvention) {
    CircuitValidator validator;
    const auto circuit = validator.validate({{"x", {0}}, {"s", {0}}, {"y", {2}}}, 3);
    const auto counts = sample_stabilizer_counts(circuit, circuit.ops.size(), 20, 1);
    ASSERT_EQ(counts.size(), 1u);
    EXPECT_EQ(counts.at("101"), 20);
}

TEST(StabilizerSamplerTests, PrefixLengthSelectsOps) {
    CircuitValidator validator;
    const auto circuit = validator.validate({{"x", {0}}, {"x", {1}}}, 2);
    EXPECT_EQ(sample_stabilizer_counts(circuit, 0, 5, 1).at("00"), 5);
    EXPECT_EQ(sample_stabilizer_counts(circuit, 1, 5, 1).at("01"), 5);
    EXPECT_EQ(sample_stabilizer_counts(circuit, 2, 5, 1).at("11"), 5);
}

TEST(StabilizerSamplerTests, StepsUseStabilizerCounts) {
    CircuitSimulator simulator(stabilizer_config(8));
    const auto result = simulator.simulate_steps({{"x", {1}}, {"cx", {1, 0}}}, 2, 10);
    ASSERT_EQ(result.steps.size(), 3u);
    EXPECT_EQ(result.steps[0].counts.at("00"), 10);
    EXPECT_EQ(result.steps[1].counts.at("10"), 10);
    EXPECT_EQ(result.steps[2].counts.at("11"), 10);
}

#else

TEST(StabilizerSamplerTests, BackendIsUnavailable) {
    EXPECT_FALSE(has_stabilizer_backend());
}

TEST(StabilizerSamplerTests, SamplingExplainsHowToEnable) {
    CircuitSimulator simulator(stabilizer_config(3));
    try {
        simulator.simulate({{"h", {0}}}, 1, 10);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& ex) {
        EXPECT_NE(std::string(ex.what()).find("QLAB_WITH_STIM"), std::string::npos);
    }
}

#endif  // QLAB_WITH_STIM

TEST(StabilizerSamplerTests, NonCliffordCircuitsAreRejectedBeforeSampling) {
    CircuitSimulator simulator(stabilizer_config(3));
    EXPECT_THROW(simulator.simulate({{"t", {0}}}, 1, 10), std::invalid_argument);
}
