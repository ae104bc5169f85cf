#include "circuit/errors.hpp"
#include "circuit_simulator.hpp"
#include "progress_reporter.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

SimulatorConfig seeded_config(std::uint64_t seed) {
    SimulatorConfig cfg;
    cfg.seed = seed;
    return cfg;
}

int total(const MeasurementCounts& counts) {
    int sum = 0;
    for (const auto& [label, count] : counts) {
        sum += count;
    }
    return sum;
}

struct CountingReporter : qlab::ProgressReporter {
    std::size_t completed = 0;
    std::size_t logs = 0;

    void set_total_steps(std::size_t) override {}
    void increment_completed_steps(std::size_t delta) override { completed += delta; }
    void record_log(const ExecutionLog&) override { ++logs; }
};

}  // namespace

TEST(CircuitSimulatorTests, BellStateSnapshot) {
    CircuitSimulator simulator(seeded_config(11));
    const auto snapshot = simulator.simulate({{"h", {0}}, {"cx", {0, 1}}}, 2, 1000);

    ASSERT_EQ(snapshot.statevector.size(), 4u);
    EXPECT_NEAR(snapshot.probabilities.values[0], 0.5, 1e-12);
    EXPECT_NEAR(snapshot.probabilities.values[3], 0.5, 1e-12);
    ASSERT_EQ(snapshot.bloch.size(), 2u);
    EXPECT_NEAR(snapshot.bloch[0].z, 0.0, 1e-12);
    EXPECT_EQ(total(snapshot.counts), 1000);
    EXPECT_EQ(snapshot.counts.count("01"), 0u);
    EXPECT_EQ(snapshot.counts.count("10"), 0u);
    EXPECT_GT(snapshot.counts.at("00"), 400);
    EXPECT_GT(snapshot.counts.at("11"), 400);
}

TEST(CircuitSimulatorTests, DefaultShotsComeFromConfig) {
    SimulatorConfig cfg = seeded_config(1);
    cfg.default_shots = 64;
    CircuitSimulator simulator(cfg);
    EXPECT_EQ(total(simulator.simulate({{"h", {0}}}, 1).counts), 64);
    EXPECT_EQ(simulator.config().default_shots, 64);
}

TEST(CircuitSimulatorTests, SeededRunsAreReproducible) {
    const std::vector<GateRequest> ops{{"h", {0}}, {"h", {1}}, {"t", {1}}, {"h", {1}}};
    CircuitSimulator a(seeded_config(77));
    CircuitSimulator b(seeded_config(77));
    EXPECT_EQ(a.simulate(ops, 2, 300).counts, b.simulate(ops, 2, 300).counts);
}

TEST(CircuitSimulatorTests, LargestSeedIsReproducible) {
    const std::vector<GateRequest> ops{{"h", {0}}, {"h", {1}}, {"h", {2}}};
    const std::uint64_t seed = std::numeric_limits<std::uint64_t>::max();
    CircuitSimulator a(seeded_config(seed));
    CircuitSimulator b(seeded_config(seed));
    EXPECT_EQ(a.simulate(ops, 3, 400).counts, b.simulate(ops, 3, 400).counts);
}

TEST(CircuitSimulatorTests, RejectsNegativeShots) {
    CircuitSimulator simulator;
    EXPECT_THROW(simulator.simulate({{"h", {0}}}, 1, -5), std::invalid_argument);
}

TEST(CircuitSimulatorTests, RejectsQubitCountsAboveConfiguredMaximum) {
    SimulatorConfig cfg;
    cfg.max_qubits = 3;
    CircuitSimulator simulator(cfg);
    EXPECT_THROW(simulator.simulate({}, 4, 0), QubitCountError);
    EXPECT_THROW(simulator.simulate({}, 0, 0), QubitCountError);
}

TEST(CircuitSimulatorTests, ValidationFailureCarriesOperationIndex) {
    CircuitSimulator simulator;
    try {
        simulator.simulate({{"h", {0}}, {"h", {0}}, {"foo", {0}}}, 1, 10);
        FAIL() << "expected UnknownGateError";
    } catch (const UnknownGateError& ex) {
        EXPECT_EQ(ex.op_index(), 2);
    }
}

TEST(CircuitSimulatorTests, ReportsProgressAndLogs) {
    CircuitSimulator simulator;
    CountingReporter reporter;
    simulator.set_progress_reporter(&reporter);
    simulator.simulate({{"h", {0}}, {"cx", {0, 1}}, {"z", {1}}}, 2, 0);
    EXPECT_EQ(reporter.completed, 3u);
    EXPECT_EQ(reporter.logs, 4u);
    EXPECT_EQ(simulator.logs().size(), 4u);
}

TEST(CircuitSimulatorTests, StabilizerSamplerRejectsNonCliffordGates) {
    SimulatorConfig cfg;
    cfg.sampler = SamplerKind::kStabilizer;
    CircuitSimulator simulator(cfg);
    EXPECT_THROW(simulator.simulate({{"h", {0}}, {"t", {0}}}, 1, 10), std::invalid_argument);
    EXPECT_THROW(simulator.simulate({{"ccx", {0, 1, 2}}}, 3, 10), std::invalid_argument);
}
