#include "simulator_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace {

const char* const kVars[] = {
    "QLAB_MAX_QUBITS",
    "QLAB_DEFAULT_SHOTS",
    "QLAB_PRUNE_EPSILON",
    "QLAB_NORM_TOLERANCE",
    "QLAB_SEED",
    "QLAB_EMIT_LOGS",
    "QLAB_SAMPLER",
};

class SimulatorConfigEnvTest : public ::testing::Test {
  protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVars) {
            unsetenv(name);
        }
    }
};

}  // namespace

TEST_F(SimulatorConfigEnvTest, DefaultsWithoutEnvironment) {
    const auto cfg = load_simulator_config_from_env();
    EXPECT_EQ(cfg.max_qubits, kDefaultMaxQubits);
    EXPECT_EQ(cfg.default_shots, kDefaultShots);
    EXPECT_DOUBLE_EQ(cfg.prune_epsilon, kDefaultPruneEpsilon);
    EXPECT_DOUBLE_EQ(cfg.normalization_tolerance, kDefaultNormalizationTolerance);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_TRUE(cfg.emit_logs);
    EXPECT_EQ(cfg.sampler, SamplerKind::kStatevector);
}

TEST_F(SimulatorConfigEnvTest, EnvironmentOverridesBase) {
    setenv("QLAB_MAX_QUBITS", "10", 1);
    setenv("QLAB_DEFAULT_SHOTS", "256", 1);
    setenv("QLAB_PRUNE_EPSILON", "1e-6", 1);
    setenv("QLAB_NORM_TOLERANCE", "1e-7", 1);
    setenv("QLAB_SEED", "42", 1);
    setenv("QLAB_EMIT_LOGS", "0", 1);
    setenv("QLAB_SAMPLER", "stabilizer", 1);

    const auto cfg = load_simulator_config_from_env();
    EXPECT_EQ(cfg.max_qubits, 10);
    EXPECT_EQ(cfg.default_shots, 256);
    EXPECT_DOUBLE_EQ(cfg.prune_epsilon, 1e-6);
    EXPECT_DOUBLE_EQ(cfg.normalization_tolerance, 1e-7);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 42u);
    EXPECT_FALSE(cfg.emit_logs);
    EXPECT_EQ(cfg.sampler, SamplerKind::kStabilizer);
}

TEST_F(SimulatorConfigEnvTest, MalformedValuesFallBack) {
    setenv("QLAB_MAX_QUBITS", "lots", 1);
    setenv("QLAB_DEFAULT_SHOTS", "-3", 1);
    setenv("QLAB_SAMPLER", "quantum-annealer", 1);

    SimulatorConfig base;
    base.max_qubits = 12;
    const auto cfg = load_simulator_config_from_env(base);
    EXPECT_EQ(cfg.max_qubits, 12);
    EXPECT_EQ(cfg.default_shots, kDefaultShots);
    EXPECT_EQ(cfg.sampler, SamplerKind::kStatevector);
}

TEST(SimulatorConfigTests, SamplerNamesRoundTrip) {
    EXPECT_EQ(sampler_to_string(SamplerKind::kStabilizer), "stabilizer");
    EXPECT_EQ(sampler_from_string("statevector"), SamplerKind::kStatevector);
    EXPECT_FALSE(sampler_from_string("tensor").has_value());
}
