#include "circuit/errors.hpp"
#include "service/challenge.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <cmath>
#include <stdexcept>

using service::ChallengeScorer;

TEST(ChallengeScorerTests, IdenticalCircuitsComplete) {
    ChallengeScorer scorer;
    const auto result = scorer.score({{"h", {0}}, {"cx", {0, 1}}}, {{"H", {0}}, {"CNOT", {0, 1}}});
    EXPECT_NEAR(result.score, 1.0, 1e-12);
    EXPECT_TRUE(result.completed);
    EXPECT_EQ(result.num_qubits, 2);
}

TEST(ChallengeScorerTests, EquivalentDistributionsScoreOne) {
    // H Z H acts as X on |0>.
    ChallengeScorer scorer;
    const auto result = scorer.score({{"h", {0}}, {"z", {0}}, {"h", {0}}}, {{"x", {0}}});
    EXPECT_NEAR(result.score, 1.0, 1e-12);
    EXPECT_TRUE(result.completed);
}

TEST(ChallengeScorerTests, PartialMatchBelowThreshold) {
    ChallengeScorer scorer;
    const auto result = scorer.score({{"h", {0}}, {"cx", {0, 1}}}, {{"h", {0}}});
    EXPECT_NEAR(result.score, std::sqrt(0.25), 1e-12);
    EXPECT_FALSE(result.completed);
}

TEST(ChallengeScorerTests, RegisterSizeCoversBothCircuits) {
    ChallengeScorer scorer;
    const auto result = scorer.score({{"x", {0}}}, {{"x", {0}}, {"x", {3}}, {"x", {3}}});
    EXPECT_EQ(result.num_qubits, 4);
    EXPECT_NEAR(result.score, 1.0, 1e-12);
}

TEST(ChallengeScorerTests, RejectsTargetsBeyondRegisterLimit) {
    ChallengeScorer scorer;
    try {
        scorer.score({{"h", {0}}}, {{"h", {0}}, {"x", {INT_MAX}}});
        FAIL() << "expected QubitIndexOutOfRangeError";
    } catch (const QubitIndexOutOfRangeError& ex) {
        EXPECT_EQ(ex.qubit(), INT_MAX);
        EXPECT_EQ(ex.num_qubits(), kDefaultMaxQubits);
        EXPECT_EQ(ex.op_index(), 1);
    }
    EXPECT_THROW(scorer.score({{"x", {kDefaultMaxQubits}}}, {{"x", {0}}}), QubitIndexOutOfRangeError);
}

TEST(ChallengeScorerTests, CustomThreshold) {
    ChallengeScorer lenient(0.4);
    EXPECT_TRUE(lenient.score({{"h", {0}}, {"cx", {0, 1}}}, {{"h", {0}}}).completed);
    EXPECT_THROW(ChallengeScorer(1.5), std::invalid_argument);
}

TEST(ChallengeScorerTests, RejectsEmptyOrInvalidSubmission) {
    ChallengeScorer scorer;
    EXPECT_THROW(scorer.score({{"h", {0}}}, {}), std::invalid_argument);
    EXPECT_THROW(scorer.score({{"h", {0}}}, {{"rx", {0}}}), UnknownGateError);
}

TEST(ChallengeScorerTests, PresetsSolveThemselves) {
    ChallengeScorer scorer;
    ASSERT_FALSE(service::preset_challenges().empty());
    for (const auto& preset : service::preset_challenges()) {
        const auto result = scorer.score(preset.target_circuit, preset.target_circuit);
        EXPECT_TRUE(result.completed) << preset.key;
        EXPECT_EQ(result.num_qubits, preset.num_qubits) << preset.key;
    }
}

TEST(ChallengeScorerTests, FindsPresetByKey) {
    const auto* bell = service::find_preset_challenge("bell_state");
    ASSERT_NE(bell, nullptr);
    EXPECT_EQ(bell->num_qubits, 2);
    EXPECT_EQ(service::find_preset_challenge("no_such_challenge"), nullptr);
}
