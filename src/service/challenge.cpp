#include "service/challenge.hpp"

#include "circuit/errors.hpp"
#include "circuit_simulator.hpp"
#include "similarity.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace service {

namespace {

// Highest target index in `circuit`. Targets at or beyond `max_qubits` are
// rejected here, before the register size is derived from them.
int max_target_index(const std::vector<GateRequest>& circuit, int max_qubits) {
    int result = 0;
    for (std::size_t idx = 0; idx < circuit.size(); ++idx) {
        for (int t : circuit[idx].targets) {
            if (t >= max_qubits) {
                throw QubitIndexOutOfRangeError(t, max_qubits, static_cast<int>(idx));
            }
            result = std::max(result, t);
        }
    }
    return result;
}

std::vector<PresetChallenge> build_presets() {
    std::vector<PresetChallenge> presets;
    presets.push_back(PresetChallenge{
        "bell_state",
        "Bell State",
        "Entangle two qubits into an equal superposition of |00> and |11>.",
        2,
        {{"h", {0}}, {"cx", {0, 1}}},
        {"superposition", "entanglement"},
    });
    presets.push_back(PresetChallenge{
        "deutsch_jozsa",
        "Deutsch-Jozsa (Balanced Oracle)",
        "Run the Deutsch-Jozsa algorithm against a balanced CNOT oracle.",
        2,
        {{"x", {1}}, {"h", {0}}, {"h", {1}}, {"cx", {0, 1}}, {"h", {0}}},
        {"superposition", "phase", "deutsch_jozsa"},
    });
    presets.push_back(PresetChallenge{
        "ghz_state",
        "GHZ State",
        "Prepare the three-qubit state (|000> + |111>)/sqrt(2).",
        3,
        {{"h", {0}}, {"cx", {0, 1}}, {"cx", {0, 2}}},
        {"superposition", "entanglement", "multi_qubit_gates"},
    });
    presets.push_back(PresetChallenge{
        "grover_2qubit",
        "Grover's Search (2-qubit)",
        "Search for |11> with one Grover iteration on two qubits.",
        2,
        {{"h", {0}},
         {"h", {1}},
         {"x", {0}},
         {"x", {1}},
         {"h", {1}},
         {"cx", {0, 1}},
         {"h", {1}},
         {"x", {0}},
         {"x", {1}},
         {"h", {0}},
         {"h", {1}}},
        {"superposition", "grovers_algorithm", "phase", "multi_qubit_gates"},
    });
    presets.push_back(PresetChallenge{
        "phase_flip",
        "Phase Flip",
        "Flip the phase of a superposed qubit so it ends in |1>.",
        1,
        {{"h", {0}}, {"z", {0}}, {"h", {0}}},
        {"superposition", "phase"},
    });
    presets.push_back(PresetChallenge{
        "quantum_teleportation",
        "Quantum Teleportation",
        "Share a Bell pair on qubits 1 and 2, then entangle qubit 0 with it.",
        3,
        {{"h", {1}}, {"cx", {1, 2}}, {"cx", {0, 1}}, {"h", {0}}},
        {"entanglement", "quantum_teleportation", "measurement"},
    });
    return presets;
}

}  // namespace

const std::vector<PresetChallenge>& preset_challenges() {
    static const std::vector<PresetChallenge> presets = build_presets();
    return presets;
}

const PresetChallenge* find_preset_challenge(const std::string& key) {
    for (const auto& preset : preset_challenges()) {
        if (preset.key == key) {
            return &preset;
        }
    }
    return nullptr;
}

ChallengeScorer::ChallengeScorer(double threshold, SimulatorConfig cfg)
    : threshold_(threshold), cfg_(std::move(cfg)) {
    if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
        throw std::invalid_argument("challenge threshold must lie in [0, 1]");
    }
    cfg_.emit_logs = false;
    cfg_.sampler = SamplerKind::kStatevector;
}

ChallengeScore ChallengeScorer::score(
    const std::vector<GateRequest>& target,
    const std::vector<GateRequest>& submission
) const {
    if (submission.empty()) {
        throw std::invalid_argument("Cannot submit an empty circuit");
    }
    const int num_qubits = std::max(
        max_target_index(target, cfg_.max_qubits),
        max_target_index(submission, cfg_.max_qubits)) + 1;

    // Scoring compares exact distributions; no shots are drawn.
    CircuitSimulator simulator(cfg_);
    const auto expected = simulator.simulate(target, num_qubits, 0);
    const auto actual = simulator.simulate(submission, num_qubits, 0);

    ChallengeScore result;
    result.num_qubits = num_qubits;
    result.score = similarity(expected.probabilities, actual.probabilities);
    result.completed = result.score >= threshold_;
    return result;
}

}  // namespace service
