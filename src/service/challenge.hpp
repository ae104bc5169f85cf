#pragma once

#include "circuit/isa.hpp"
#include "simulator_config.hpp"

#include <string>
#include <vector>

namespace service {

struct ChallengeScore {
    double score = 0.0;
    bool completed = false;
    int num_qubits = 0;
};

struct PresetChallenge {
    std::string key;
    std::string name;
    std::string description;
    int num_qubits = 1;
    std::vector<GateRequest> target_circuit;
    std::vector<std::string> concepts;
};

// Built-in challenges, ordered by key.
const std::vector<PresetChallenge>& preset_challenges();
const PresetChallenge* find_preset_challenge(const std::string& key);

// Compares a submitted circuit against a target by the similarity of their
// exact output distributions. Both circuits run on the same register, sized
// by the highest qubit index either one touches.
class ChallengeScorer {
  public:
    static constexpr double kDefaultThreshold = 0.9;

    explicit ChallengeScorer(double threshold = kDefaultThreshold, SimulatorConfig cfg = {});

    double threshold() const { return threshold_; }

    ChallengeScore score(
        const std::vector<GateRequest>& target,
        const std::vector<GateRequest>& submission
    ) const;

  private:
    double threshold_;
    SimulatorConfig cfg_;
};

}  // namespace service
