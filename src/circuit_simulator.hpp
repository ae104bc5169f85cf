#pragma once

#include <optional>
#include <vector>

#include "circuit/isa.hpp"
#include "circuit/validator.hpp"
#include "simulation_snapshot.hpp"
#include "simulator_config.hpp"

namespace qlab {
class ProgressReporter;
}

// Step-mode output, paired with the gate sequence for display alignment.
struct StepSimulationResult {
    int num_qubits = 0;
    std::vector<SimulationSnapshot> steps;
    std::vector<GateOperation> gates;
};

// Validate -> evolve -> extract -> sample. Validation runs before any
// allocation, so an invalid circuit never produces partial state. Each call
// owns its statevector; an instance is not meant to be shared across threads.
class CircuitSimulator {
  public:
    explicit CircuitSimulator(SimulatorConfig cfg = {});

    const SimulatorConfig& config() const { return cfg_; }
    void set_progress_reporter(qlab::ProgressReporter* reporter);

    CircuitSpec validate(const std::vector<GateRequest>& ops, int num_qubits) const;

    SimulationSnapshot simulate(
        const std::vector<GateRequest>& ops,
        int num_qubits,
        std::optional<int> shots = std::nullopt
    );
    SimulationSnapshot simulate(const CircuitSpec& circuit, int shots);

    StepSimulationResult simulate_steps(
        const std::vector<GateRequest>& ops,
        int num_qubits,
        std::optional<int> shots = std::nullopt
    );
    StepSimulationResult simulate_steps(const CircuitSpec& circuit, int shots);

    // Execution logs of the most recent call.
    const std::vector<ExecutionLog>& logs() const { return logs_; }

  private:
    int resolve_shots(std::optional<int> shots) const;
    void check_sampler_support(const CircuitSpec& circuit, int shots) const;

    SimulatorConfig cfg_;
    CircuitValidator validator_;
    qlab::ProgressReporter* progress_reporter_ = nullptr;
    std::vector<ExecutionLog> logs_;
};
