#pragma once

#include <vector>

#include "circuit/isa.hpp"
#include "simulation_snapshot.hpp"
#include "simulator_config.hpp"

namespace qlab {
class ProgressReporter;
}

// Playback over circuit prefixes: entry 0 is |0...0>, entry i is the state
// after op i. One statevector is advanced gate by gate and snapshotted after
// each step, so the cost is O(N * 2^n) rather than re-running every prefix.
class StepSimulator {
  public:
    explicit StepSimulator(SimulatorConfig cfg);

    void set_progress_reporter(qlab::ProgressReporter* reporter);

    // Returns circuit.ops.size() + 1 snapshots.
    std::vector<SimulationSnapshot> run_steps(const CircuitSpec& circuit, int shots);

    const std::vector<ExecutionLog>& logs() const { return logs_; }

  private:
    SimulatorConfig cfg_;
    qlab::ProgressReporter* progress_reporter_ = nullptr;
    std::vector<ExecutionLog> logs_;
};
