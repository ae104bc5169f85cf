#include "step_simulator.hpp"

#include "engine_statevector.hpp"

#include <utility>

StepSimulator::StepSimulator(SimulatorConfig cfg)
    : cfg_(std::move(cfg)) {}

void StepSimulator::set_progress_reporter(qlab::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

std::vector<SimulationSnapshot> StepSimulator::run_steps(const CircuitSpec& circuit, int shots) {
    StatevectorEngine engine;
    engine.set_emit_logs(cfg_.emit_logs);
    engine.set_progress_reporter(progress_reporter_);
    engine.reset(circuit.num_qubits);

    std::vector<SimulationSnapshot> steps;
    steps.reserve(circuit.ops.size() + 1);
    engine.check_normalization(cfg_.normalization_tolerance);
    steps.push_back(capture_snapshot(engine.state_vector(), circuit, 0, shots, cfg_));
    for (std::size_t idx = 0; idx < circuit.ops.size(); ++idx) {
        engine.apply_gate(circuit.ops[idx]);
        engine.check_normalization(cfg_.normalization_tolerance);
        steps.push_back(capture_snapshot(engine.state_vector(), circuit, idx + 1, shots, cfg_));
    }
    logs_ = engine.logs();
    return steps;
}
