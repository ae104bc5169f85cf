#include "circuit_simulator.hpp"

#include "engine_statevector.hpp"
#include "step_simulator.hpp"

#include <stdexcept>
#include <utility>

CircuitSimulator::CircuitSimulator(SimulatorConfig cfg)
    : cfg_(std::move(cfg)),
      validator_(cfg_.max_qubits) {}

void CircuitSimulator::set_progress_reporter(qlab::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

CircuitSpec CircuitSimulator::validate(const std::vector<GateRequest>& ops, int num_qubits) const {
    return validator_.validate(ops, num_qubits);
}

int CircuitSimulator::resolve_shots(std::optional<int> shots) const {
    const int value = shots ? *shots : cfg_.default_shots;
    if (value < 0) {
        throw std::invalid_argument("Shot count must be non-negative");
    }
    return value;
}

void CircuitSimulator::check_sampler_support(const CircuitSpec& circuit, int shots) const {
    if (shots < 0) {
        throw std::invalid_argument("Shot count must be non-negative");
    }
    validator_.validate_qubit_count(circuit.num_qubits);
    if (cfg_.sampler != SamplerKind::kStabilizer) {
        return;
    }
    for (const auto& op : circuit.ops) {
        if (!is_clifford(op.kind)) {
            throw std::invalid_argument(
                "Stabilizer sampler requires a Clifford circuit; got " + to_string(op.kind));
        }
    }
}

SimulationSnapshot CircuitSimulator::simulate(
    const std::vector<GateRequest>& ops,
    int num_qubits,
    std::optional<int> shots
) {
    const int shot_count = resolve_shots(shots);
    return simulate(validate(ops, num_qubits), shot_count);
}

SimulationSnapshot CircuitSimulator::simulate(const CircuitSpec& circuit, int shots) {
    check_sampler_support(circuit, shots);
    StatevectorEngine engine;
    engine.set_emit_logs(cfg_.emit_logs);
    engine.set_progress_reporter(progress_reporter_);
    const Statevector state = engine.run(circuit);
    engine.check_normalization(cfg_.normalization_tolerance);
    logs_ = engine.logs();
    return capture_snapshot(state, circuit, circuit.ops.size(), shots, cfg_);
}

StepSimulationResult CircuitSimulator::simulate_steps(
    const std::vector<GateRequest>& ops,
    int num_qubits,
    std::optional<int> shots
) {
    const int shot_count = resolve_shots(shots);
    return simulate_steps(validate(ops, num_qubits), shot_count);
}

StepSimulationResult CircuitSimulator::simulate_steps(const CircuitSpec& circuit, int shots) {
    check_sampler_support(circuit, shots);
    StepSimulator stepper(cfg_);
    stepper.set_progress_reporter(progress_reporter_);
    StepSimulationResult result;
    result.num_qubits = circuit.num_qubits;
    result.steps = stepper.run_steps(circuit, shots);
    result.gates = circuit.ops;
    logs_ = stepper.logs();
    return result;
}
