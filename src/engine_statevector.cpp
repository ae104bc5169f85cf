#include "engine_statevector.hpp"

#include "circuit/errors.hpp"
#include "progress_reporter.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

StatevectorEngine::StatevectorEngine(std::unique_ptr<StateBackend> backend)
    : backend_(backend ? std::move(backend) : std::make_unique<CpuStateBackend>()) {}

void StatevectorEngine::set_progress_reporter(qlab::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

void StatevectorEngine::log_event(const std::string& category, const std::string& message) {
    if (!emit_logs_) {
        return;
    }
    state_.logs.push_back(ExecutionLog{state_.gates_applied, category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(state_.logs.back());
    }
}

const Statevector& StatevectorEngine::state_vector() const {
    return backend_->state();
}

void StatevectorEngine::reset(int n_qubits) {
    backend_->alloc_array(n_qubits);
    state_.n_qubits = backend_->num_qubits();
    state_.gates_applied = 0;
    state_.logs.clear();
    std::ostringstream oss;
    oss << "AllocArray n_qubits=" << n_qubits << " amplitudes=" << backend_->state().size();
    log_event("AllocArray", oss.str());
}

void StatevectorEngine::apply_gate(const GateOperation& op) {
    if (state_.n_qubits == 0) {
        throw std::runtime_error("Cannot apply gate before allocation");
    }
    if (static_cast<int>(op.targets.size()) != gate_arity(op.kind)) {
        throw std::invalid_argument("Gate " + to_string(op.kind) + " received wrong number of targets");
    }
    const int controls = gate_control_count(op.kind);
    if (controls == 0) {
        backend_->apply_single_qubit_unitary(op.targets[0], gate_unitary(op.kind));
    } else {
        const std::vector<int> control_qubits(op.targets.begin(), op.targets.begin() + controls);
        backend_->apply_controlled_x(control_qubits, op.targets.back());
    }
    state_.gates_applied += 1;
    if (progress_reporter_) {
        progress_reporter_->increment_completed_steps();
    }
    std::ostringstream oss;
    oss << to_string(op.kind) << " targets=" << format_targets(op.targets);
    log_event("ApplyGate", oss.str());
}

Statevector StatevectorEngine::run(const CircuitSpec& circuit) {
    reset(circuit.num_qubits);
    for (const auto& op : circuit.ops) {
        apply_gate(op);
    }
    return backend_->state();
}

void StatevectorEngine::check_normalization(double tolerance) const {
    const auto& amps = backend_->state();
    for (std::size_t i = 0; i < amps.size(); ++i) {
        if (!std::isfinite(amps[i].real()) || !std::isfinite(amps[i].imag())) {
            throw NumericInvariantError(
                "Non-finite amplitude at index " + std::to_string(i) +
                " after " + std::to_string(state_.gates_applied) + " gate(s)");
        }
    }
    const double norm = squared_norm(amps);
    if (std::abs(norm - 1.0) > tolerance) {
        std::ostringstream oss;
        oss << "Statevector norm drifted to " << norm << " after "
            << state_.gates_applied << " gate(s)";
        throw NumericInvariantError(oss.str());
    }
}

double squared_norm(const Statevector& state) {
    double total = 0.0;
    for (const auto& amp : state) {
        total += std::norm(amp);
    }
    return total;
}
