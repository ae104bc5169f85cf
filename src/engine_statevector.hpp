#pragma once

#include <memory>
#include <string>
#include <vector>

#include "circuit/isa.hpp"
#include "circuit/observables.types.hpp"
#include "cpu_state_backend.hpp"

namespace qlab {
class ProgressReporter;
}

// Gate-by-gate evolution of a dense statevector. Operations are applied in
// the order given with no reordering or fusion, so a circuit always yields
// the same amplitudes. Cost is O(2^n) per gate and O(2^n) memory; one engine
// instance belongs to one simulation and is never shared between threads.

struct StatevectorState {
    int n_qubits = 0;
    int gates_applied = 0;
    std::vector<ExecutionLog> logs;
};

class StatevectorEngine {
  public:
    explicit StatevectorEngine(std::unique_ptr<StateBackend> backend = nullptr);

    void set_progress_reporter(qlab::ProgressReporter* reporter);
    void set_emit_logs(bool emit) { emit_logs_ = emit; }

    // Allocates n qubits in |0...0>.
    void reset(int n_qubits);

    // Applies one validated operation in place.
    void apply_gate(const GateOperation& op);

    // Resets to the circuit's register size, applies every op in order and
    // returns a copy of the final amplitudes.
    Statevector run(const CircuitSpec& circuit);

    // Throws NumericInvariantError on non-finite amplitudes or a squared
    // norm further than `tolerance` from 1.
    void check_normalization(double tolerance) const;

    const Statevector& state_vector() const;
    int num_qubits() const { return state_.n_qubits; }
    const StatevectorState& state() const { return state_; }
    const std::vector<ExecutionLog>& logs() const { return state_.logs; }

  private:
    void log_event(const std::string& category, const std::string& message);

    StatevectorState state_;
    std::unique_ptr<StateBackend> backend_;
    qlab::ProgressReporter* progress_reporter_ = nullptr;
    bool emit_logs_ = true;
};

// Sum of squared magnitudes.
double squared_norm(const Statevector& state);
