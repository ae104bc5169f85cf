#pragma once

#include "circuit/isa.hpp"
#include "simulator_config.hpp"

#include <vector>

// Turns builder input into a CircuitSpec. Checks run per operation in
// order: gate name, arity, qubit range, distinct targets. The first failure
// is thrown (see circuit/errors.hpp); nothing is allocated or mutated.
class CircuitValidator {
  public:
    explicit CircuitValidator(int max_qubits = kDefaultMaxQubits);

    CircuitSpec validate(const std::vector<GateRequest>& ops, int num_qubits) const;

    // Checks a qubit count alone. Throws QubitCountError.
    void validate_qubit_count(int num_qubits) const;

    int max_qubits() const { return max_qubits_; }

  private:
    GateOperation validate_op(const GateRequest& request, int num_qubits, int op_index) const;

    int max_qubits_;
};
