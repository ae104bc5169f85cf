#include "circuit/validator.hpp"

#include "circuit/errors.hpp"

#include <cstddef>
#include <stdexcept>
#include <unordered_set>

CircuitValidator::CircuitValidator(int max_qubits)
    : max_qubits_(max_qubits) {
    if (max_qubits_ <= 0) {
        throw std::invalid_argument("max_qubits must be positive");
    }
}

void CircuitValidator::validate_qubit_count(int num_qubits) const {
    if (num_qubits <= 0 || num_qubits > max_qubits_) {
        throw QubitCountError(num_qubits, max_qubits_);
    }
}

CircuitSpec CircuitValidator::validate(const std::vector<GateRequest>& ops, int num_qubits) const {
    validate_qubit_count(num_qubits);
    CircuitSpec spec;
    spec.num_qubits = num_qubits;
    spec.ops.reserve(ops.size());
    for (std::size_t idx = 0; idx < ops.size(); ++idx) {
        spec.ops.push_back(validate_op(ops[idx], num_qubits, static_cast<int>(idx)));
    }
    return spec;
}

GateOperation CircuitValidator::validate_op(
    const GateRequest& request,
    int num_qubits,
    int op_index
) const {
    const auto kind = gate_kind_from_name(request.gate);
    if (!kind) {
        throw UnknownGateError(request.gate, op_index);
    }
    const int expected = gate_arity(*kind);
    const int actual = static_cast<int>(request.targets.size());
    if (actual != expected) {
        throw ArityMismatchError(request.gate, expected, actual, op_index);
    }
    for (int target : request.targets) {
        if (target < 0 || target >= num_qubits) {
            throw QubitIndexOutOfRangeError(target, num_qubits, op_index);
        }
    }
    std::unordered_set<int> seen;
    for (int target : request.targets) {
        if (!seen.insert(target).second) {
            throw DuplicateTargetError(request.gate, target, op_index);
        }
    }
    return GateOperation{*kind, request.targets};
}
