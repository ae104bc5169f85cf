#pragma once

#include <vector>

#include "circuit/isa.hpp"
#include "circuit/observables.types.hpp"

// Amplitude storage plus the two in-place transforms the gate set needs.
// Qubit q is bit q of the basis index (qubit 0 is the least significant bit).
class StateBackend {
  public:
    virtual ~StateBackend() = default;

    // Allocates 2^n amplitudes and resets them to |0...0>.
    virtual void alloc_array(int n) = 0;
    virtual int num_qubits() const = 0;

    virtual Statevector& state() = 0;
    virtual const Statevector& state() const = 0;

    virtual void apply_single_qubit_unitary(int q, const Matrix2& U) = 0;

    // Swaps each (bit target = 0, bit target = 1) amplitude pair whose
    // control bits are all set; pairs with any control at 0 are untouched.
    virtual void apply_controlled_x(const std::vector<int>& controls, int target) = 0;
};
