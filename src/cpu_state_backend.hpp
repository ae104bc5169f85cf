#pragma once

#include <cstddef>
#include <vector>

#include "state_backend.hpp"

// Dense host-memory backend. Every gate costs O(2^n) time; the buffer holds
// 2^n complex<double> values (16 bytes each), so 24 qubits already need
// 256 MiB. Callers bound the qubit count before allocation.
class CpuStateBackend : public StateBackend {
  public:
    CpuStateBackend() = default;

    void alloc_array(int n) override;
    int num_qubits() const override;

    Statevector& state() override;
    const Statevector& state() const override;

    void apply_single_qubit_unitary(int q, const Matrix2& U) override;
    void apply_controlled_x(const std::vector<int>& controls, int target) override;

  private:
    void check_qubit(int q) const;

    int n_qubits_{0};
    Statevector state_;
};
