#include "cpu_state_backend.hpp"

#include <stdexcept>
#include <utility>

namespace {

// Spreads the n-1 bit counter `k` around a zero at bit position `q`, giving
// the index of the pair member whose bit q is clear.
inline std::size_t insert_zero_bit(std::size_t k, int q) {
    const std::size_t low_mask = (static_cast<std::size_t>(1) << q) - 1;
    return ((k & ~low_mask) << 1) | (k & low_mask);
}

}  // namespace

void CpuStateBackend::alloc_array(int n) {
    if (n <= 0) {
        throw std::invalid_argument("AllocArray requires positive number of qubits");
    }
    if (n >= static_cast<int>(sizeof(std::size_t) * 8)) {
        throw std::invalid_argument("AllocArray qubit count exceeds addressable space");
    }
    n_qubits_ = n;
    const std::size_t dim = static_cast<std::size_t>(1) << n;
    state_.assign(dim, Amplitude{0.0, 0.0});
    state_[0] = Amplitude{1.0, 0.0};
}

int CpuStateBackend::num_qubits() const {
    return n_qubits_;
}

Statevector& CpuStateBackend::state() {
    return state_;
}

const Statevector& CpuStateBackend::state() const {
    return state_;
}

void CpuStateBackend::check_qubit(int q) const {
    if (q < 0 || q >= n_qubits_) {
        throw std::out_of_range("Invalid qubit index");
    }
}

void CpuStateBackend::apply_single_qubit_unitary(int q, const Matrix2& U) {
    check_qubit(q);
    const std::size_t pairs = state_.size() >> 1;
    const std::size_t bit = static_cast<std::size_t>(1) << q;
    for (std::size_t k = 0; k < pairs; ++k) {
        const std::size_t i = insert_zero_bit(k, q);
        const std::size_t j = i | bit;
        const auto a0 = state_[i];
        const auto a1 = state_[j];
        state_[i] = U[0] * a0 + U[1] * a1;
        state_[j] = U[2] * a0 + U[3] * a1;
    }
}

void CpuStateBackend::apply_controlled_x(const std::vector<int>& controls, int target) {
    check_qubit(target);
    std::size_t control_mask = 0;
    for (int c : controls) {
        check_qubit(c);
        if (c == target) {
            throw std::invalid_argument("Controlled gate requires distinct control and target");
        }
        control_mask |= static_cast<std::size_t>(1) << c;
    }
    const std::size_t pairs = state_.size() >> 1;
    const std::size_t bit = static_cast<std::size_t>(1) << target;
    for (std::size_t k = 0; k < pairs; ++k) {
        const std::size_t i = insert_zero_bit(k, target);
        if ((i & control_mask) != control_mask) {
            continue;
        }
        std::swap(state_[i], state_[i | bit]);
    }
}
