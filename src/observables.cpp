#include "observables.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

void check_dimension(const Statevector& state, int n_qubits) {
    if (n_qubits <= 0 || n_qubits >= static_cast<int>(sizeof(std::size_t) * 8)) {
        throw std::invalid_argument("Observable extraction requires a positive qubit count");
    }
    const std::size_t dim = static_cast<std::size_t>(1) << n_qubits;
    if (state.size() != dim) {
        throw std::invalid_argument(
            "Statevector holds " + std::to_string(state.size()) +
            " amplitudes, expected " + std::to_string(dim));
    }
}

double clip_unit(double value) {
    return std::clamp(value, -1.0, 1.0);
}

}  // namespace

std::string outcome_label(std::size_t index, int n_qubits) {
    std::string label(static_cast<std::size_t>(n_qubits), '0');
    for (int q = 0; q < n_qubits; ++q) {
        if ((index >> q) & 1ULL) {
            label[static_cast<std::size_t>(n_qubits - 1 - q)] = '1';
        }
    }
    return label;
}

ProbabilityDistribution probabilities(const Statevector& state, int n_qubits) {
    check_dimension(state, n_qubits);
    ProbabilityDistribution dist;
    dist.n_qubits = n_qubits;
    dist.values.resize(state.size());
    for (std::size_t k = 0; k < state.size(); ++k) {
        dist.values[k] = std::norm(state[k]);
    }
    return dist;
}

std::map<std::string, double> to_outcome_map(
    const ProbabilityDistribution& distribution,
    double prune_epsilon
) {
    std::map<std::string, double> out;
    for (std::size_t k = 0; k < distribution.values.size(); ++k) {
        const double p = distribution.values[k];
        if (prune_epsilon >= 0.0 && p <= prune_epsilon) {
            continue;
        }
        out.emplace(outcome_label(k, distribution.n_qubits), p);
    }
    return out;
}

std::array<Amplitude, 4> reduced_density_matrix(
    const Statevector& state,
    int n_qubits,
    int qubit
) {
    check_dimension(state, n_qubits);
    if (qubit < 0 || qubit >= n_qubits) {
        throw std::out_of_range("Bloch vector qubit out of range");
    }
    const std::size_t bit = static_cast<std::size_t>(1) << qubit;
    Amplitude rho00{0.0, 0.0};
    Amplitude rho01{0.0, 0.0};
    Amplitude rho10{0.0, 0.0};
    Amplitude rho11{0.0, 0.0};
    for (std::size_t i0 = 0; i0 < state.size(); ++i0) {
        if (i0 & bit) {
            continue;
        }
        const std::size_t i1 = i0 | bit;
        const Amplitude a0 = state[i0];
        const Amplitude a1 = state[i1];
        rho00 += a0 * std::conj(a0);
        rho01 += a0 * std::conj(a1);
        rho10 += a1 * std::conj(a0);
        rho11 += a1 * std::conj(a1);
    }
    return {rho00, rho01, rho10, rho11};
}

BlochVector bloch_vector(const Statevector& state, int n_qubits, int qubit) {
    const auto rho = reduced_density_matrix(state, n_qubits, qubit);
    BlochVector out;
    out.qubit = qubit;
    out.x = clip_unit(2.0 * rho[1].real());
    out.y = clip_unit(2.0 * rho[2].imag());
    out.z = clip_unit((rho[0] - rho[3]).real());
    return out;
}

std::vector<BlochVector> bloch_vectors(const Statevector& state, int n_qubits) {
    std::vector<BlochVector> out;
    out.reserve(static_cast<std::size_t>(n_qubits > 0 ? n_qubits : 0));
    for (int q = 0; q < n_qubits; ++q) {
        out.push_back(bloch_vector(state, n_qubits, q));
    }
    return out;
}
