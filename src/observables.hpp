#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "circuit/observables.types.hpp"

// Physical observables read from a finished (read-only) statevector.

// Binary label for basis index `index`, qubit n-1 leftmost, qubit 0
// rightmost: outcome_label(1, 2) == "01".
std::string outcome_label(std::size_t index, int n_qubits);

// |amp[k]|^2 for every one of the 2^n basis states.
ProbabilityDistribution probabilities(const Statevector& state, int n_qubits);

// Label -> probability, omitting entries <= prune_epsilon. Pass a negative
// epsilon to keep every outcome.
std::map<std::string, double> to_outcome_map(
    const ProbabilityDistribution& distribution,
    double prune_epsilon
);

// Reduced single-qubit density matrix {rho00, rho01, rho10, rho11} obtained by
// tracing out every other qubit.
std::array<Amplitude, 4> reduced_density_matrix(
    const Statevector& state,
    int n_qubits,
    int qubit
);

// x = 2 Re(rho01), y = 2 Im(rho10), z = Re(rho00 - rho11), each clipped
// to [-1, 1].
BlochVector bloch_vector(const Statevector& state, int n_qubits, int qubit);

std::vector<BlochVector> bloch_vectors(const Statevector& state, int n_qubits);
