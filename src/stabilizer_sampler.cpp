#include "stabilizer_sampler.hpp"

#include "observables.hpp"
#include "random_stream.hpp"

#include <stdexcept>

#ifdef QLAB_WITH_STIM

#include <random>
#include <sstream>
#include <string>

#include <stim/circuit/circuit.h>
#include <stim/mem/simd_bits.h>
#include <stim/simulators/tableau_simulator.h>

namespace {

std::string stim_gate_name(GateKind kind) {
    switch (kind) {
        case GateKind::H:
            return "H";
        case GateKind::X:
            return "X";
        case GateKind::Y:
            return "Y";
        case GateKind::Z:
            return "Z";
        case GateKind::S:
            return "S";
        case GateKind::Sdg:
            return "S_DAG";
        case GateKind::CX:
            return "CX";
        case GateKind::T:
        case GateKind::Tdg:
        case GateKind::CCX:
            break;
    }
    throw std::invalid_argument(
        "Stabilizer sampler requires a Clifford circuit; got " + to_string(kind));
}

std::string build_stim_text(const CircuitSpec& circuit, std::size_t prefix_len) {
    std::ostringstream oss;
    for (std::size_t idx = 0; idx < prefix_len; ++idx) {
        const auto& op = circuit.ops[idx];
        oss << stim_gate_name(op.kind);
        for (int target : op.targets) {
            oss << ' ' << target;
        }
        oss << '\n';
    }
    // Measurement record bit q holds qubit q.
    oss << 'M';
    for (int q = 0; q < circuit.num_qubits; ++q) {
        oss << ' ' << q;
    }
    oss << '\n';
    return oss.str();
}

}  // namespace

MeasurementCounts sample_stabilizer_counts(
    const CircuitSpec& circuit,
    std::size_t prefix_len,
    int shots,
    std::optional<std::uint64_t> seed
) {
    if (shots < 0) {
        throw std::invalid_argument("Shot count must be non-negative");
    }
    if (prefix_len > circuit.ops.size()) {
        throw std::out_of_range("Stabilizer prefix exceeds circuit length");
    }
    const std::string text = build_stim_text(circuit, prefix_len);
    const stim::Circuit stim_circuit(text);
    if (static_cast<int>(stim_circuit.count_measurements()) != circuit.num_qubits) {
        throw std::runtime_error("Stabilizer sampler measurement bookkeeping mismatch");
    }

    MeasurementCounts counts;
    std::mt19937_64 stim_rng = make_rng(seed);
    for (int shot = 0; shot < shots; ++shot) {
        stim::simd_bits<64> sample = stim::TableauSimulator<64>::sample_circuit(stim_circuit, stim_rng);
        std::size_t index = 0;
        for (int q = 0; q < circuit.num_qubits; ++q) {
            if (static_cast<bool>(sample[static_cast<std::size_t>(q)])) {
                index |= static_cast<std::size_t>(1) << q;
            }
        }
        counts[outcome_label(index, circuit.num_qubits)] += 1;
    }
    return counts;
}

bool has_stabilizer_backend() {
    return true;
}

#else

MeasurementCounts sample_stabilizer_counts(
    const CircuitSpec& /*circuit*/,
    std::size_t /*prefix_len*/,
    int /*shots*/,
    std::optional<std::uint64_t> /*seed*/
) {
    throw std::runtime_error(
        "stabilizer sampler unavailable; rebuild with QLAB_WITH_STIM=ON");
}

bool has_stabilizer_backend() {
    return false;
}

#endif  // QLAB_WITH_STIM
