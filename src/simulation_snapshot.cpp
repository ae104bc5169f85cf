#include "simulation_snapshot.hpp"

#include "measurement_sampler.hpp"
#include "observables.hpp"
#include "stabilizer_sampler.hpp"

#include <cstdint>
#include <optional>

SimulationSnapshot capture_snapshot(
    const Statevector& state,
    const CircuitSpec& circuit,
    std::size_t prefix_len,
    int shots,
    const SimulatorConfig& cfg
) {
    SimulationSnapshot snapshot;
    snapshot.statevector = state;
    snapshot.probabilities = probabilities(state, circuit.num_qubits);
    snapshot.bloch = bloch_vectors(state, circuit.num_qubits);

    const std::optional<std::uint64_t> seed = cfg.seed;
    switch (cfg.sampler) {
        case SamplerKind::kStatevector: {
            MeasurementSampler sampler(seed);
            snapshot.counts = sampler.sample(snapshot.probabilities, shots);
            break;
        }
        case SamplerKind::kStabilizer:
            snapshot.counts = sample_stabilizer_counts(circuit, prefix_len, shots, seed);
            break;
    }
    return snapshot;
}
