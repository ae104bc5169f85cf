#pragma once

#include <cstddef>
#include <vector>

#include "circuit/isa.hpp"
#include "circuit/observables.types.hpp"
#include "simulator_config.hpp"

// Everything the circuit view renders for one point of a circuit.
struct SimulationSnapshot {
    Statevector statevector;
    ProbabilityDistribution probabilities;
    std::vector<BlochVector> bloch;
    MeasurementCounts counts;
};

// Extracts observables from `state` (the result of the first `prefix_len`
// ops of `circuit`) and samples `shots` outcomes with the configured sampler.
SimulationSnapshot capture_snapshot(
    const Statevector& state,
    const CircuitSpec& circuit,
    std::size_t prefix_len,
    int shots,
    const SimulatorConfig& cfg
);
