#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "circuit/isa.hpp"
#include "circuit/observables.types.hpp"

// Measurement sampling for Clifford-only circuits on Stim's tableau
// simulator. Only the first `prefix_len` ops of `circuit` are used.
// Throws std::invalid_argument for T/Tdg/CCX and std::runtime_error when
// the build lacks Stim.
MeasurementCounts sample_stabilizer_counts(
    const CircuitSpec& circuit,
    std::size_t prefix_len,
    int shots,
    std::optional<std::uint64_t> seed
);

bool has_stabilizer_backend();
