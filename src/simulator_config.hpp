#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class SamplerKind {
    kStatevector,
    kStabilizer,
};

inline constexpr int kDefaultMaxQubits = 24;
inline constexpr int kDefaultShots = 1024;
inline constexpr double kDefaultPruneEpsilon = 1e-10;
inline constexpr double kDefaultNormalizationTolerance = 1e-9;

struct SimulatorConfig {
    // Upper bound on the register size. State memory is 16 * 2^n bytes and
    // every gate touches all of it, so this is the scalability ceiling.
    int max_qubits = kDefaultMaxQubits;
    int default_shots = kDefaultShots;
    // Serialized probability maps drop outcomes at or below this value.
    double prune_epsilon = kDefaultPruneEpsilon;
    double normalization_tolerance = kDefaultNormalizationTolerance;
    // When set, every sampler is seeded with this value and counts become
    // reproducible. Unset means std::random_device.
    std::optional<std::uint64_t> seed;
    bool emit_logs = true;
    SamplerKind sampler = SamplerKind::kStatevector;
};

// Applies QLAB_* environment overrides on top of `base`. Malformed values
// keep the value from `base`.
SimulatorConfig load_simulator_config_from_env(SimulatorConfig base = {});

std::string sampler_to_string(SamplerKind kind);
std::optional<SamplerKind> sampler_from_string(const std::string& text);
