#include "simulator_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

const char* read_env(const char* name) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return nullptr;
    }
    return env;
}

template <typename T, typename Parse>
T env_or(const char* name, T fallback, Parse parse) {
    const char* env = read_env(name);
    if (!env) {
        return fallback;
    }
    try {
        return parse(env);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

}  // namespace

SimulatorConfig load_simulator_config_from_env(SimulatorConfig base) {
    SimulatorConfig cfg = base;
    cfg.max_qubits = env_or("QLAB_MAX_QUBITS", base.max_qubits, [&](const char* text) {
        const int parsed = std::stoi(text);
        return parsed > 0 ? parsed : base.max_qubits;
    });
    cfg.default_shots = env_or("QLAB_DEFAULT_SHOTS", base.default_shots, [&](const char* text) {
        const int parsed = std::stoi(text);
        return parsed >= 0 ? parsed : base.default_shots;
    });
    cfg.prune_epsilon = env_or("QLAB_PRUNE_EPSILON", base.prune_epsilon, [&](const char* text) {
        const double parsed = std::stod(text);
        return parsed >= 0.0 ? parsed : base.prune_epsilon;
    });
    cfg.normalization_tolerance = env_or(
        "QLAB_NORM_TOLERANCE", base.normalization_tolerance, [&](const char* text) {
            const double parsed = std::stod(text);
            return parsed > 0.0 ? parsed : base.normalization_tolerance;
        });
    cfg.seed = env_or("QLAB_SEED", base.seed, [](const char* text) {
        return std::optional<std::uint64_t>(std::stoull(text));
    });
    if (const char* env = read_env("QLAB_EMIT_LOGS")) {
        cfg.emit_logs = std::string(env) != "0";
    }
    if (const char* env = read_env("QLAB_SAMPLER")) {
        if (const auto kind = sampler_from_string(env)) {
            cfg.sampler = *kind;
        }
    }
    return cfg;
}

std::string sampler_to_string(SamplerKind kind) {
    switch (kind) {
        case SamplerKind::kStatevector:
            return "statevector";
        case SamplerKind::kStabilizer:
            return "stabilizer";
    }
    return "statevector";
}

std::optional<SamplerKind> sampler_from_string(const std::string& text) {
    if (text == "statevector") {
        return SamplerKind::kStatevector;
    }
    if (text == "stabilizer") {
        return SamplerKind::kStabilizer;
    }
    return std::nullopt;
}
