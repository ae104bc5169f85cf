#pragma once

#include "circuit/isa.hpp"
#include "circuit/observables.types.hpp"
#include "circuit_simulator.hpp"
#include "progress_reporter.hpp"
#include "simulation_snapshot.hpp"
#include "simulator_config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace service {

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

enum class JobMode {
    Full,
    Steps,
};

struct JobRequest {
    std::string job_id;
    int num_qubits = 2;
    std::vector<GateRequest> circuit;
    std::optional<int> shots;
    JobMode mode = JobMode::Full;
    std::optional<std::uint64_t> seed;
    std::optional<SamplerKind> sampler;
    std::map<std::string, std::string> metadata;
};

struct JobResult {
    std::string job_id;
    JobStatus status = JobStatus::Pending;
    JobMode mode = JobMode::Full;
    int num_qubits = 0;
    // One snapshot in Full mode, |circuit| + 1 in Steps mode.
    std::vector<SimulationSnapshot> steps;
    std::vector<GateRequest> gates;
    std::vector<ExecutionLog> logs;
    double elapsed_time = 0.0;
    std::string message;
    // Exception class name for failed jobs ("UnknownGateError", ...).
    std::string error_type;
    int error_op_index = -1;
};

std::string status_to_string(JobStatus status);
std::string mode_to_string(JobMode mode);
std::optional<JobMode> mode_from_string(const std::string& text);

std::string to_json(const SimulationSnapshot& snapshot, double prune_epsilon = kDefaultPruneEpsilon);
std::string to_json(const StepSimulationResult& result, double prune_epsilon = kDefaultPruneEpsilon);
std::string to_json(const JobRequest& job);
std::string to_json(const JobResult& result, double prune_epsilon = kDefaultPruneEpsilon);

class JobRunner {
  public:
    explicit JobRunner(SimulatorConfig base = load_simulator_config_from_env());

    const SimulatorConfig& base_config() const { return base_; }

    // Never throws for bad input: failures come back as JobStatus::Failed.
    JobResult run(const JobRequest& job, qlab::ProgressReporter* reporter = nullptr) const;

  private:
    SimulatorConfig base_;
};

}  // namespace service
