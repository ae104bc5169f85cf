#pragma once

#include "service/job.hpp"

#include "progress_reporter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace service {

// Shared between one worker thread and any number of status pollers.
// Keeps the last kMaxLogs log entries only.
class JobProgressReporter final : public qlab::ProgressReporter {
  public:
    static constexpr std::size_t kMaxLogs = 8;

    void set_total_steps(std::size_t total_steps) override;
    void increment_completed_steps(std::size_t delta = 1) override;
    void record_log(const ExecutionLog& log) override;

    std::size_t total_steps() const { return total_.load(std::memory_order_relaxed); }
    std::size_t completed_steps() const { return done_.load(std::memory_order_relaxed); }

    // Fraction of gates applied, in [0, 1]; 0 while the total is unknown.
    double fraction_complete() const;

    std::vector<ExecutionLog> recent_logs() const;

  private:
    std::atomic<std::size_t> total_{0};
    std::atomic<std::size_t> done_{0};
    mutable std::mutex log_mutex_;
    std::vector<ExecutionLog> ring_;
};

struct JobStatusSnapshot {
    JobStatus status = JobStatus::Pending;
    double percent_complete = 0.0;
    std::string message;
    std::vector<ExecutionLog> recent_logs;
};

// Runs each submitted job on its own detached thread. Jobs are kept for the
// lifetime of the service; ids are "job-0", "job-1", ...
class JobService {
  public:
    explicit JobService(SimulatorConfig base = load_simulator_config_from_env());
    ~JobService();

    const SimulatorConfig& base_config() const { return runner_->base_config(); }

    std::string submit(JobRequest job);

    // Final result once the job has completed or failed.
    std::optional<JobResult> poll_result(const std::string& job_id) const;

    JobStatusSnapshot status(const std::string& job_id) const;

  private:
    struct JobEntry {
        JobRequest request;
        JobResult result;
        JobProgressReporter reporter;
        std::atomic<JobStatus> status{JobStatus::Pending};
        mutable std::mutex result_mutex;
    };

    std::shared_ptr<JobEntry> find(const std::string& job_id) const;
    static void execute(const JobRunner& runner, JobEntry& entry);

    mutable std::mutex jobs_mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::atomic<std::uint64_t> next_id_{0};
    std::shared_ptr<const JobRunner> runner_;
};

}  // namespace service
