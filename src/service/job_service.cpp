#include "service/job_service.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace service {

void JobProgressReporter::set_total_steps(std::size_t total_steps) {
    total_.store(total_steps, std::memory_order_relaxed);
}

void JobProgressReporter::increment_completed_steps(std::size_t delta) {
    done_.fetch_add(delta, std::memory_order_relaxed);
}

void JobProgressReporter::record_log(const ExecutionLog& log) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (ring_.size() == kMaxLogs) {
        ring_.erase(ring_.begin());
    }
    ring_.push_back(log);
}

double JobProgressReporter::fraction_complete() const {
    const std::size_t total = total_steps();
    if (total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(completed_steps()) / static_cast<double>(total));
}

std::vector<ExecutionLog> JobProgressReporter::recent_logs() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return ring_;
}

JobService::JobService(SimulatorConfig base)
    : runner_(std::make_shared<const JobRunner>(std::move(base))) {}

JobService::~JobService() = default;

std::shared_ptr<JobService::JobEntry> JobService::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    const auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

void JobService::execute(const JobRunner& runner, JobEntry& entry) {
    entry.status.store(JobStatus::Running, std::memory_order_relaxed);
    entry.reporter.set_total_steps(entry.request.circuit.size());
    const auto start = std::chrono::steady_clock::now();
    JobResult result;
    try {
        result = runner.run(entry.request, &entry.reporter);
    } catch (const std::exception& ex) {
        // Engine defects (NumericInvariantError) are not caller errors and
        // escape JobRunner; they still end the job.
        result.job_id = entry.request.job_id;
        result.mode = entry.request.mode;
        result.num_qubits = entry.request.num_qubits;
        result.gates = entry.request.circuit;
        result.status = JobStatus::Failed;
        result.message = std::string("internal error: ") + ex.what();
        result.error_type = "InternalError";
        result.elapsed_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    }
    std::lock_guard<std::mutex> guard(entry.result_mutex);
    entry.result = std::move(result);
    entry.status.store(entry.result.status, std::memory_order_relaxed);
}

std::string JobService::submit(JobRequest job) {
    const std::string job_id = "job-" + std::to_string(next_id_.fetch_add(1));
    job.job_id = job_id;

    auto entry = std::make_shared<JobEntry>();
    entry->request = std::move(job);
    entry->result.job_id = job_id;
    entry->result.mode = entry->request.mode;
    entry->result.num_qubits = entry->request.num_qubits;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_.emplace(job_id, entry);
    }

    // The thread owns references to both the entry and the runner, so it
    // stays valid after the service is destroyed.
    std::thread([runner = runner_, entry]() { execute(*runner, *entry); }).detach();
    return job_id;
}

std::optional<JobResult> JobService::poll_result(const std::string& job_id) const {
    const auto entry = find(job_id);
    if (!entry) {
        return std::nullopt;
    }
    const JobStatus status = entry->status.load(std::memory_order_relaxed);
    if (status != JobStatus::Completed && status != JobStatus::Failed) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    return entry->result;
}

JobStatusSnapshot JobService::status(const std::string& job_id) const {
    JobStatusSnapshot snapshot;
    const auto entry = find(job_id);
    if (!entry) {
        snapshot.status = JobStatus::Failed;
        snapshot.message = "job_id not found";
        return snapshot;
    }
    snapshot.status = entry->status.load(std::memory_order_relaxed);
    snapshot.percent_complete = snapshot.status == JobStatus::Completed
        ? 1.0
        : entry->reporter.fraction_complete();
    snapshot.recent_logs = entry->reporter.recent_logs();
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    snapshot.message = entry->result.message;
    return snapshot;
}

}  // namespace service
