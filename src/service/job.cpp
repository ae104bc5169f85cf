#include "service/job.hpp"

#include "circuit/errors.hpp"
#include "observables.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace service {

namespace {

std::string escape_json(const std::string& str) {
    std::ostringstream out;
    for (const char ch : str) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                out << ch;
        }
    }
    return out.str();
}

void append_int_array(const std::vector<int>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
}

void append_snapshot(
    const SimulationSnapshot& snapshot,
    double prune_epsilon,
    std::ostringstream& out
) {
    out << "{\"statevector\":[";
    for (std::size_t i = 0; i < snapshot.statevector.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << '[' << snapshot.statevector[i].real() << ',' << snapshot.statevector[i].imag() << ']';
    }
    out << "],\"probabilities\":{";
    bool first = true;
    for (const auto& [label, p] : to_outcome_map(snapshot.probabilities, prune_epsilon)) {
        if (!first) {
            out << ',';
        }
        first = false;
        out << '"' << label << "\":" << p;
    }
    out << "},\"bloch_coords\":[";
    for (std::size_t i = 0; i < snapshot.bloch.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        const auto& b = snapshot.bloch[i];
        out << "{\"qubit\":" << b.qubit << ",\"x\":" << b.x << ",\"y\":" << b.y
            << ",\"z\":" << b.z << '}';
    }
    out << "],\"measurement_counts\":{";
    first = true;
    for (const auto& [label, count] : snapshot.counts) {
        if (!first) {
            out << ',';
        }
        first = false;
        out << '"' << label << "\":" << count;
    }
    out << "}}";
}

void append_gate_request(const GateRequest& gate, std::ostringstream& out) {
    out << "{\"gate\":\"" << escape_json(gate.gate) << "\",\"targets\":";
    append_int_array(gate.targets, out);
    out << '}';
}

void append_log(const ExecutionLog& log, std::ostringstream& out) {
    out << "{\"step\":" << log.step << ",\"category\":\"" << escape_json(log.category)
        << "\",\"message\":\"" << escape_json(log.message) << "\"}";
}

std::string error_type_name(const std::exception& ex) {
    if (dynamic_cast<const UnknownGateError*>(&ex)) {
        return "UnknownGateError";
    }
    if (dynamic_cast<const ArityMismatchError*>(&ex)) {
        return "ArityMismatchError";
    }
    if (dynamic_cast<const QubitIndexOutOfRangeError*>(&ex)) {
        return "QubitIndexOutOfRangeError";
    }
    if (dynamic_cast<const DuplicateTargetError*>(&ex)) {
        return "DuplicateTargetError";
    }
    if (dynamic_cast<const QubitCountError*>(&ex)) {
        return "QubitCountError";
    }
    return "InvalidArgument";
}

std::vector<GateRequest> to_gate_requests(const std::vector<GateOperation>& ops) {
    std::vector<GateRequest> out;
    out.reserve(ops.size());
    for (const auto& op : ops) {
        out.push_back(GateRequest{to_string(op.kind), op.targets});
    }
    return out;
}

}  // namespace

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
    }
    return "unknown";
}

std::string mode_to_string(JobMode mode) {
    switch (mode) {
        case JobMode::Full:
            return "full";
        case JobMode::Steps:
            return "steps";
    }
    return "full";
}

std::optional<JobMode> mode_from_string(const std::string& text) {
    if (text == "full") {
        return JobMode::Full;
    }
    if (text == "steps" || text == "step") {
        return JobMode::Steps;
    }
    return std::nullopt;
}

std::string to_json(const SimulationSnapshot& snapshot, double prune_epsilon) {
    std::ostringstream out;
    out << std::setprecision(15);
    append_snapshot(snapshot, prune_epsilon, out);
    return out.str();
}

std::string to_json(const StepSimulationResult& result, double prune_epsilon) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << "{\"steps\":[";
    for (std::size_t i = 0; i < result.steps.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_snapshot(result.steps[i], prune_epsilon, out);
    }
    out << "],\"gates\":[";
    const auto gates = to_gate_requests(result.gates);
    for (std::size_t i = 0; i < gates.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_gate_request(gates[i], out);
    }
    out << "]}";
    return out.str();
}

std::string to_json(const JobRequest& job) {
    std::ostringstream out;
    out << '{';
    out << "\"job_id\":\"" << escape_json(job.job_id) << "\",";
    out << "\"num_qubits\":" << job.num_qubits << ',';
    out << "\"mode\":\"" << mode_to_string(job.mode) << "\",";
    if (job.shots) {
        out << "\"shots\":" << *job.shots << ',';
    }
    if (job.seed) {
        out << "\"seed\":" << *job.seed << ',';
    }
    if (job.sampler) {
        out << "\"sampler\":\"" << sampler_to_string(*job.sampler) << "\",";
    }
    out << "\"circuit_data\":[";
    for (std::size_t i = 0; i < job.circuit.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_gate_request(job.circuit[i], out);
    }
    out << "],\"metadata\":{";
    bool first = true;
    for (const auto& [key, value] : job.metadata) {
        if (!first) {
            out << ',';
        }
        first = false;
        out << '"' << escape_json(key) << "\":\"" << escape_json(value) << '"';
    }
    out << "}}";
    return out.str();
}

std::string to_json(const JobResult& result, double prune_epsilon) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << '{';
    out << "\"job_id\":\"" << escape_json(result.job_id) << "\",";
    out << "\"status\":\"" << status_to_string(result.status) << "\",";
    out << "\"mode\":\"" << mode_to_string(result.mode) << "\",";
    out << "\"num_qubits\":" << result.num_qubits << ',';
    out << "\"elapsed_time\":" << result.elapsed_time << ',';
    out << "\"message\":\"" << escape_json(result.message) << "\",";
    if (!result.error_type.empty()) {
        out << "\"error\":{\"type\":\"" << escape_json(result.error_type)
            << "\",\"op_index\":" << result.error_op_index << "},";
    }
    out << "\"steps\":[";
    for (std::size_t i = 0; i < result.steps.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_snapshot(result.steps[i], prune_epsilon, out);
    }
    out << "],\"gates\":[";
    for (std::size_t i = 0; i < result.gates.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_gate_request(result.gates[i], out);
    }
    out << "],\"logs\":[";
    for (std::size_t i = 0; i < result.logs.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_log(result.logs[i], out);
    }
    out << "]}";
    return out.str();
}

JobRunner::JobRunner(SimulatorConfig base)
    : base_(std::move(base)) {}

JobResult JobRunner::run(const JobRequest& job, qlab::ProgressReporter* reporter) const {
    auto start = std::chrono::steady_clock::now();
    JobResult result;
    result.job_id = job.job_id;
    result.mode = job.mode;
    result.num_qubits = job.num_qubits;
    result.gates = job.circuit;
    try {
        SimulatorConfig cfg = base_;
        if (job.seed) {
            cfg.seed = job.seed;
        }
        if (job.sampler) {
            cfg.sampler = *job.sampler;
        }
        CircuitSimulator simulator(cfg);
        if (reporter) {
            simulator.set_progress_reporter(reporter);
        }
        if (job.mode == JobMode::Steps) {
            auto steps = simulator.simulate_steps(job.circuit, job.num_qubits, job.shots);
            result.steps = std::move(steps.steps);
        } else {
            result.steps.push_back(simulator.simulate(job.circuit, job.num_qubits, job.shots));
        }
        result.logs = simulator.logs();
        result.status = JobStatus::Completed;
    } catch (const CircuitValidationError& ex) {
        result.status = JobStatus::Failed;
        result.message = ex.what();
        result.error_type = error_type_name(ex);
        result.error_op_index = ex.op_index();
    } catch (const std::invalid_argument& ex) {
        result.status = JobStatus::Failed;
        result.message = ex.what();
        result.error_type = error_type_name(ex);
    } catch (const std::runtime_error& ex) {
        result.status = JobStatus::Failed;
        result.message = ex.what();
        result.error_type = "RuntimeError";
    }
    auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    return result;
}

}  // namespace service
