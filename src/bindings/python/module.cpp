#include "circuit/isa.hpp"
#include "circuit_simulator.hpp"
#include "observables.hpp"
#include "service/challenge.hpp"
#include "service/job.hpp"
#include "service/job_service.hpp"
#include "similarity.hpp"
#include "stabilizer_sampler.hpp"
#include "simulator_config.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

GateRequest gate_request_from_dict(const py::dict& obj) {
    if (!obj.contains("gate")) {
        throw std::invalid_argument("circuit entry is missing 'gate'");
    }
    GateRequest request;
    request.gate = py::cast<std::string>(obj["gate"]);
    if (obj.contains("targets")) {
        request.targets = py::cast<std::vector<int>>(obj["targets"]);
    }
    return request;
}

std::vector<GateRequest> circuit_from_list(const py::list& circuit) {
    std::vector<GateRequest> out;
    out.reserve(py::len(circuit));
    for (const auto& item : circuit) {
        out.push_back(gate_request_from_dict(py::cast<py::dict>(item)));
    }
    return out;
}

py::dict gate_request_to_dict(const GateRequest& gate) {
    py::dict out;
    out["gate"] = gate.gate;
    out["targets"] = gate.targets;
    return out;
}

py::dict execution_log_to_dict(const ExecutionLog& entry) {
    py::dict log;
    log["step"] = entry.step;
    log["category"] = entry.category;
    log["message"] = entry.message;
    return log;
}

py::dict snapshot_to_dict(const SimulationSnapshot& snapshot, double prune_epsilon) {
    py::dict out;
    py::list statevector;
    for (const auto& amp : snapshot.statevector) {
        py::list pair;
        pair.append(amp.real());
        pair.append(amp.imag());
        statevector.append(pair);
    }
    out["statevector"] = statevector;
    out["probabilities"] = to_outcome_map(snapshot.probabilities, prune_epsilon);
    py::list bloch;
    for (const auto& b : snapshot.bloch) {
        py::dict coords;
        coords["qubit"] = b.qubit;
        coords["x"] = b.x;
        coords["y"] = b.y;
        coords["z"] = b.z;
        bloch.append(coords);
    }
    out["bloch_coords"] = bloch;
    out["measurement_counts"] = snapshot.counts;
    return out;
}

py::dict job_result_to_dict(const service::JobResult& result, double prune_epsilon) {
    py::dict out;
    out["job_id"] = result.job_id;
    out["status"] = service::status_to_string(result.status);
    out["mode"] = service::mode_to_string(result.mode);
    out["num_qubits"] = result.num_qubits;
    out["elapsed_time"] = result.elapsed_time;
    out["message"] = result.message;
    if (!result.error_type.empty()) {
        py::dict error;
        error["type"] = result.error_type;
        error["op_index"] = result.error_op_index;
        out["error"] = error;
    }
    py::list steps;
    for (const auto& snapshot : result.steps) {
        steps.append(snapshot_to_dict(snapshot, prune_epsilon));
    }
    out["steps"] = steps;
    py::list gates;
    for (const auto& gate : result.gates) {
        gates.append(gate_request_to_dict(gate));
    }
    out["gates"] = gates;
    py::list logs;
    for (const auto& entry : result.logs) {
        logs.append(execution_log_to_dict(entry));
    }
    out["logs"] = logs;
    return out;
}

SimulatorConfig config_with_seed(std::optional<std::uint64_t> seed) {
    SimulatorConfig cfg = load_simulator_config_from_env();
    if (seed) {
        cfg.seed = seed;
    }
    return cfg;
}

py::dict simulate(
    const py::list& circuit,
    int num_qubits,
    std::optional<int> shots,
    std::optional<std::uint64_t> seed
) {
    const auto ops = circuit_from_list(circuit);
    CircuitSimulator simulator(config_with_seed(seed));
    const auto snapshot = simulator.simulate(ops, num_qubits, shots);
    return snapshot_to_dict(snapshot, simulator.config().prune_epsilon);
}

py::dict simulate_steps(
    const py::list& circuit,
    int num_qubits,
    std::optional<int> shots,
    std::optional<std::uint64_t> seed
) {
    const auto ops = circuit_from_list(circuit);
    CircuitSimulator simulator(config_with_seed(seed));
    const auto result = simulator.simulate_steps(ops, num_qubits, shots);
    py::list steps;
    for (const auto& snapshot : result.steps) {
        steps.append(snapshot_to_dict(snapshot, simulator.config().prune_epsilon));
    }
    py::list gates;
    for (const auto& op : result.gates) {
        gates.append(gate_request_to_dict(GateRequest{to_string(op.kind), op.targets}));
    }
    py::dict out;
    out["steps"] = steps;
    out["gates"] = gates;
    return out;
}

double similarity_of(
    const std::map<std::string, double>& p,
    const std::map<std::string, double>& q
) {
    return similarity(p, q);
}

py::dict score_challenge(const py::list& target, const py::list& submission, double threshold) {
    const service::ChallengeScorer scorer(threshold, load_simulator_config_from_env());
    const auto score = scorer.score(circuit_from_list(target), circuit_from_list(submission));
    py::dict out;
    out["score"] = score.score;
    out["completed"] = score.completed;
    out["num_qubits"] = score.num_qubits;
    return out;
}

py::list preset_challenges() {
    py::list out;
    for (const auto& preset : service::preset_challenges()) {
        py::dict item;
        item["key"] = preset.key;
        item["name"] = preset.name;
        item["description"] = preset.description;
        item["num_qubits"] = preset.num_qubits;
        py::list circuit;
        for (const auto& gate : preset.target_circuit) {
            circuit.append(gate_request_to_dict(gate));
        }
        item["target_circuit"] = circuit;
        item["concepts"] = preset.concepts;
        out.append(item);
    }
    return out;
}

py::list gate_catalogue() {
    py::list out;
    for (const auto& info : ::gate_catalogue()) {
        py::dict item;
        item["name"] = info.name;
        item["aliases"] = info.aliases;
        item["arity"] = info.arity;
        item["clifford"] = is_clifford(info.kind);
        out.append(item);
    }
    return out;
}

service::JobRequest build_job_request(const py::dict& job_obj) {
    service::JobRequest job;
    if (job_obj.contains("job_id")) {
        job.job_id = py::cast<std::string>(job_obj["job_id"]);
    }
    if (job_obj.contains("num_qubits")) {
        job.num_qubits = py::cast<int>(job_obj["num_qubits"]);
    }
    if (job_obj.contains("circuit_data")) {
        job.circuit = circuit_from_list(py::cast<py::list>(job_obj["circuit_data"]));
    } else if (job_obj.contains("circuit")) {
        job.circuit = circuit_from_list(py::cast<py::list>(job_obj["circuit"]));
    }
    if (job_obj.contains("shots") && !job_obj["shots"].is_none()) {
        job.shots = py::cast<int>(job_obj["shots"]);
    }
    if (job_obj.contains("seed") && !job_obj["seed"].is_none()) {
        job.seed = py::cast<std::uint64_t>(job_obj["seed"]);
    }
    if (job_obj.contains("mode")) {
        const std::string text = py::cast<std::string>(job_obj["mode"]);
        const auto mode = service::mode_from_string(text);
        if (!mode) {
            throw std::invalid_argument("Unknown job mode: " + text);
        }
        job.mode = *mode;
    }
    if (job_obj.contains("sampler") && !job_obj["sampler"].is_none()) {
        const std::string text = py::cast<std::string>(job_obj["sampler"]);
        const auto sampler = sampler_from_string(text);
        if (!sampler) {
            throw std::invalid_argument("Unknown sampler: " + text);
        }
        job.sampler = *sampler;
    }
    if (job_obj.contains("metadata")) {
        job.metadata = py::cast<std::map<std::string, std::string>>(job_obj["metadata"]);
    }
    return job;
}

service::JobService& job_service() {
    static service::JobService instance;
    return instance;
}

py::dict submit_job(const py::dict& job_obj) {
    const service::JobRequest job = build_job_request(job_obj);
    const service::JobRunner runner;
    const auto result = runner.run(job);
    return job_result_to_dict(result, runner.base_config().prune_epsilon);
}

py::dict submit_job_async(const py::dict& job_obj) {
    service::JobRequest job = build_job_request(job_obj);
    const std::string job_id = job_service().submit(std::move(job));
    py::dict out;
    out["job_id"] = job_id;
    return out;
}

py::dict job_status(const std::string& job_id) {
    const service::JobStatusSnapshot snapshot = job_service().status(job_id);
    py::dict out;
    out["job_id"] = job_id;
    out["status"] = service::status_to_string(snapshot.status);
    out["percent_complete"] = snapshot.percent_complete;
    out["message"] = snapshot.message;
    py::list logs;
    for (const auto& entry : snapshot.recent_logs) {
        logs.append(execution_log_to_dict(entry));
    }
    out["recent_logs"] = logs;
    return out;
}

py::dict job_result(const std::string& job_id) {
    const auto result = job_service().poll_result(job_id);
    if (!result) {
        throw std::runtime_error("job result not available yet");
    }
    return job_result_to_dict(*result, job_service().base_config().prune_epsilon);
}

bool has_stabilizer_backend_flag() {
    return has_stabilizer_backend();
}

}  // namespace

PYBIND11_MODULE(_qlab, m) {
    m.doc() = "Quantum circuit lab simulator bindings";
    m.def(
        "simulate",
        &simulate,
        py::arg("circuit"),
        py::arg("num_qubits"),
        py::arg("shots") = py::none(),
        py::arg("seed") = py::none(),
        "Run a circuit and return statevector, probabilities, bloch_coords and measurement_counts."
    );
    m.def(
        "simulate_steps",
        &simulate_steps,
        py::arg("circuit"),
        py::arg("num_qubits"),
        py::arg("shots") = py::none(),
        py::arg("seed") = py::none(),
        "Return one snapshot per circuit prefix, starting with the initial state."
    );
    m.def(
        "similarity",
        &similarity_of,
        py::arg("p"),
        py::arg("q"),
        "Bhattacharyya coefficient of two outcome -> probability maps, capped at 1."
    );
    m.def(
        "score_challenge",
        &score_challenge,
        py::arg("target"),
        py::arg("submission"),
        py::arg("threshold") = service::ChallengeScorer::kDefaultThreshold,
        "Score a submitted circuit against a target circuit."
    );
    m.def("preset_challenges", &preset_challenges, "List the built-in challenges.");
    m.def("gate_catalogue", &gate_catalogue, "List supported gates with aliases and arity.");
    m.def(
        "submit_job",
        &submit_job,
        py::arg("job"),
        "Run a job synchronously. The job dict mirrors service::JobRequest."
    );
    m.def(
        "submit_job_async",
        &submit_job_async,
        py::arg("job"),
        "Submit a job asynchronously and receive a job_id immediately."
    );
    m.def(
        "job_status",
        &job_status,
        py::arg("job_id"),
        "Query the current status snapshot for an async job."
    );
    m.def(
        "job_result",
        &job_result,
        py::arg("job_id"),
        "Fetch the final result for an async job (raises if not ready)."
    );
    m.def(
        "has_stabilizer_backend",
        &has_stabilizer_backend_flag,
        "Return true when the stabilizer (Stim) sampler is available."
    );
}
