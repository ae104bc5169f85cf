#include "circuit/isa.hpp"
#include "circuit_simulator.hpp"
#include "service/job.hpp"
#include "simulator_config.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(std::ostream& out) {
    out << "usage: qlab_cli <num_qubits> \"<gate> <t>...; <gate> <t>...\" "
           "[--shots N] [--seed S] [--steps]\n"
           "       qlab_cli --gates\n";
}

void print_gates(std::ostream& out) {
    for (const auto& info : gate_catalogue()) {
        out << info.name << " arity=" << info.arity;
        if (!info.aliases.empty()) {
            out << " aliases=";
            for (std::size_t i = 0; i < info.aliases.size(); ++i) {
                if (i > 0) {
                    out << ',';
                }
                out << info.aliases[i];
            }
        }
        if (is_clifford(info.kind)) {
            out << " clifford";
        }
        out << '\n';
    }
}

// "h 0; cx 0 1" -> [{h,[0]}, {cx,[0,1]}]. Empty segments are skipped.
std::vector<GateRequest> parse_circuit(const std::string& text) {
    std::vector<GateRequest> ops;
    std::stringstream segments(text);
    std::string segment;
    while (std::getline(segments, segment, ';')) {
        std::istringstream fields(segment);
        GateRequest request;
        if (!(fields >> request.gate)) {
            continue;
        }
        std::string token;
        while (fields >> token) {
            std::size_t consumed = 0;
            const int target = std::stoi(token, &consumed);
            if (consumed != token.size()) {
                throw std::invalid_argument("Bad qubit index '" + token + "'");
            }
            request.targets.push_back(target);
        }
        ops.push_back(std::move(request));
    }
    return ops;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    std::optional<int> shots;
    std::optional<std::uint64_t> seed;
    bool steps = false;
    bool list_gates = false;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--shots" && i + 1 < argc) {
                shots = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--steps") {
                steps = true;
            } else if (arg == "--gates") {
                list_gates = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(std::cout);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "error: bad option value: " << ex.what() << '\n';
        return 2;
    }

    if (list_gates) {
        print_gates(std::cout);
        return 0;
    }
    if (positional.size() != 2) {
        print_usage(std::cerr);
        return 2;
    }

    SimulatorConfig cfg = load_simulator_config_from_env();
    if (seed) {
        cfg.seed = seed;
    }

    try {
        const int num_qubits = std::stoi(positional[0]);
        const auto ops = parse_circuit(positional[1]);
        CircuitSimulator simulator(cfg);
        if (steps) {
            std::cout << service::to_json(
                             simulator.simulate_steps(ops, num_qubits, shots), cfg.prune_epsilon)
                      << '\n';
        } else {
            std::cout << service::to_json(
                             simulator.simulate(ops, num_qubits, shots), cfg.prune_epsilon)
                      << '\n';
        }
        if (cfg.emit_logs) {
            for (const auto& log : simulator.logs()) {
                std::cerr << '[' << log.step << "] " << log.category << ": " << log.message
                          << '\n';
            }
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 2;
    } catch (const std::out_of_range& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "internal error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
