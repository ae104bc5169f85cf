#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Gate set and circuit description shared by the validator, the engines,
// the service layer and the bindings. This header carries no simulation
// state; it is the "ISA" view of a circuit.

enum class GateKind {
    H,
    X,
    Y,
    Z,
    S,
    Sdg,
    T,
    Tdg,
    CX,
    CCX,
};

inline constexpr std::array<GateKind, 10> kAllGateKinds{{
    GateKind::H,
    GateKind::X,
    GateKind::Y,
    GateKind::Z,
    GateKind::S,
    GateKind::Sdg,
    GateKind::T,
    GateKind::Tdg,
    GateKind::CX,
    GateKind::CCX,
}};

// Row-major 2x2 unitary: {U00, U01, U10, U11}.
using Matrix2 = std::array<std::complex<double>, 4>;

// Unvalidated gate as it arrives from the circuit builder.
struct GateRequest {
    std::string gate;          // "h", "cx", "toffoli", ... (case-insensitive)
    std::vector<int> targets;  // controls first, acted-upon qubit last
};

struct GateOperation {
    GateKind kind = GateKind::H;
    std::vector<int> targets;
};

struct CircuitSpec {
    int num_qubits = 0;
    std::vector<GateOperation> ops;
};

struct GateInfo {
    GateKind kind;
    std::string name;
    std::vector<std::string> aliases;
    int arity = 1;
};

// Number of qubit operands the kind requires.
int gate_arity(GateKind kind);

// Number of leading control operands (0 for the single-qubit kinds).
int gate_control_count(GateKind kind);

// Canonical lower-case name ("h", "sdg", "cx", "ccx", ...).
std::string to_string(GateKind kind);

// Case-insensitive lookup including the "cnot" and "toffoli" aliases.
std::optional<GateKind> gate_kind_from_name(std::string_view name);

// The 2x2 unitary applied to the acted-upon qubit. Controlled kinds return
// the matrix of the conditioned operation (X for both CX and CCX).
const Matrix2& gate_unitary(GateKind kind);

bool is_clifford(GateKind kind);

const std::vector<GateInfo>& gate_catalogue();

std::string format_targets(const std::vector<int>& targets);
