#include "circuit/isa.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (char& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

const Matrix2 kHadamard{{{kInvSqrt2, 0.0}, {kInvSqrt2, 0.0}, {kInvSqrt2, 0.0}, {-kInvSqrt2, 0.0}}};
const Matrix2 kPauliX{{{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}};
const Matrix2 kPauliY{{{0.0, 0.0}, {0.0, -1.0}, {0.0, 1.0}, {0.0, 0.0}}};
const Matrix2 kPauliZ{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {-1.0, 0.0}}};
const Matrix2 kPhaseS{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}}};
const Matrix2 kPhaseSdg{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, -1.0}}};
const Matrix2 kPhaseT{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {kInvSqrt2, kInvSqrt2}}};
const Matrix2 kPhaseTdg{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {kInvSqrt2, -kInvSqrt2}}};

}  // namespace

int gate_arity(GateKind kind) {
    return gate_control_count(kind) + 1;
}

int gate_control_count(GateKind kind) {
    switch (kind) {
        case GateKind::CX:
            return 1;
        case GateKind::CCX:
            return 2;
        case GateKind::H:
        case GateKind::X:
        case GateKind::Y:
        case GateKind::Z:
        case GateKind::S:
        case GateKind::Sdg:
        case GateKind::T:
        case GateKind::Tdg:
            return 0;
    }
    return 0;
}

std::string to_string(GateKind kind) {
    switch (kind) {
        case GateKind::H:
            return "h";
        case GateKind::X:
            return "x";
        case GateKind::Y:
            return "y";
        case GateKind::Z:
            return "z";
        case GateKind::S:
            return "s";
        case GateKind::Sdg:
            return "sdg";
        case GateKind::T:
            return "t";
        case GateKind::Tdg:
            return "tdg";
        case GateKind::CX:
            return "cx";
        case GateKind::CCX:
            return "ccx";
    }
    return "unknown";
}

std::optional<GateKind> gate_kind_from_name(std::string_view name) {
    const std::string key = to_lower(name);
    for (const auto& info : gate_catalogue()) {
        if (info.name == key) {
            return info.kind;
        }
        for (const auto& alias : info.aliases) {
            if (alias == key) {
                return info.kind;
            }
        }
    }
    return std::nullopt;
}

const Matrix2& gate_unitary(GateKind kind) {
    switch (kind) {
        case GateKind::H:
            return kHadamard;
        case GateKind::X:
        case GateKind::CX:
        case GateKind::CCX:
            return kPauliX;
        case GateKind::Y:
            return kPauliY;
        case GateKind::Z:
            return kPauliZ;
        case GateKind::S:
            return kPhaseS;
        case GateKind::Sdg:
            return kPhaseSdg;
        case GateKind::T:
            return kPhaseT;
        case GateKind::Tdg:
            return kPhaseTdg;
    }
    return kPauliX;
}

bool is_clifford(GateKind kind) {
    switch (kind) {
        case GateKind::T:
        case GateKind::Tdg:
        case GateKind::CCX:
            return false;
        default:
            return true;
    }
}

const std::vector<GateInfo>& gate_catalogue() {
    static const std::vector<GateInfo> catalogue = [] {
        std::vector<GateInfo> out;
        out.reserve(kAllGateKinds.size());
        for (GateKind kind : kAllGateKinds) {
            GateInfo info{kind, to_string(kind), {}, gate_arity(kind)};
            if (kind == GateKind::CX) {
                info.aliases.push_back("cnot");
            } else if (kind == GateKind::CCX) {
                info.aliases.push_back("toffoli");
            }
            out.push_back(std::move(info));
        }
        return out;
    }();
    return catalogue;
}

std::string format_targets(const std::vector<int>& targets) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << targets[i];
    }
    oss << "]";
    return oss.str();
}
