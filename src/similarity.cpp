#include "similarity.hpp"

#include "observables.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

double similarity(
    const std::map<std::string, double>& p,
    const std::map<std::string, double>& q
) {
    // Keys absent from either side contribute sqrt(0) and are skipped.
    double total = 0.0;
    for (const auto& [label, p_value] : p) {
        const auto it = q.find(label);
        if (it == q.end()) {
            continue;
        }
        total += std::sqrt(std::max(0.0, p_value * it->second));
    }
    return std::min(total, 1.0);
}

double similarity(const ProbabilityDistribution& p, const ProbabilityDistribution& q) {
    if (p.n_qubits != q.n_qubits || p.values.size() != q.values.size()) {
        return similarity(to_outcome_map(p, -1.0), to_outcome_map(q, -1.0));
    }
    double total = 0.0;
    for (std::size_t k = 0; k < p.values.size(); ++k) {
        total += std::sqrt(std::max(0.0, p.values[k] * q.values[k]));
    }
    return std::min(total, 1.0);
}
