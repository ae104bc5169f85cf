#pragma once

#include <map>
#include <string>

#include "circuit/observables.types.hpp"

// Bhattacharyya coefficient: sum over the union of outcomes of
// sqrt(p(k) * q(k)), capped at 1. Missing outcomes count as 0.
double similarity(
    const std::map<std::string, double>& p,
    const std::map<std::string, double>& q
);

double similarity(const ProbabilityDistribution& p, const ProbabilityDistribution& q);
