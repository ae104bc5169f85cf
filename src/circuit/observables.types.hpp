#pragma once

#include <complex>
#include <map>
#include <string>
#include <vector>

using Amplitude = std::complex<double>;
using Statevector = std::vector<Amplitude>;

// Full 2^n distribution indexed by basis state; values[k] = |amp[k]|^2.
struct ProbabilityDistribution {
    int n_qubits = 0;
    std::vector<double> values;
};

struct BlochVector {
    int qubit = 0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Observed outcomes only, keyed by outcome label.
using MeasurementCounts = std::map<std::string, int>;

struct ExecutionLog {
    int step = 0;
    std::string category;
    std::string message;
};
