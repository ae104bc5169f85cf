#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Caller-input failures raised before any state is allocated. Every error
// carries the index of the offending operation (-1 when the failure is not
// tied to a single operation).

class CircuitValidationError : public std::invalid_argument {
  public:
    CircuitValidationError(const std::string& message, int op_index)
        : std::invalid_argument(message), op_index_(op_index) {}

    int op_index() const { return op_index_; }

  private:
    int op_index_;
};

class UnknownGateError : public CircuitValidationError {
  public:
    UnknownGateError(std::string gate, int op_index)
        : CircuitValidationError("Unknown gate: " + gate, op_index),
          gate_(std::move(gate)) {}

    const std::string& gate() const { return gate_; }

  private:
    std::string gate_;
};

class ArityMismatchError : public CircuitValidationError {
  public:
    ArityMismatchError(std::string gate, int expected, int actual, int op_index)
        : CircuitValidationError(
              "Gate " + gate + " expects " + std::to_string(expected) +
                  " target(s), got " + std::to_string(actual),
              op_index),
          gate_(std::move(gate)),
          expected_(expected),
          actual_(actual) {}

    const std::string& gate() const { return gate_; }
    int expected() const { return expected_; }
    int actual() const { return actual_; }

  private:
    std::string gate_;
    int expected_;
    int actual_;
};

class QubitIndexOutOfRangeError : public CircuitValidationError {
  public:
    QubitIndexOutOfRangeError(int qubit, int num_qubits, int op_index)
        : CircuitValidationError(
              "Qubit index " + std::to_string(qubit) + " out of range for " +
                  std::to_string(num_qubits) + "-qubit circuit",
              op_index),
          qubit_(qubit),
          num_qubits_(num_qubits) {}

    int qubit() const { return qubit_; }
    int num_qubits() const { return num_qubits_; }

  private:
    int qubit_;
    int num_qubits_;
};

class DuplicateTargetError : public CircuitValidationError {
  public:
    DuplicateTargetError(std::string gate, int qubit, int op_index)
        : CircuitValidationError(
              "Gate " + gate + " repeats qubit " + std::to_string(qubit),
              op_index),
          gate_(std::move(gate)),
          qubit_(qubit) {}

    const std::string& gate() const { return gate_; }
    int qubit() const { return qubit_; }

  private:
    std::string gate_;
    int qubit_;
};

class QubitCountError : public CircuitValidationError {
  public:
    QubitCountError(int requested, int max_qubits)
        : CircuitValidationError(
              "Qubit count " + std::to_string(requested) + " outside supported range 1.." +
                  std::to_string(max_qubits),
              -1),
          requested_(requested),
          max_qubits_(max_qubits) {}

    int requested() const { return requested_; }
    int max_qubits() const { return max_qubits_; }

  private:
    int requested_;
    int max_qubits_;
};

// Normalization drift or non-finite amplitudes: an engine defect, never a
// caller error.
class NumericInvariantError : public std::logic_error {
  public:
    explicit NumericInvariantError(const std::string& message)
        : std::logic_error(message) {}
};
