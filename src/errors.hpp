#pragma once
/*
 * Errors
 *
 * Purpose: exception types for terminal/input failures and the loop phase
 * wrapper; value type for recoverable counter failures.
 */
#include <stdexcept>
#include <string>

class TerminalInitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TerminalRestoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TerminalIoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InputReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class LoopPhase { Draw, ReadEvent, HandleEvent };

const char* to_string(LoopPhase phase);

class LoopError : public std::runtime_error {
public:
  LoopError(LoopPhase phase, const std::string& cause)
    : std::runtime_error(std::string(to_string(phase)) + ": " + cause), phase_(phase) {}
  LoopPhase phase() const { return phase_; }
private:
  LoopPhase phase_;
};

enum class CounterError { Underflow, Overflow };

const char* to_message(CounterError err);
