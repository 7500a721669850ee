#include "errors.hpp"

const char* to_string(LoopPhase phase) {
  switch (phase) {
    case LoopPhase::Draw: return "draw";
    case LoopPhase::ReadEvent: return "read event";
    case LoopPhase::HandleEvent: return "handle event";
  }
  return "unknown phase";
}

const char* to_message(CounterError err) {
  switch (err) {
    case CounterError::Underflow: return "counter underflow";
    case CounterError::Overflow: return "counter overflow";
  }
  return "counter error";
}
