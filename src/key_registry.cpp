#include "key_registry.hpp"

const char* to_string(Action action) {
  switch (action) {
    case Action::Decrement: return "decrement";
    case Action::Increment: return "increment";
    case Action::Quit: return "quit";
  }
  return "unknown";
}
