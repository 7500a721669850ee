#pragma once
/*
 * KeyRegistry
 *
 * Purpose: map key codes to the closed set of application actions.
 * Design: key → Action lookup; App applies actions through a total switch.
 */
#include <optional>
#include <unordered_map>

enum class Action { Decrement, Increment, Quit };

class KeyRegistry {
public:
  void bind(int key, Action action) { map_[key] = action; }
  std::optional<Action> lookup(int key) const {
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;
    return it->second;
  }
  static KeyRegistry defaults() {
    KeyRegistry r;
    r.bind('j', Action::Decrement);
    r.bind('k', Action::Increment);
    r.bind('q', Action::Quit);
    return r;
  }
private:
  std::unordered_map<int, Action> map_;
};

const char* to_string(Action action);
