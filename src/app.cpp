#include "app.hpp"
#include <spdlog/spdlog.h>

static constexpr Style KEY_STYLE{Color::Blue, true};
static constexpr Style TITLE_STYLE{Color::Default, true};
static constexpr Style VALUE_STYLE{Color::Yellow, false};
static constexpr Style STATUS_STYLE{Color::Red, false};

void App::run(ITerminal& term, IInputSource& input) {
  spdlog::info("event loop started");
  while (!exit_) {
    try {
      term.draw(*this);
    } catch (const std::exception& e) {
      spdlog::error("draw failed: {}", e.what());
      throw LoopError(LoopPhase::Draw, e.what());
    }
    Event ev;
    try {
      ev = input.read_event();
    } catch (const std::exception& e) {
      spdlog::error("reading event failed: {}", e.what());
      throw LoopError(LoopPhase::ReadEvent, e.what());
    }
    try {
      handle_event(ev);
    } catch (const std::exception& e) {
      spdlog::error("handling event failed: {}", e.what());
      throw LoopError(LoopPhase::HandleEvent, e.what());
    }
  }
  spdlog::info("event loop finished, counter={}", counter_);
}

void App::handle_event(const Event& ev) {
  switch (ev.kind) {
    case EventKind::KeyPress: break;
    case EventKind::Resize: spdlog::debug("terminal resized"); return;
    default: return;
  }
  if (auto err = handle_key(ev.key)) {
    status_ = to_message(*err);
    spdlog::warn("{} (counter={})", status_, counter_);
  }
}

std::optional<CounterError> App::handle_key(int key) {
  if (exit_) return std::nullopt;
  auto action = keys_.lookup(key);
  if (!action) return std::nullopt;
  spdlog::debug("key {} -> {}", key, to_string(*action));
  return apply(*action);
}

std::optional<CounterError> App::apply(Action action) {
  switch (action) {
    case Action::Quit: exit_ = true; return std::nullopt;
    case Action::Increment: return increment();
    case Action::Decrement: return decrement();
  }
  return std::nullopt;
}

std::optional<CounterError> App::increment() {
  if (counter_ >= kCounterMax) return CounterError::Overflow;
  counter_++;
  status_.clear();
  return std::nullopt;
}

std::optional<CounterError> App::decrement() {
  if (counter_ == 0) return CounterError::Underflow;
  counter_--;
  status_.clear();
  return std::nullopt;
}

Paragraph App::view() const {
  Block block;
  block.border = BorderType::Thick;
  block.titles.push_back(Title{Line({Span(kTitle, TITLE_STYLE)}), Alignment::Center, Title::Position::Top});
  block.titles.push_back(Title{Line({
      Span(" Decrement "), Span("<j>", KEY_STYLE),
      Span(" Increment "), Span("<k>", KEY_STYLE),
      Span(" Quit "), Span("<q>", KEY_STYLE),
    }), Alignment::Center, Title::Position::Bottom});

  Paragraph p;
  p.alignment = Alignment::Center;
  p.block = std::move(block);
  p.lines.push_back(Line({Span("Value: "), Span(std::to_string(counter_), VALUE_STYLE)}));
  if (!status_.empty()) p.lines.push_back(Line({Span(status_, STATUS_STYLE)}));
  return p;
}

void App::render(const Rect& area, ITerminal& term) const {
  view().render(area, term);
}
