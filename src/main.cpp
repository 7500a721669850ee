#include "app.hpp"
#include "config.hpp"
#include "input.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

static void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [-c <rcfile>] [-h]\n";
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> rc_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) { usage(argv[0]); return 0; }
    if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) { rc_path = std::filesystem::path(argv[++i]); continue; }
    usage(argv[0]);
    return 2;
  }

  Config cfg;
  std::vector<std::string> diags;
  if (rc_path) diags = load_config(*rc_path, cfg, true);
  else if (auto def = default_config_path()) diags = load_config(*def, cfg, false);

  try {
    setup_logging(cfg);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "bcachefs-tui: logging disabled: " << e.what() << "\n";
    cfg.log_file.reset();
    setup_logging(cfg);
  }
  for (const auto& d : diags) spdlog::warn("config: {}", d);

  App app;
  if (!diags.empty()) app.set_status(diags.back());
  try {
    Terminal session;
    NcursesTerminal term(cfg.enable_color);
    NcursesInput input;
    app.run(term, input);
    session.restore();
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    std::cerr << "bcachefs-tui: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
