#include "config.hpp"
#include "logging.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>

static void parse_lines() {
  Config cfg;
  std::string msg;
  assert(apply_config_line(cfg, "", msg));
  assert(apply_config_line(cfg, "   # comment", msg));
  assert(apply_config_line(cfg, "\" vim style comment", msg));
  assert(apply_config_line(cfg, "// slashes", msg));
  assert(msg.empty());

  assert(apply_config_line(cfg, "set color off", msg));
  assert(!cfg.enable_color);
  assert(apply_config_line(cfg, ":set color ON", msg));
  assert(cfg.enable_color);

  assert(apply_config_line(cfg, "  set logfile /tmp/some log.txt  ", msg));
  assert(cfg.log_file && cfg.log_file->string() == "/tmp/some log.txt");

  assert(apply_config_line(cfg, "set loglevel debug", msg));
  assert(cfg.log_level == spdlog::level::debug);
  assert(apply_config_line(cfg, "set loglevel Error", msg));
  assert(cfg.log_level == spdlog::level::err);
}

static void reject_bad_lines() {
  Config cfg;
  std::string msg;
  assert(!apply_config_line(cfg, "set color maybe", msg));
  assert(msg == "set color: value must be on|off");
  assert(cfg.enable_color);
  assert(!apply_config_line(cfg, "set loglevel loud", msg));
  assert(cfg.log_level == spdlog::level::info);
  assert(!apply_config_line(cfg, "set logfile", msg));
  assert(!cfg.log_file);
  assert(!apply_config_line(cfg, "map j up", msg));
  assert(msg == "unknown command: map");
  assert(!apply_config_line(cfg, "set frobnicate 1", msg));
  assert(msg == "set: unknown option frobnicate");
  assert(!apply_config_line(cfg, "set", msg));
  assert(msg == "set: missing option");
}

static void load_file() {
  auto dir = std::filesystem::temp_directory_path();
  auto path = dir / ("bcachefs-tuirc-test-" + std::to_string(::getpid()));
  {
    std::ofstream out(path);
    out << "# sample\r\n"
        << "set color off\r\n"
        << "set nonsense\n"
        << "set loglevel warn\n";
  }
  Config cfg;
  auto diags = load_config(path, cfg, true);
  assert(diags.size() == 1);
  assert(diags[0] == path.filename().string() + ":3: set: unknown option nonsense");
  assert(!cfg.enable_color);
  assert(cfg.log_level == spdlog::level::warn);
  std::filesystem::remove(path);

  Config other;
  assert(load_config(path, other, false).empty());
  auto missing = load_config(path, other, true);
  assert(missing.size() == 1);
  assert(missing[0] == "can not open config: " + path.string());
}

static void logging_to_file() {
  auto path = std::filesystem::temp_directory_path() / ("bcachefs-tui-log-" + std::to_string(::getpid()));
  Config cfg;
  cfg.log_file = path;
  cfg.log_level = spdlog::level::warn;
  setup_logging(cfg);
  spdlog::info("dropped");
  spdlog::warn("kept {}", 1);
  setup_logging(Config{});
  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(content.find("kept 1") != std::string::npos);
  assert(content.find("dropped") == std::string::npos);
  std::filesystem::remove(path);
}

int main() {
  parse_lines();
  reject_bad_lines();
  load_file();
  logging_to_file();
  return 0;
}
