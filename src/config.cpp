#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::optional<spdlog::level::level_enum> parse_level(const std::string& v) {
  if (v == "trace") return spdlog::level::trace;
  if (v == "debug") return spdlog::level::debug;
  if (v == "info") return spdlog::level::info;
  if (v == "warn" || v == "warning") return spdlog::level::warn;
  if (v == "error") return spdlog::level::err;
  if (v == "critical") return spdlog::level::critical;
  if (v == "off") return spdlog::level::off;
  return std::nullopt;
}

bool apply_config_line(Config& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream in(s);
  std::string cmd, opt;
  in >> cmd >> opt;
  if (cmd != "set") { msg = "unknown command: " + cmd; return false; }
  std::string value;
  std::getline(in, value);
  value = trim(value);

  if (opt == "color") {
    std::string v = to_lower(value);
    if (v == "on" || v == "1" || v == "true") { cfg.enable_color = true; return true; }
    if (v == "off" || v == "0" || v == "false") { cfg.enable_color = false; return true; }
    msg = "set color: value must be on|off";
    return false;
  }
  if (opt == "logfile") {
    if (value.empty()) { msg = "set logfile: use set logfile <path>"; return false; }
    cfg.log_file = std::filesystem::path(value);
    return true;
  }
  if (opt == "loglevel") {
    auto lvl = parse_level(to_lower(value));
    if (!lvl) { msg = "set loglevel: use trace|debug|info|warn|error|critical|off"; return false; }
    cfg.log_level = *lvl;
    return true;
  }
  msg = opt.empty() ? std::string("set: missing option") : "set: unknown option " + opt;
  return false;
}

std::vector<std::string> load_config(const std::filesystem::path& path, Config& cfg, bool required) {
  std::vector<std::string> diags;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (required) diags.push_back("can not open config: " + path.string());
    return diags;
  }
  std::ifstream in(path);
  if (!in) { diags.push_back("can not open config: " + path.string()); return diags; }
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    lineno++;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::string msg;
    if (!apply_config_line(cfg, line, msg)) {
      diags.push_back(path.filename().string() + ":" + std::to_string(lineno) + ": " + msg);
    }
  }
  return diags;
}

std::optional<std::filesystem::path> default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / ".bcachefs-tuirc";
}
