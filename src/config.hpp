#pragma once
/*
 * Config
 *
 * Purpose: runtime options loaded from an rc file (default ~/.bcachefs-tuirc).
 * Format: one `set <option> <value>` per line; leading ':' allowed;
 * '#', '"' and '//' start comment lines. Bad lines yield a diagnostic and
 * are skipped; later lines still apply.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>

struct Config {
  bool enable_color = true;
  std::optional<std::filesystem::path> log_file;
  spdlog::level::level_enum log_level = spdlog::level::info;
};

// Returns false with msg set when the line is not understood.
bool apply_config_line(Config& cfg, const std::string& line, std::string& msg);

// Applies every line of the file. `required` turns a missing file into a
// diagnostic. Returns the diagnostics, empty when the file was clean.
std::vector<std::string> load_config(const std::filesystem::path& path, Config& cfg, bool required);

std::optional<std::filesystem::path> default_config_path();
