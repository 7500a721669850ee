#include "logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static constexpr const char* LOGGER_NAME = "bcachefs-tui";

void setup_logging(const Config& cfg) {
  spdlog::drop(LOGGER_NAME);
  std::shared_ptr<spdlog::logger> logger;
  if (cfg.log_file) {
    logger = spdlog::basic_logger_mt(LOGGER_NAME, cfg.log_file->string(), false);
  } else {
    logger = spdlog::null_logger_mt(LOGGER_NAME);
  }
  logger->set_level(cfg.log_level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}
