#pragma once
/*
 * Logging
 *
 * Purpose: install the process-wide spdlog default logger.
 * Note: the screen belongs to ncurses while a session is active, so logs go
 * to the configured file or nowhere.
 */
#include "config.hpp"

void setup_logging(const Config& cfg);
