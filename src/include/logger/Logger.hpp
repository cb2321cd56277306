#pragma once

#include <string>
#include <spdlog/common.h>

//---------------------------------------------------------------------------
namespace logger {
//---------------------------------------------------------------------------
/**
 * Registers a colored stdout logger as the spdlog default logger and sets its level.
 * Safe to call more than once, the previous default logger gets replaced.
 **/
void setup_logger(spdlog::level::level_enum level);
/**
 * Parses a level name like "debug" or "info".
 * Unknown names result in spdlog::level::info.
 **/
spdlog::level::level_enum parse_level(const std::string& name);
//---------------------------------------------------------------------------
}  // namespace logger
//---------------------------------------------------------------------------
