#pragma once

// C++ Includes
#include <iostream>
#include <sstream>
#include <string>
#include <exception>

// NuMCMC Includes
#include "Manager/Core.h"

_NuMCMC_Safe_Include_Start_ //{
// spdlog Includes
#include "spdlog/spdlog.h"
_NuMCMC_Safe_Include_End_ //}

/// @file NuMCMCLogger.h
/// @brief Logging utilities built on top of SPDLOG.
///
/// Log statements use compile-time level definitions, so in default builds
/// `NUMCMCLOG_DEBUG` and lower levels are removed entirely. The runtime level
/// can additionally be lowered or raised with SetNuMCMCLogLevel().
///
/// @note You can read more about SPDLOG formatting, levels, and configuration
///       on the [official SPDLOG wiki](https://github.com/gabime/spdlog/wiki).

#define NUMCMCLOG_TRACE SPDLOG_TRACE
#define NUMCMCLOG_DEBUG SPDLOG_DEBUG
#define NUMCMCLOG_INFO SPDLOG_INFO
#define NUMCMCLOG_WARN SPDLOG_WARN
#define NUMCMCLOG_ERROR SPDLOG_ERROR
#define NUMCMCLOG_CRITICAL SPDLOG_CRITICAL
#define NUMCMCLOG_OFF SPDLOG_OFF

/// @brief Map compile time SPDLOG_ACTIVE_LEVEL to spdlog::level enum
inline spdlog::level::level_enum get_default_log_level() {
  #ifdef SPDLOG_ACTIVE_LEVEL
  switch (SPDLOG_ACTIVE_LEVEL) {
    case SPDLOG_LEVEL_TRACE:    return spdlog::level::trace;
    case SPDLOG_LEVEL_DEBUG:    return spdlog::level::debug;
    case SPDLOG_LEVEL_INFO:     return spdlog::level::info;
    case SPDLOG_LEVEL_WARN:     return spdlog::level::warn;
    case SPDLOG_LEVEL_ERROR:    return spdlog::level::err;
    case SPDLOG_LEVEL_CRITICAL: return spdlog::level::critical;
    case SPDLOG_LEVEL_OFF:      return spdlog::level::off;
    default: throw std::runtime_error("Unknown SPDLOG_ACTIVE_LEVEL");
  }
  #else
  return spdlog::level::info;
  #endif
}

/// @brief Set messaging format of the logger
inline void SetNuMCMCLoggerFormat()
{
  //%H for hour, %M for minute, %S for second, [%s:%#] for class and line
  //For documentation see https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
  #ifdef DEBUG
  spdlog::set_pattern("[%s:%#][%^%l%$] %v");
  #else
  spdlog::set_pattern("[%s][%^%l%$] %v");
  #endif

  spdlog::set_level(get_default_log_level());
}

/// @brief Set runtime verbosity from its name, e.g. "debug", "info", "warn"
/// @param LevelName Any name understood by spdlog::level::from_str
inline void SetNuMCMCLogLevel(const std::string& LevelName)
{
  const spdlog::level::level_enum Level = spdlog::level::from_str(LevelName);
  //spdlog maps unknown names to off, which would silence everything
  if (Level == spdlog::level::off && LevelName != "off") {
    NUMCMCLOG_WARN("Unknown log level {}, keeping {}", LevelName,
                   spdlog::level::to_string_view(spdlog::get_level()));
    return;
  }
  spdlog::set_level(Level);
}
