// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

namespace guise {
namespace logger {

namespace {

spdlog::level::level_enum ToSpdlog(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return spdlog::level::trace;
    case LogLevel::kDebug:
      return spdlog::level::debug;
    case LogLevel::kInfo:
      return spdlog::level::info;
    case LogLevel::kWarn:
      return spdlog::level::warn;
    case LogLevel::kError:
      return spdlog::level::err;
    case LogLevel::kOff:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

constexpr const char* kLoggerName = "guise";

}  // namespace

bool Init(LogLevel level) {
  try {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
      logger = spdlog::stdout_color_mt(kLoggerName);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v");
      spdlog::set_default_logger(logger);
    }
    SetLevel(level);
    return true;
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << "\n";
  }
  return false;
}

void SetLevel(LogLevel level) { spdlog::set_level(ToSpdlog(level)); }

}  // namespace logger
}  // namespace guise
