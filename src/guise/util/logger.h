// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_UTIL_LOGGER_H_
#define GUISE_UTIL_LOGGER_H_

#include "guise/config.h"

namespace guise {
namespace logger {

// Installs a colour stdout logger named "guise" as the spdlog default.
// Safe to call more than once; later calls only change the level.
bool Init(LogLevel level);

void SetLevel(LogLevel level);

}  // namespace logger
}  // namespace guise

#endif  // GUISE_UTIL_LOGGER_H_
