/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace romc::log {
enum class Level {
    Info,
    Warn,
    Error,
};

// printf-style line to stdout (Info) or stderr (Warn, Error). Lines from concurrent callers
// are not interleaved.
void write(Level level, const char* fmt, ...);
void vwrite(Level level, const char* fmt, va_list args);
}  // namespace romc::log

#define ROMC_LOG_INFO(fmt, ...) ::romc::log::write(::romc::log::Level::Info, fmt, ##__VA_ARGS__)
#define ROMC_LOG_WARN(fmt, ...) ::romc::log::write(::romc::log::Level::Warn, fmt, ##__VA_ARGS__)
#define ROMC_LOG_ERROR(fmt, ...) ::romc::log::write(::romc::log::Level::Error, fmt, ##__VA_ARGS__)
