/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"

#include <cstdio>
#include <mutex>

namespace romc::log {
static std::mutex g_write_mutex;

static const char* prefix_for(Level level) {
    switch (level) {
        case Level::Warn:
            return "[WARN] ";
        case Level::Error:
            return "[ERROR] ";
        case Level::Info:
            break;
    }
    return "";
}

void vwrite(Level level, const char* fmt, va_list args) {
    FILE* out = level == Level::Info ? stdout : stderr;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fputs(prefix_for(level), out);
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

void write(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(level, fmt, args);
    va_end(args);
}
}  // namespace romc::log
