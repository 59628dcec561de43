/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "util/log.hpp"

#include <iostream>

namespace {

LogLevel g_level = LogLevel::Info;

const char *level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void log_message(LogLevel level, std::string_view msg) {
    if (level < g_level) {
        return;
    }
    std::cerr << std::format("[{}] {}\n", level_tag(level), msg);
}
