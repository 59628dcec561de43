/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <format>
#include <string_view>
#include <utility>

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();

void log_message(LogLevel level, std::string_view msg);

template <typename... Args> void log_debug(std::format_string<Args...> fmt, Args &&...args) {
    if (log_level() <= LogLevel::Debug) {
        log_message(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void log_info(std::format_string<Args...> fmt, Args &&...args) {
    if (log_level() <= LogLevel::Info) {
        log_message(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void log_warn(std::format_string<Args...> fmt, Args &&...args) {
    if (log_level() <= LogLevel::Warn) {
        log_message(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void log_error(std::format_string<Args...> fmt, Args &&...args) {
    log_message(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
}
