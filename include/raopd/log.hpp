#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "raopd/options.hpp"

namespace raopd {

// A writer receives one complete line (no trailing newline).
using LogWriter = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Replace the stderr writer; an empty writer restores it.
void set_log_writer(LogWriter writer);

const char *log_level_str(LogLevel level);

void log_line(LogLevel level, std::string_view tag, std::string_view msg);

template <typename... Args>
void log_debug(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    if (!log_enabled(LogLevel::Debug)) return;
    log_line(LogLevel::Debug, tag, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    if (!log_enabled(LogLevel::Info)) return;
    log_line(LogLevel::Info, tag, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    if (!log_enabled(LogLevel::Warn)) return;
    log_line(LogLevel::Warn, tag, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    log_line(LogLevel::Error, tag, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace raopd
