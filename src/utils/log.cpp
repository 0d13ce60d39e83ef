#include "raopd/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>

namespace raopd {

namespace {
std::mutex g_print_mtx;
std::atomic<LogLevel> g_level{LogLevel::Info};
LogWriter g_writer; // guarded by g_print_mtx
} // namespace

void set_log_level(const LogLevel level)
{
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level()
{
    return g_level.load(std::memory_order_relaxed);
}

bool log_enabled(const LogLevel level)
{
    return static_cast<int>(level) >= static_cast<int>(log_level());
}

void set_log_writer(LogWriter writer)
{
    std::scoped_lock lk(g_print_mtx);
    g_writer = std::move(writer);
}

const char *log_level_str(const LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void log_line(const LogLevel level, std::string_view tag, std::string_view msg)
{
    std::scoped_lock lk(g_print_mtx);
    if (g_writer)
    {
        g_writer(level, std::format("[{}] {}", tag, msg));
        return;
    }
    std::println(stderr, "{:<5} [{}] {}", log_level_str(level), tag, msg);
}

} // namespace raopd
