#pragma once

// Logging for tilekeep using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-window logging (e.g., every discovery decision)
//   - DEBUG: Detailed debugging info (e.g., slot assignment, tracker events)
//   - INFO:  Normal operational messages (e.g., arrangement summary, config loaded)
//   - WARN:  Warning conditions (e.g., failed save, unparseable activity store)
//   - ERROR: Error conditions
//
// In Release builds: TRACE is compiled out; DEBUG is shown with --verbose
// In Debug builds: All levels are active
//
// Usage:
//   LOG_DEBUG("Skipping window {:#x}: tool window", window_id);
//   LOG_INFO("Arranged {} windows", count);

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tilekeep::log {

// Initialize logging - call once at startup
inline void init(bool verbose = false)
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("/tmp/tilekeep.log", true);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    auto logger = std::make_shared<spdlog::logger>("tilekeep", spdlog::sinks_init_list{ console_sink, file_sink });
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
}

// Shutdown logging - call at exit
inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace tilekeep::log

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
