//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// logging/logger.hpp
//
// Client-side logging on top of spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace surreal {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// Process-wide logger shared by every connection. Console output goes to
// stderr so that query results printed on stdout stay machine-readable.
class Logger {
public:
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "warn");

    static void Shutdown();

    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    static bool IsInitialized() { return initialized_; }

    static void Flush();

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace surreal

// LOG_INFO("component", "message " + std::to_string(x))
#define LOG_TRACE(component, message) \
    do { \
        if (surreal::Logger::Get()->should_log(spdlog::level::trace)) \
            surreal::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (surreal::Logger::Get()->should_log(spdlog::level::debug)) \
            surreal::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (surreal::Logger::Get()->should_log(spdlog::level::info)) \
            surreal::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (surreal::Logger::Get()->should_log(spdlog::level::warn)) \
            surreal::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (surreal::Logger::Get()->should_log(spdlog::level::err)) \
            surreal::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

// SLOG_DEBUG("component", "sent {} bytes", n)
#define SLOG_TRACE(component, fmt, ...) \
    surreal::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define SLOG_DEBUG(component, fmt, ...) \
    surreal::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define SLOG_INFO(component, fmt, ...) \
    surreal::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define SLOG_WARN(component, fmt, ...) \
    surreal::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define SLOG_ERROR(component, fmt, ...) \
    surreal::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
