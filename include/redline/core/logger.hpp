#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace redline {

class Logger {
public:
    static void init(std::string_view name = "redline", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Level for a name accepted by `set_level`, or nullopt if unknown.
    static auto parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum>;

    /// Unknown names fall back to info.
    static void set_level(std::string_view level);
    static void flush();
};

} // namespace redline

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::redline::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::redline::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::redline::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::redline::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::redline::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::redline::Logger::get(), __VA_ARGS__)
