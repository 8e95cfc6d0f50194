#include "redline/core/logger.hpp"

#include <array>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace redline {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
}

void Logger::init(std::string_view name, std::string_view level) {
    // stdout carries command output; re-init replaces the registered logger.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    for (const auto& [name, value] : kLevels) {
        if (name == level) return value;
    }
    return std::nullopt;
}

void Logger::set_level(std::string_view level) {
    auto parsed = parse_level(level);
    get()->set_level(parsed.value_or(spdlog::level::info));
    if (!parsed) {
        g_logger->warn("Unknown log level '{}', using info", level);
    }
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace redline
