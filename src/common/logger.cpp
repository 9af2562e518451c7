#include "common/logger.hpp"

#include <atomic>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tierkv {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

std::atomic<spdlog::level::level_enum> g_level{spdlog::level::info};

// Serialises the get-or-create in make_component_logger().
std::mutex g_registry_mutex;

} // namespace

void init_default_logger(spdlog::level::level_enum level) {
    std::lock_guard lock(g_registry_mutex);
    g_level = level;

    auto logger = spdlog::get("tierkv");
    if (!logger) {
        logger = spdlog::stdout_color_mt("tierkv");
    }
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);

    // Applies to every registered logger, components included.
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> make_component_logger(const std::string& name) {
    return make_component_logger(name, g_level.load());
}

std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    std::lock_guard lock(g_registry_mutex);

    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace tierkv
