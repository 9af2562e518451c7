#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tierkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for code that doesn't belong to a
// specific component: CLI, early startup messages, tests) and set the level
// of every component logger, existing or future.
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger.
//   name  – component name embedded in every log line as [<name>]
//           ("engine", "persistence", "server", ...)
// The level is the one given to init_default_logger() (info by default).
std::shared_ptr<spdlog::logger> make_component_logger(const std::string& name);

// As above, with an explicit initial level.
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace tierkv
