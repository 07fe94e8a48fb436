#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tether {

// Shared "tether" logger, writing to stderr. Safe to call from any thread.
auto Log() -> spdlog::logger&;

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off". Returns false for
// anything else and leaves `level` untouched.
auto ParseLogLevel(const std::string& name, spdlog::level::level_enum& level) -> bool;

void SetLogLevel(spdlog::level::level_enum level);

} // namespace tether
