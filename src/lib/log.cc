#include "log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tether {
namespace {

auto EnsureLogger() -> std::shared_ptr<spdlog::logger> {
	if (auto logger = spdlog::get("tether"); logger != nullptr) {
		return logger;
	}
	auto logger = spdlog::stderr_color_mt("tether");
	logger->set_level(spdlog::level::warn);
	return logger;
}

} // anonymous namespace

auto Log() -> spdlog::logger& {
	// spdlog's registry is locked, but the lookup is on hot-ish paths so the result is cached
	static std::shared_ptr<spdlog::logger> logger = EnsureLogger();
	return *logger;
}

auto ParseLogLevel(const std::string& name, spdlog::level::level_enum& level) -> bool {
	auto parsed = spdlog::level::from_str(name);
	// `from_str` maps unknown names to `off`
	if (parsed == spdlog::level::off && name != "off") {
		return false;
	}
	level = parsed;
	return true;
}

void SetLogLevel(spdlog::level::level_enum level) {
	Log().set_level(level);
}

} // namespace tether
