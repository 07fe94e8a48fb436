#include "config.h"
#include "error/error.h"
#include "lib/log.h"
#include <cstdlib>
#include <string>
#include <thread>

namespace tether {
namespace {

auto ReadInteger(const char* variable, long min, long max) -> long {
	std::string value{std::getenv(variable)};
	char* end = nullptr;
	long result = std::strtol(value.c_str(), &end, 10);
	if (value.empty() || end == nullptr || *end != '\0' || result < min || result > max) {
		throw RuntimeTypeError{
			std::string{variable} + " must be an integer between " + std::to_string(min) +
			" and " + std::to_string(max) + ", got \"" + value + "\""
		};
	}
	return result;
}

} // anonymous namespace

auto Config::FromEnvironment() -> Config {
	Config config;
	if (std::getenv("TETHER_TIER") != nullptr) {
		config.tier = static_cast<Tier>(ReadInteger("TETHER_TIER", kTierBase, kTierMax));
	}
	if (std::getenv("TETHER_WORKER_THREADS") != nullptr) {
		config.worker_threads = static_cast<size_t>(ReadInteger("TETHER_WORKER_THREADS", 0, 1024));
	}
	if (const char* level = std::getenv("TETHER_LOG_LEVEL"); level != nullptr) {
		if (!ParseLogLevel(level, config.log_level)) {
			throw RuntimeTypeError{std::string{"TETHER_LOG_LEVEL is not a log level: \""} + level + "\""};
		}
	}
	return config;
}

auto Config::WorkerThreads() const -> size_t {
	if (worker_threads == 0) {
		size_t concurrency = std::thread::hardware_concurrency();
		return concurrency == 0 ? 1 : concurrency;
	}
	return worker_threads;
}

} // namespace tether
