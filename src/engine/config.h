#pragma once
#include "tier.h"
#include <spdlog/common.h>
#include <cstddef>

namespace tether {

// Runtime configuration for one `Environment`
struct Config {
	// Requested capability tier. The active tier is this, capped by what the binding supports.
	Tier tier = TETHER_DEFAULT_TIER;
	// Worker pool size for tasks. 0 means one per hardware thread.
	size_t worker_threads = 0;
	spdlog::level::level_enum log_level = spdlog::level::warn;
	// Enables the Channel / Task / Deferred subsystem
#ifdef TETHER_TASKS
	bool tasks = true;
#else
	bool tasks = false;
#endif

	// Defaults, overridden by TETHER_TIER, TETHER_WORKER_THREADS and TETHER_LOG_LEVEL
	static auto FromEnvironment() -> Config;

	// Pool size after resolving `worker_threads == 0`
	auto WorkerThreads() const -> size_t;
};

} // namespace tether
