#include <gtest/gtest.h>

#include "engine/config.h"
#include "engine/environment.h"
#include "error/error.h"
#include "lib/log.h"
#include "support/test_engine.h"
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

using namespace tether;

namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedVariable {
	public:
		ScopedVariable(const char* name, const char* value) : name{name} {
			if (const char* previous = std::getenv(name); previous != nullptr) {
				this->previous = previous;
			}
			setenv(name, value, 1);
		}
		ScopedVariable(const ScopedVariable&) = delete;
		~ScopedVariable() {
			if (previous) {
				setenv(name, previous->c_str(), 1);
			} else {
				unsetenv(name);
			}
		}
		auto operator=(const ScopedVariable&) = delete;

	private:
		const char* name;
		std::optional<std::string> previous;
};

auto MakeEnvironment(Config config, Tier max_tier = kTierMax) -> std::unique_ptr<Environment> {
	return std::make_unique<Environment>(std::make_unique<test::TestEngine>(max_tier), std::move(config));
}

} // anonymous namespace

TEST(ConfigTest, Defaults) {
	unsetenv("TETHER_TIER");
	unsetenv("TETHER_WORKER_THREADS");
	unsetenv("TETHER_LOG_LEVEL");
	auto config = Config::FromEnvironment();
	EXPECT_EQ(config.tier, TETHER_DEFAULT_TIER);
	EXPECT_EQ(config.worker_threads, 0U);
	EXPECT_EQ(config.log_level, spdlog::level::warn);
	EXPECT_GE(config.WorkerThreads(), 1U);
}

TEST(ConfigTest, ReadsTheEnvironment) {
	ScopedVariable tier{"TETHER_TIER", "5"};
	ScopedVariable threads{"TETHER_WORKER_THREADS", "3"};
	ScopedVariable level{"TETHER_LOG_LEVEL", "debug"};
	auto config = Config::FromEnvironment();
	EXPECT_EQ(config.tier, 5);
	EXPECT_EQ(config.WorkerThreads(), 3U);
	EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST(ConfigTest, RejectsMalformedValues) {
	{
		ScopedVariable tier{"TETHER_TIER", "high"};
		EXPECT_THROW(Config::FromEnvironment(), RuntimeTypeError);
	}
	{
		ScopedVariable tier{"TETHER_TIER", "0"};
		EXPECT_THROW(Config::FromEnvironment(), RuntimeTypeError);
	}
	{
		ScopedVariable tier{"TETHER_TIER", "4x"};
		EXPECT_THROW(Config::FromEnvironment(), RuntimeTypeError);
	}
	{
		ScopedVariable threads{"TETHER_WORKER_THREADS", "-1"};
		EXPECT_THROW(Config::FromEnvironment(), RuntimeTypeError);
	}
	{
		ScopedVariable level{"TETHER_LOG_LEVEL", "loud"};
		try {
			Config::FromEnvironment();
			ADD_FAILURE() << "Expected a TypeError";
		} catch (const RuntimeTypeError& error) {
			EXPECT_NE(error.GetMessage().find("loud"), std::string::npos);
		}
	}
}

TEST(ConfigTest, LogLevels) {
	auto level = spdlog::level::info;
	EXPECT_TRUE(ParseLogLevel("trace", level));
	EXPECT_EQ(level, spdlog::level::trace);
	EXPECT_TRUE(ParseLogLevel("off", level));
	EXPECT_EQ(level, spdlog::level::off);
	EXPECT_FALSE(ParseLogLevel("verbose", level));
	EXPECT_EQ(level, spdlog::level::off);
}

TEST(ConfigTest, RequireTier) {
	EXPECT_NO_THROW(RequireTier(kTierPromise, kTierPromise, "Promise"));
	try {
		RequireTier(kTierBase, kTierBigInt, "BigInt");
		ADD_FAILURE() << "Expected UnsupportedCapabilityError";
	} catch (const UnsupportedCapabilityError& error) {
		EXPECT_EQ(error.GetMessage(), "BigInt requires capability tier 6 but the active tier is 1");
	}
}

TEST(EnvironmentTest, ActiveTierIsTheConfiguredTier) {
	Config config;
	config.tier = 5;
	config.worker_threads = 1;
	auto env = MakeEnvironment(config);
	EXPECT_EQ(env->ActiveTier(), 5);
	EXPECT_FALSE(env->IsDisposed());
	env->Dispose();
	EXPECT_TRUE(env->IsDisposed());
}

TEST(EnvironmentTest, TierAboveTheEngineMaximum) {
	Config config;
	config.tier = kTierMax;
	EXPECT_THROW(MakeEnvironment(config, 5), UnsupportedCapabilityError);
}

TEST(EnvironmentTest, TierBelowTheBase) {
	Config config;
	config.tier = 0;
	EXPECT_THROW(MakeEnvironment(config), RuntimeRangeError);
}

TEST(EnvironmentTest, TasksNeedTheThreadsafeTier) {
	Config config;
	config.tier = kTierThreadsafe - 1;
	config.tasks = true;
	EXPECT_THROW(MakeEnvironment(config), UnsupportedCapabilityError);
	config.tasks = false;
	EXPECT_NO_THROW(MakeEnvironment(config));
}

TEST(EnvironmentTest, DisposedEnvironmentRefusesEntry) {
	auto binding = std::make_unique<test::TestEngine>();
	auto* engine = binding.get();
	Config config;
	config.worker_threads = 1;
	Environment env{std::move(binding), config};
	env.Dispose();
	bool ran = false;
	EXPECT_FALSE(env.InitModule(engine->NewObject(), [&](ModuleContext& /*cx*/) { ran = true; }));
	EXPECT_FALSE(ran);
	EXPECT_TRUE(engine->IsExceptionPending());
	engine->TakeException();
}
