#include <gtest/gtest.h>

#include "channel/channel.h"
#include "context/context.h"
#include "support/test_engine.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace tether;
using namespace std::chrono_literals;

class ChannelTest : public test::EngineTest {
	protected:
		auto MakeChannel() -> Channel {
			std::optional<Channel> channel;
			EXPECT_TRUE(Run([&](ModuleContext& cx) { channel.emplace(cx); }));
			return std::move(*channel);
		}
};

TEST_F(ChannelTest, ClosuresRunOnTheEngineThread) {
	auto channel = MakeChannel();
	std::thread::id ran_on;
	bool ran = false;
	std::thread sender{[&]() {
		channel.Send([&](TaskContext& cx) {
			ran_on = std::this_thread::get_id();
			EXPECT_DOUBLE_EQ(cx.NumberValue(cx.Number(1)), 1);
			ran = true;
		});
	}};
	sender.join();
	ASSERT_TRUE(engine->RunLoopUntil([&]() { return ran; }));
	EXPECT_EQ(ran_on, std::this_thread::get_id());
	EXPECT_EQ(engine->OpenCallbackMarkers(), 0U);
}

TEST_F(ChannelTest, ManySendersLoseNothing) {
	constexpr int kThreads = 4;
	constexpr int kSends = 1000;
	auto channel = MakeChannel();
	int received = 0;
	std::map<int, std::vector<int>> sequences;
	std::vector<std::thread> threads;
	for (int ii = 0; ii < kThreads; ++ii) {
		threads.emplace_back([&, ii, sender = channel]() mutable {
			for (int jj = 0; jj < kSends; ++jj) {
				sender.Send([&, ii, jj](TaskContext& /*cx*/) {
					++received;
					sequences[ii].push_back(jj);
				});
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	EXPECT_EQ(channel.Pending(), static_cast<size_t>(kThreads * kSends));
	ASSERT_TRUE(engine->RunLoopUntil([&]() { return received == kThreads * kSends; }));
	// The queue is empty, another turn delivers nothing
	engine->RunLoopOnce();
	EXPECT_EQ(received, kThreads * kSends);
	EXPECT_EQ(channel.Pending(), 0U);
	ASSERT_EQ(sequences.size(), static_cast<size_t>(kThreads));
	for (auto& entry : sequences) {
		ASSERT_EQ(entry.second.size(), static_cast<size_t>(kSends));
		for (int jj = 0; jj < kSends; ++jj) {
			ASSERT_EQ(entry.second[jj], jj) << "sender " << entry.first;
		}
	}
}

TEST_F(ChannelTest, UncaughtClosureExceptionsReachTheHost) {
	auto channel = MakeChannel();
	bool second = false;
	channel.Send([](TaskContext& cx) {
		throw cx.ThrowError("from a closure");
	});
	channel.Send([](TaskContext& /*cx*/) {
		throw RuntimeTypeError{"native failure"};
	});
	channel.Send([&](TaskContext& /*cx*/) { second = true; });
	ASSERT_TRUE(engine->RunLoopUntil([&]() { return second; }));
	ASSERT_EQ(engine->Uncaught().size(), 2U);
	EXPECT_EQ(ErrorTranslator::FromEngine(*engine, engine->Uncaught()[0]).Message(), "from a closure");
	auto native = ErrorTranslator::FromEngine(*engine, engine->Uncaught()[1]);
	EXPECT_EQ(native.Type(), ErrorType::TypeError);
	EXPECT_EQ(native.Message(), "native failure");
}

TEST_F(ChannelTest, SendingToAClosedChannel) {
	auto channel = MakeChannel();
	env->Dispose();
	EXPECT_TRUE(channel.IsClosed());
	EXPECT_FALSE(channel.TrySend([](TaskContext& /*cx*/) {}));
	try {
		channel.Send([](TaskContext& /*cx*/) {});
		ADD_FAILURE() << "Expected ChannelClosedError";
	} catch (const ChannelClosedError& error) {
		EXPECT_EQ(error.Kind(), ErrorKind::ChannelClosed);
	}
}

TEST_F(ChannelTest, ClosingDropsQueuedClosures) {
	struct Tracker {
		explicit Tracker(std::atomic<int>* dropped) : dropped{dropped} {}
		Tracker(Tracker&& that) noexcept : dropped{std::exchange(that.dropped, nullptr)} {}
		Tracker(const Tracker&) = delete;
		~Tracker() {
			if (dropped != nullptr) {
				++*dropped;
			}
		}
		auto operator=(const Tracker&) = delete;
		std::atomic<int>* dropped;
	};

	auto channel = MakeChannel();
	std::atomic<int> dropped{0};
	bool ran = false;
	channel.Send([&, tracker = Tracker{&dropped}](TaskContext& /*cx*/) { ran = true; });
	env->Dispose();
	EXPECT_FALSE(ran);
	EXPECT_EQ(dropped.load(), 1);
}

TEST_F(ChannelTest, LastSenderClosesAfterDraining) {
	std::optional<Channel> channel{MakeChannel()};
	bool ran = false;
	channel->Send([&](TaskContext& /*cx*/) { ran = true; });
	channel.reset();
	ASSERT_TRUE(engine->RunLoopUntil([&]() { return ran; }));
	// The closed handle goes away on the next turn
	engine->RunLoopOnce();
	EXPECT_FALSE(engine->LoopAlive());
}

TEST_F(ChannelTest, ReferencesKeepTheLoopAlive) {
	auto channel = MakeChannel();
	EXPECT_TRUE(channel.HasRef());
	EXPECT_TRUE(engine->LoopAlive());

	ASSERT_TRUE(Run([&](ModuleContext& cx) { channel.Unreference(cx); }));
	EXPECT_FALSE(channel.HasRef());
	EXPECT_FALSE(engine->LoopAlive());

	{
		// Copies inherit the reference
		ASSERT_TRUE(Run([&](ModuleContext& cx) { channel.Reference(cx); }));
		Channel copy{channel};
		EXPECT_TRUE(copy.HasRef());
		ASSERT_TRUE(Run([&](ModuleContext& cx) { channel.Unreference(cx); }));
		EXPECT_TRUE(engine->LoopAlive());
	}
	EXPECT_FALSE(engine->LoopAlive());
}

TEST_F(ChannelTest, ReferencingRequiresTheEngineThread) {
	auto channel = MakeChannel();
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		bool denied = false;
		std::thread other{[&]() {
			try {
				channel.Unreference(cx);
			} catch (const ContextReentrancyError&) {
				denied = true;
			}
		}};
		other.join();
		EXPECT_TRUE(denied);
	}));
	EXPECT_TRUE(channel.HasRef());
}

TEST_F(ChannelTest, SendAndWait) {
	auto channel = MakeChannel();
	std::atomic<bool> finished{false};
	double result = 0;
	std::optional<ExternalError> failure;
	std::thread sender{[&]() {
		channel.SendAndWait([&](TaskContext& cx) {
			result = cx.NumberValue(cx.Number(3));
		});
		try {
			channel.SendAndWait([](TaskContext& /*cx*/) {
				throw RuntimeRangeError{"rejected by the engine thread"};
			});
		} catch (const RuntimeExternalError& error) {
			failure = error.GetError();
		}
		finished = true;
	}};
	bool done = engine->RunLoopUntil([&]() { return finished.load(); });
	sender.join();
	ASSERT_TRUE(done);
	EXPECT_DOUBLE_EQ(result, 3);
	ASSERT_TRUE(failure);
	EXPECT_EQ(failure->Type(), ErrorType::RangeError);
	EXPECT_EQ(failure->Message(), "rejected by the engine thread");
}

TEST_F(ChannelTest, SendAndWaitTimesOut) {
	auto channel = MakeChannel();
	bool ran = false;
	bool timed_out = false;
	std::thread sender{[&]() {
		try {
			channel.SendAndWait([&](TaskContext& /*cx*/) { ran = true; }, 20ms);
		} catch (const TimeoutError&) {
			timed_out = true;
		}
	}};
	// Nobody pumps the loop until the sender gives up
	sender.join();
	EXPECT_TRUE(timed_out);
	EXPECT_FALSE(ran);
	// It still runs eventually
	ASSERT_TRUE(engine->RunLoopUntil([&]() { return ran; }));
}

TEST_F(ChannelTest, SendAndWaitOnTheEngineThreadIsDenied) {
	auto channel = MakeChannel();
	EXPECT_THROW(channel.SendAndWait([](TaskContext& /*cx*/) {}), ContextReentrancyError);
}

TEST_F(ChannelTest, SendAndWaitLearnsAboutClosing) {
	auto channel = MakeChannel();
	std::atomic<bool> sent{false};
	bool closed = false;
	std::thread sender{[&]() {
		try {
			channel.SendAndWait([&](TaskContext& /*cx*/) {
				sent = true;
			});
		} catch (const ChannelClosedError&) {
			closed = true;
		}
	}};
	// Give the closure time to be queued, then close without running it
	std::this_thread::sleep_for(20ms);
	env->Dispose();
	sender.join();
	EXPECT_TRUE(closed);
	EXPECT_FALSE(sent);
}

TEST(ChannelConfigTest, ChannelsRequireTheTaskSubsystem) {
	auto binding = std::make_unique<test::TestEngine>();
	auto* engine = binding.get();
	Config config;
	config.tasks = false;
	Environment env{std::move(binding), config};
	RawValue exports = engine->NewObject();
	EXPECT_FALSE(env.InitModule(exports, [](ModuleContext& cx) { Channel channel{cx}; }));
	auto error = ErrorTranslator::FromEngine(*engine, engine->TakeException());
	EXPECT_EQ(error.Kind(), ErrorKind::UnsupportedCapability);
}
