#include <gtest/gtest.h>

#include "task/deferred.h"
#include "support/test_engine.h"
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

using namespace tether;
using PromiseState = test::TestEngine::PromiseState;

class DeferredTest : public test::EngineTest {
	protected:
		// Creates a promise and hands back its Deferred
		auto NewDeferred(RawValue& promise) -> Deferred {
			std::optional<Deferred> deferred;
			EXPECT_TRUE(Run([&](ModuleContext& cx) {
				auto pair = Deferred::New(cx);
				promise = cx.Unwrap(pair.second);
				deferred.emplace(std::move(pair.first));
			}));
			return std::move(*deferred);
		}

		auto Settled(RawValue promise) -> bool {
			return engine->RunLoopUntil([&]() { return engine->GetPromiseState(promise) != PromiseState::Pending; });
		}
};

TEST_F(DeferredTest, ResolveOnTheEngineThread) {
	RawValue promise = nullptr;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		auto pair = Deferred::New(cx);
		promise = cx.Unwrap(pair.second);
		EXPECT_TRUE(cx.Is<JsPromise>(pair.second));
		EXPECT_FALSE(pair.first.IsSettled());
		pair.first.Resolve(cx, cx.String("done"));
		EXPECT_TRUE(pair.first.IsSettled());
	}));
	EXPECT_EQ(engine->GetPromiseState(promise), PromiseState::Fulfilled);
	EXPECT_EQ(engine->StringValue(engine->GetPromiseResult(promise)), "done");
	EXPECT_EQ(engine->LiveReferences(), 0U);
}

TEST_F(DeferredTest, SettlingTwiceFails) {
	RawValue promise = nullptr;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		auto pair = Deferred::New(cx);
		promise = cx.Unwrap(pair.second);
		auto copy = pair.first;
		pair.first.Reject(cx, cx.Error("first"));
		try {
			copy.Resolve(cx, cx.Number(1));
			ADD_FAILURE() << "Expected DeferredAlreadySettledError";
		} catch (const DeferredAlreadySettledError& error) {
			EXPECT_EQ(error.Kind(), ErrorKind::DeferredAlreadySettled);
		}
		EXPECT_THROW(copy.SettleWith(cx, [&]() { return 2; }), DeferredAlreadySettledError);
	}));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Rejected);
	EXPECT_EQ(ErrorTranslator::FromEngine(*engine, engine->GetPromiseResult(promise)).Message(), "first");
}

TEST_F(DeferredTest, SettleFromAnotherThread) {
	RawValue promise = nullptr;
	auto deferred = NewDeferred(promise);
	std::thread worker{[deferred = std::move(deferred)]() mutable {
		deferred.Settle([](TaskContext& cx) { return cx.Number(99); });
	}};
	worker.join();
	ASSERT_TRUE(Settled(promise));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Fulfilled);
	EXPECT_DOUBLE_EQ(engine->NumberValue(engine->GetPromiseResult(promise)), 99);
}

TEST_F(DeferredTest, OnlyOneRacingSettleWins) {
	constexpr int kThreads = 2;
	RawValue promise = nullptr;
	auto deferred = NewDeferred(promise);
	std::atomic<int> winners{0};
	std::atomic<int> losers{0};
	std::atomic<int> winner{-1};
	std::vector<std::thread> threads;
	for (int ii = 0; ii < kThreads; ++ii) {
		threads.emplace_back([&, ii, copy = deferred]() mutable {
			try {
				copy.Settle([ii](TaskContext& cx) { return cx.Number(ii); });
				++winners;
				winner = ii;
			} catch (const DeferredAlreadySettledError&) {
				++losers;
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	EXPECT_EQ(winners.load(), 1);
	EXPECT_EQ(losers.load(), kThreads - 1);
	ASSERT_TRUE(Settled(promise));
	EXPECT_DOUBLE_EQ(engine->NumberValue(engine->GetPromiseResult(promise)), winner.load());
}

TEST_F(DeferredTest, SettleOnAClosedChannelCanBeRetried) {
	RawValue promise = nullptr;
	auto deferred = NewDeferred(promise);
	std::optional<Channel> closed;
	ASSERT_TRUE(Run([&](ModuleContext& cx) { closed.emplace(cx); }));
	// A moved-from channel has no receiver
	Channel open{std::move(*closed)};
	ASSERT_TRUE(closed->IsClosed());
	EXPECT_THROW(deferred.Settle(*closed, [](TaskContext& cx) { return cx.Number(1); }), ChannelClosedError);
	EXPECT_FALSE(deferred.IsSettled());
	deferred.Settle(open, [](TaskContext& cx) { return cx.Number(2); });
	EXPECT_TRUE(deferred.IsSettled());
	ASSERT_TRUE(Settled(promise));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Fulfilled);
	EXPECT_DOUBLE_EQ(engine->NumberValue(engine->GetPromiseResult(promise)), 2);
}

TEST_F(DeferredTest, ThrowingSettlementRejects) {
	RawValue promise = nullptr;
	auto deferred = NewDeferred(promise);
	deferred.Settle([](TaskContext& /*cx*/) -> Handle<JsValue> { throw RuntimeTypeError{"could not build the value"}; });
	ASSERT_TRUE(Settled(promise));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Rejected);
	auto error = ErrorTranslator::FromEngine(*engine, engine->GetPromiseResult(promise));
	EXPECT_EQ(error.Type(), ErrorType::TypeError);
	EXPECT_EQ(error.Message(), "could not build the value");
}

TEST_F(DeferredTest, SettleWithVoidResolvesUndefined) {
	RawValue promise = nullptr;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		auto pair = Deferred::New(cx);
		promise = cx.Unwrap(pair.second);
		pair.first.SettleWith(cx, []() {});
	}));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Fulfilled);
	EXPECT_EQ(engine->TypeOf(engine->GetPromiseResult(promise)), ValueType::Undefined);
}

TEST_F(DeferredTest, DroppedDeferredRejects) {
	RawValue promise = nullptr;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		promise = cx.Unwrap(Deferred::New(cx).second);
	}));
	ASSERT_TRUE(Settled(promise));
	ASSERT_EQ(engine->GetPromiseState(promise), PromiseState::Rejected);
	EXPECT_EQ(
		ErrorTranslator::FromEngine(*engine, engine->GetPromiseResult(promise)).Message(),
		"Deferred was dropped without being settled"
	);
	EXPECT_EQ(engine->LiveReferences(), 0U);
}

TEST_F(DeferredTest, DroppedOnAnotherThread) {
	RawValue promise = nullptr;
	std::optional<Deferred> deferred{NewDeferred(promise)};
	std::thread worker{[&]() { deferred.reset(); }};
	worker.join();
	ASSERT_TRUE(Settled(promise));
	EXPECT_EQ(engine->GetPromiseState(promise), PromiseState::Rejected);
}

TEST_F(DeferredTest, PendingDeferredHoldsTheLoopOpen) {
	RawValue promise = nullptr;
	auto deferred = NewDeferred(promise);
	EXPECT_TRUE(engine->LoopAlive());
	ASSERT_TRUE(Run([&](ModuleContext& cx) { deferred.Resolve(cx, cx.Null()); }));
	EXPECT_FALSE(engine->LoopAlive());
}

TEST(DeferredConfigTest, PromisesRequireTheirTier) {
	auto binding = std::make_unique<test::TestEngine>();
	auto* engine = binding.get();
	Config config;
	config.tier = kTierPromise - 1;
	config.tasks = false;
	Environment env{std::move(binding), config};
	RawValue exports = engine->NewObject();
	EXPECT_FALSE(env.InitModule(exports, [](ModuleContext& cx) { Deferred::New(cx); }));
	auto error = ErrorTranslator::FromEngine(*engine, engine->TakeException());
	EXPECT_EQ(error.Kind(), ErrorKind::UnsupportedCapability);
}
