// Example addon showing synchronous calls, background tasks and channels

#include <api/tether.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace {

// Beyond this the result no longer fits in a signed 64-bit BigInt
constexpr uint32_t kMaxFibonacci = 92;
// Largest result below 2^53, which a number holds exactly
constexpr uint32_t kMaxExactFibonacci = 78;

auto Fibonacci(uint32_t n) -> uint64_t {
	if (n > kMaxFibonacci) {
		throw tether::RuntimeRangeError{"fibonacci(" + std::to_string(n) + ") does not fit in a 64-bit BigInt"};
	}
	uint64_t previous = 0;
	uint64_t current = 1;
	for (uint32_t ii = 0; ii < n; ++ii) {
		previous = std::exchange(current, previous + current);
	}
	return previous;
}

// Small results are numbers, larger ones BigInts
auto FibonacciResult(tether::Context& cx, uint32_t n, uint64_t value) -> tether::Handle<tether::JsValue> {
	if (n <= kMaxExactFibonacci) {
		return cx.Number(static_cast<double>(value));
	}
	return cx.BigInt(static_cast<int64_t>(value));
}

auto Sum(tether::FunctionContext& cx) -> tether::Handle<tether::JsValue> {
	auto left = tether::FromEngine<double>(cx, cx.Argument<tether::JsNumber>(0));
	auto right = tether::FromEngine<double>(cx, cx.Argument<tether::JsNumber>(1));
	return cx.Number(left + right);
}

// fibonacci(n) -> Promise<number | bigint>
auto FibonacciPromise(tether::FunctionContext& cx) -> tether::Handle<tether::JsValue> {
	auto n = tether::FromEngine<uint32_t>(cx, cx.Argument(0));
	return tether::Task::Promise(
		cx,
		[n]() { return Fibonacci(n); },
		[n](tether::TaskContext& cx, uint64_t value) { return FibonacciResult(cx, n, value); }
	);
}

// fibonacciCallback(n, (error, result) => {})
auto FibonacciCallback(tether::FunctionContext& cx) -> tether::Handle<tether::JsValue> {
	auto n = tether::FromEngine<uint32_t>(cx, cx.Argument(0));
	tether::Root<tether::JsFunction> callback{cx, cx.Argument<tether::JsFunction>(1)};
	tether::Task::Spawn(
		cx,
		[n]() { return Fibonacci(n); },
		[n, callback = std::move(callback)](tether::TaskContext& cx, tether::Outcome<uint64_t> result) mutable {
			auto fn = callback.Into(cx);
			callback.Drop(cx);
			if (result.IsOk()) {
				cx.Call(fn, cx.Undefined(), {cx.Null(), FibonacciResult(cx, n, result.Value())});
			} else {
				cx.Call(fn, cx.Undefined(), {tether::ErrorTranslator::Internalize(cx, result.Error())});
			}
		}
	);
	return cx.Undefined();
}

// ticker(count, (tick) => {}). A plain thread sends one closure per tick, the callback runs on the
// main thread.
auto Ticker(tether::FunctionContext& cx) -> tether::Handle<tether::JsValue> {
	auto count = tether::FromEngine<uint32_t>(cx, cx.Argument(0));
	auto callback = std::make_shared<tether::Root<tether::JsFunction>>(cx, cx.Argument<tether::JsFunction>(1));
	tether::Channel channel{cx};
	std::thread thread{[channel = std::move(channel), count, callback]() mutable {
		for (uint32_t tick = 0; tick < count; ++tick) {
			std::this_thread::sleep_for(std::chrono::milliseconds{10});
			bool sent = channel.TrySend([callback, tick](tether::TaskContext& cx) {
				cx.Call(callback->Into(cx), cx.Undefined(), {cx.Number(tick)});
			});
			if (!sent) {
				// The module was unloaded
				break;
			}
		}
	}};
	thread.detach();
	return cx.Undefined();
}

void Init(tether::ModuleContext& cx) {
	cx.ExportFunction("sum", Sum);
	cx.ExportFunction("fibonacci", FibonacciPromise);
	cx.ExportFunction("fibonacciCallback", FibonacciCallback);
	cx.ExportFunction("ticker", Ticker);
}

} // anonymous namespace

TETHER_MODULE(tether_example, Init)
