#pragma once
#include "context.h"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tether {

/**
 * Canonical conversions between native values and engine values.
 *
 * `ToEngine(cx, value)` accepts handles, bool, arithmetic types, strings, nullptr, optionals (empty
 * becomes null) and vectors of any of these.
 *
 * `FromEngine<Type>(cx, handle)` is the other direction. Conversions are strict: a value of the
 * wrong type fails with a TypeError rather than being coerced.
 */
template <class Type>
inline auto ToEngine(Context& /*cx*/, Handle<Type> value) -> Handle<JsValue> {
	return value;
}

inline auto ToEngine(Context& cx, bool value) -> Handle<JsValue> {
	return cx.Boolean(value);
}

template <class Type, std::enable_if_t<std::is_arithmetic<Type>::value && !std::is_same<Type, bool>::value, int> = 0>
inline auto ToEngine(Context& cx, Type value) -> Handle<JsValue> {
	return cx.Number(static_cast<double>(value));
}

inline auto ToEngine(Context& cx, const std::string& value) -> Handle<JsValue> {
	return cx.String(value);
}

inline auto ToEngine(Context& cx, const char* value) -> Handle<JsValue> {
	return cx.String(value);
}

inline auto ToEngine(Context& cx, std::nullptr_t /*value*/) -> Handle<JsValue> {
	return cx.Null();
}

template <class Type>
inline auto ToEngine(Context& cx, const std::optional<Type>& value) -> Handle<JsValue> {
	if (value) {
		return ToEngine(cx, *value);
	}
	return cx.Null();
}

template <class Type>
inline auto ToEngine(Context& cx, const std::vector<Type>& values) -> Handle<JsValue> {
	auto array = cx.Array(static_cast<uint32_t>(values.size()));
	for (uint32_t ii = 0; ii < values.size(); ++ii) {
		cx.Set(array, ii, ToEngine(cx, values[ii]));
	}
	return array;
}

// Helper
template <class Type>
struct HandleCastTag {};

template <class Type>
auto FromEngine(Context& cx, Handle<JsValue> value) -> Type {
	return HandleCastImpl(cx, value, HandleCastTag<Type>{});
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<bool> /*tag*/) -> bool {
	return cx.BooleanValue(cx.As<JsBoolean>(value));
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<double> /*tag*/) -> double {
	return cx.NumberValue(cx.As<JsNumber>(value));
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<int32_t> /*tag*/) -> int32_t {
	double number = HandleCastImpl(cx, value, HandleCastTag<double>{});
	if (std::trunc(number) != number ||
			number < std::numeric_limits<int32_t>::min() || number > std::numeric_limits<int32_t>::max()) {
		throw RuntimeTypeError{"Expected a 32-bit integer"};
	}
	return static_cast<int32_t>(number);
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<uint32_t> /*tag*/) -> uint32_t {
	double number = HandleCastImpl(cx, value, HandleCastTag<double>{});
	if (std::trunc(number) != number || number < 0 || number > std::numeric_limits<uint32_t>::max()) {
		throw RuntimeTypeError{"Expected a non-negative 32-bit integer"};
	}
	return static_cast<uint32_t>(number);
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<int64_t> /*tag*/) -> int64_t {
	if (cx.Is<JsBigInt>(value)) {
		bool lossless = true;
		int64_t result = cx.BigIntValue(value.Cast<JsBigInt>(), &lossless);
		if (!lossless) {
			throw RuntimeRangeError{"BigInt does not fit in 64 bits"};
		}
		return result;
	}
	double number = HandleCastImpl(cx, value, HandleCastTag<double>{});
	// 2^53, beyond which doubles stop representing every integer
	constexpr double kMaxSafe = 9007199254740992.0;
	if (std::trunc(number) != number || number < -kMaxSafe || number > kMaxSafe) {
		throw RuntimeTypeError{"Expected a safe integer"};
	}
	return static_cast<int64_t>(number);
}

inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<std::string> /*tag*/) -> std::string {
	return cx.StringValue(cx.As<JsString>(value));
}

template <class Type>
inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<std::optional<Type>> /*tag*/) -> std::optional<Type> {
	if (cx.Is<JsUndefined>(value) || cx.Is<JsNull>(value)) {
		return std::nullopt;
	}
	return FromEngine<Type>(cx, value);
}

template <class Type>
inline auto HandleCastImpl(Context& cx, Handle<JsValue> value, HandleCastTag<std::vector<Type>> /*tag*/) -> std::vector<Type> {
	auto array = cx.As<JsArray>(value);
	uint32_t length = cx.Length(array);
	std::vector<Type> result;
	result.reserve(length);
	for (uint32_t ii = 0; ii < length; ++ii) {
		result.push_back(FromEngine<Type>(cx, cx.Get(array, ii)));
	}
	return result;
}

} // namespace tether
