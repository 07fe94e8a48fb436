#pragma once
#include "engine/binding.h"
#include <cstdint>
#include <type_traits>

namespace tether {

using ScopeId = uint64_t;

/**
 * Phantom tags for `Handle<T>`. Each tag knows how to recognize its own values so that
 * `Context::As<T>` can check a downcast. Derived tags are implicitly convertible to their bases.
 */
struct JsValue {
	static constexpr auto Name = "value";
	static auto Is(EngineBinding& /*binding*/, RawValue /*value*/) -> bool { return true; }
};

struct JsUndefined : JsValue {
	static constexpr auto Name = "undefined";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::Undefined;
	}
};

struct JsNull : JsValue {
	static constexpr auto Name = "null";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::Null;
	}
};

struct JsBoolean : JsValue {
	static constexpr auto Name = "boolean";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::Boolean;
	}
};

struct JsNumber : JsValue {
	static constexpr auto Name = "number";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::Number;
	}
};

struct JsString : JsValue {
	static constexpr auto Name = "string";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::String;
	}
};

struct JsBigInt : JsValue {
	static constexpr auto Name = "bigint";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::BigInt;
	}
};

struct JsObject : JsValue {
	static constexpr auto Name = "object";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		auto type = binding.TypeOf(value);
		return type == ValueType::Object || type == ValueType::Function;
	}
};

struct JsFunction : JsObject {
	static constexpr auto Name = "function";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.TypeOf(value) == ValueType::Function;
	}
};

struct JsArray : JsObject {
	static constexpr auto Name = "array";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.IsArray(value);
	}
};

struct JsError : JsObject {
	static constexpr auto Name = "error";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.IsError(value);
	}
};

struct JsPromise : JsObject {
	static constexpr auto Name = "promise";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		return binding.IsPromise(value);
	}
};

// Address identifying the native type stored in a `JsBox<Type>`
template <class Type>
auto BoxTag() -> const void* {
	static const char tag{};
	return &tag;
}

template <class Type>
struct JsBox : JsValue {
	static constexpr auto Name = "box";
	static auto Is(EngineBinding& binding, RawValue value) -> bool {
		if (binding.TypeOf(value) != ValueType::External) {
			return false;
		}
		auto* entry = binding.ExternalValue(value);
		return entry != nullptr && entry->Tag() == BoxTag<Type>();
	}
};

/**
 * A scope-bound reference to an engine value: the id of the scope that rooted it plus an index
 * into that scope's arena. Handles are trivially copyable and own nothing. Every dereference goes
 * through `ScopeStack::Resolve`, so a handle whose scope was closed fails with
 * `HandleEscapedScopeError` instead of reading a stale slot.
 */
template <class Type>
class Handle {
	public:
		Handle() = default;
		Handle(ScopeId scope, uint32_t slot) : scope{scope}, slot{slot} {}

		template <class Other, std::enable_if_t<std::is_base_of<Type, Other>::value, int> = 0>
		Handle(Handle<Other> other) : scope{other.Scope()}, slot{other.Slot()} {} // NOLINT(hicpp-explicit-conversions)

		auto IsEmpty() const -> bool { return scope == 0; }
		auto Scope() const -> ScopeId { return scope; }
		auto Slot() const -> uint32_t { return slot; }

		// Unchecked reinterpretation. Use `Context::As` or `Context::Is` for a checked one.
		template <class Other>
		auto Cast() const -> Handle<Other> {
			return {scope, slot};
		}

	private:
		ScopeId scope = 0;
		uint32_t slot = 0;
};

template <class Type>
struct IsHandle : std::false_type {};
template <class Type>
struct IsHandle<Handle<Type>> : std::true_type {};

} // namespace tether
