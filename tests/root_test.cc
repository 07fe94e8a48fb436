#include <gtest/gtest.h>

#include "context/context.h"
#include "context/instance_local.h"
#include "scope/root.h"
#include "support/test_engine.h"
#include <optional>
#include <string>
#include <thread>

using namespace tether;

class RootTest : public test::EngineTest {};

TEST_F(RootTest, OutlivesTheScopeItCameFrom) {
	std::optional<Root<JsString>> root;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		root.emplace(cx, cx.String("kept"));
	}));
	EXPECT_EQ(engine->LiveReferences(), 1U);
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		EXPECT_EQ(cx.StringValue(root->Into(cx)), "kept");
		root->Drop(cx);
		EXPECT_TRUE(root->IsEmpty());
		EXPECT_THROW(root->Into(cx), RuntimeGenericError);
		// Dropping twice is harmless
		root->Drop(cx);
	}));
	EXPECT_EQ(engine->LiveReferences(), 0U);
}

TEST_F(RootTest, ClonesAreIndependent) {
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		Root<JsObject> root{cx, cx.Object()};
		auto clone = root.Clone(cx);
		EXPECT_EQ(engine->LiveReferences(), 2U);
		root.Drop(cx);
		EXPECT_TRUE(cx.StrictEquals(clone.Into(cx), clone.Into(cx)));
		clone.Drop(cx);
		EXPECT_EQ(engine->LiveReferences(), 0U);
	}));
}

TEST_F(RootTest, ReleasedAtTheNextEntryWhenDroppedWithoutAContext) {
	std::optional<Root<JsValue>> root;
	ASSERT_TRUE(Run([&](ModuleContext& cx) { root.emplace(cx, cx.Number(1)); }));
	root.reset();
	EXPECT_EQ(engine->LiveReferences(), 1U);
	ASSERT_TRUE(Run([](ModuleContext& /*cx*/) {}));
	EXPECT_EQ(engine->LiveReferences(), 0U);
}

TEST_F(RootTest, DroppedOnAnotherThread) {
	std::optional<Root<JsValue>> root;
	ASSERT_TRUE(Run([&](ModuleContext& cx) { root.emplace(cx, cx.Object()); }));
	std::thread other{[&]() { root.reset(); }};
	other.join();
	ASSERT_TRUE(Run([](ModuleContext& /*cx*/) {}));
	EXPECT_EQ(engine->LiveReferences(), 0U);
}

TEST_F(RootTest, DereferencingRequiresTheEngineThread) {
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		Root<JsValue> root{cx, cx.Null()};
		bool denied = false;
		std::thread other{[&]() {
			try {
				root.Into(cx);
			} catch (const ContextReentrancyError&) {
				denied = true;
			}
		}};
		other.join();
		EXPECT_TRUE(denied);
		root.Drop(cx);
	}));
}

TEST_F(RootTest, OutlivingTheEnvironmentIsHarmless) {
	std::optional<Root<JsValue>> root;
	ASSERT_TRUE(Run([&](ModuleContext& cx) { root.emplace(cx, cx.Object()); }));
	env.reset();
	root.reset();
}

namespace {

struct Counted {
	explicit Counted(int value, int* destroyed = nullptr) : value{value}, destroyed{destroyed} {}
	Counted(Counted&& that) noexcept : value{that.value}, destroyed{std::exchange(that.destroyed, nullptr)} {}
	Counted(const Counted&) = delete;
	~Counted() {
		if (destroyed != nullptr) {
			++*destroyed;
		}
	}
	auto operator=(const Counted&) = delete;

	int value;
	int* destroyed;
};

InstanceLocal<Counted> counter_local;
InstanceLocal<std::string> name_local;

} // anonymous namespace

class InstanceLocalTest : public test::EngineTest {};

TEST_F(InstanceLocalTest, InitializesOncePerEnvironment) {
	int calls = 0;
	auto init = [&](Context& /*cx*/) {
		++calls;
		return Counted{calls};
	};
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		EXPECT_EQ(counter_local.Get(cx), nullptr);
		EXPECT_EQ(counter_local.GetOrInitWith(cx, init).value, 1);
		EXPECT_EQ(counter_local.GetOrInitWith(cx, init).value, 1);
	}));
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		ASSERT_NE(counter_local.Get(cx), nullptr);
		EXPECT_EQ(counter_local.Get(cx)->value, 1);
	}));
	EXPECT_EQ(calls, 1);

	// A second instance of the module sees its own value
	Start(MakeConfig());
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		EXPECT_EQ(counter_local.Get(cx), nullptr);
		EXPECT_EQ(counter_local.GetOrInitWith(cx, init).value, 2);
	}));
}

TEST_F(InstanceLocalTest, ValuesAreDestroyedWithTheEnvironment) {
	int destroyed = 0;
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		counter_local.GetOrInit(cx, Counted{5, &destroyed});
		name_local.GetOrInitDefault(cx) = "tether";
	}));
	EXPECT_EQ(destroyed, 0);
	env->Dispose();
	EXPECT_EQ(destroyed, 1);
}

TEST_F(InstanceLocalTest, ReentrantInitializationIsDenied) {
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		EXPECT_THROW(
			name_local.GetOrInitWith(cx, [&](Context& cx) {
				return name_local.GetOrInitDefault(cx) + "!";
			}),
			ContextReentrancyError
		);
		// A failed initializer leaves the slot empty
		EXPECT_EQ(name_local.Get(cx), nullptr);
		EXPECT_EQ(name_local.GetOrInit(cx, "second"), "second");
	}));
}

TEST_F(InstanceLocalTest, FallibleInitialization) {
	ASSERT_TRUE(Run([&](ModuleContext& cx) {
		auto* missing = name_local.GetOrTryInit(cx, [](Context& /*cx*/) -> std::optional<std::string> {
			return std::nullopt;
		});
		EXPECT_EQ(missing, nullptr);
		auto* found = name_local.GetOrTryInit(cx, [](Context& /*cx*/) -> std::optional<std::string> {
			return "found";
		});
		ASSERT_NE(found, nullptr);
		EXPECT_EQ(*found, "found");
		EXPECT_EQ(name_local.Get(cx), found);
	}));
}
