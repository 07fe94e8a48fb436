#pragma once
#include "../tether.h"
#include "../engine/v8_binding.h"

/**
 * Declares a Node.js addon. `init(tether::ModuleContext&)` runs once per module instance (one per
 * Node environment, so once per worker thread as well) and exports whatever the addon provides. The
 * Environment behind it is torn down by the host's environment cleanup hook.
 *
 *   void Init(tether::ModuleContext& cx) {
 *     cx.ExportFunction("hello", Hello);
 *   }
 *   TETHER_MODULE(my_addon, Init)
 */
#define TETHER_MODULE(name, init) \
	extern "C" void tether_register_##name( \
		v8::Local<v8::Object> exports, \
		v8::Local<v8::Value> /*module*/, \
		v8::Local<v8::Context> context, \
		void* /*priv*/ \
	) { \
		::tether::V8Binding::InitializeModule(exports, context, init); \
	} \
	NODE_MODULE_CONTEXT_AWARE(name, tether_register_##name) // NOLINT
