#pragma once
#include <v8-platform.h>

namespace codejail {

/**
 * Owns the process-wide v8 platform. v8 can only be initialized once per process so this is
 * started lazily by the first isolate and lives until exit.
 */
class Platform {
	public:
		static void Initialize();
		static auto Get() -> v8::Platform*;
		// Runs foreground tasks v8 has posted for `isolate` (finalization, wasm and so on)
		static void PumpMessageLoop(v8::Isolate* isolate);
};

} // namespace codejail
