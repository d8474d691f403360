#include "platform.h"
#include "lib/logging.h"
#include <libplatform/libplatform.h>
#include <v8.h>
#include <memory>
#include <mutex>

namespace codejail {
namespace {

std::once_flag platform_once;
std::unique_ptr<v8::Platform> platform;

} // anonymous namespace

void Platform::Initialize() {
	std::call_once(platform_once, []() {
		platform = v8::platform::NewDefaultPlatform();
		v8::V8::InitializePlatform(platform.get());
		v8::V8::Initialize();
		GetLogger()->debug("v8 {} initialized", v8::V8::GetVersion());
	});
}

auto Platform::Get() -> v8::Platform* {
	Initialize();
	return platform.get();
}

void Platform::PumpMessageLoop(v8::Isolate* isolate) {
	while (v8::platform::PumpMessageLoop(Get(), isolate, v8::platform::MessageLoopBehavior::kDoNotWait)) {
	}
}

} // namespace codejail
