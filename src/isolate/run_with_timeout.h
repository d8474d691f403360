#pragma once
#include "environment.h"
#include "generic/error.h"
#include "lib/timer.h"
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>

namespace codejail {

/**
 * Run some v8 thing with a timeout. Also throws error if memory limit is hit. `fn` must return a
 * `v8::MaybeLocal<v8::Value>`; an empty result means a JS exception is pending and `RuntimeError`
 * is thrown. A `timeout_ms` of 0 means no timeout. If `fn` throws, the memory limit and timeout
 * checks still take precedence over its exception.
 */
template <typename F>
auto RunWithTimeout(uint32_t timeout_ms, F&& fn) -> v8::Local<v8::Value> {
	IsolateEnvironment& isolate = *IsolateEnvironment::GetCurrent();
	struct State {
		std::mutex mutex;
		bool did_finish = false;
		bool did_terminate = false;
	} state;
	v8::MaybeLocal<v8::Value> result;
	std::exception_ptr error;
	{
		std::unique_ptr<timer_t> timer_ptr;
		if (timeout_ms != 0) {
			timer_ptr = std::make_unique<timer_t>(timeout_ms, [&]() {
				std::lock_guard<std::mutex> lock{state.mutex};
				if (!state.did_finish) {
					state.did_terminate = true;
					isolate->TerminateExecution();
				}
			});
		}

		if (!isolate.IsTerminated()) {
			try {
				result = fn();
			} catch (...) {
				// Rethrown below unless the isolate was interrupted
				error = std::current_exception();
			}
		}
		// `timer_ptr` is destroyed after this lock is released, and waits for a running callback
		std::lock_guard<std::mutex> lock{state.mutex};
		state.did_finish = true;
	}
	if (isolate.DidHitMemoryLimit()) {
		throw ResourceError{"Isolate was disposed during execution due to memory limit"};
	} else if (isolate.IsTerminated()) {
		throw FatalRuntimeError("Isolate was disposed during execution");
	} else if (state.did_terminate) {
		isolate->CancelTerminateExecution();
		throw TimeoutError{"Script execution timed out."};
	} else if (error) {
		std::rethrow_exception(error);
	}
	return Unmaybe(result);
}

} // namespace codejail
