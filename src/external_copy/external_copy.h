#pragma once
#include <v8.h>
#include <cstddef>
#include <string>
#include <vector>
#include "value.h"

namespace codejail {

/**
 * Structural copies between an isolate and the host. Nothing returned from here shares memory with
 * the isolate heap. All functions require the isolate lock and an entered context.
 */
class ExternalCopy {
	public:
		static constexpr int kMaxDepth = 64;

		/**
		 * `Copy` throws `RuntimeTypeError` for values which can't cross the boundary (functions,
		 * symbols, BigInts, proxies, cycles), `RuntimeRangeError` for values whose copy would exceed
		 * the isolate's memory limit, and `RuntimeError` if a getter throws.
		 */
		static auto Copy(v8::Local<v8::Value> value) -> Value;
		static auto CopyInto(const Value& value) -> v8::Local<v8::Value>;

		// Renders whatever was thrown into a one line message, `Error: message` for errors. Throws
		// `RuntimeError` if the isolate is terminated while user getters run.
		static auto CopyThrownValue(v8::Local<v8::Value> value) -> std::string;

	private:
		struct CopyState {
			std::vector<v8::Local<v8::Object>> stack;
			size_t remaining_bytes;
		};

		static void Charge(CopyState& state, size_t bytes);
		static auto CopyWithStack(v8::Local<v8::Value> value, CopyState& state) -> Value;
};

} // namespace codejail
