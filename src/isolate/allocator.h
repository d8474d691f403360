#pragma once
#include <v8.h>
#include <cstddef>

namespace codejail {

class IsolateEnvironment;

/**
 * ArrayBuffer::Allocator which counts external memory against the isolate's memory limit
 */
class LimitedAllocator : public v8::ArrayBuffer::Allocator {
	public:
		LimitedAllocator(IsolateEnvironment& env, size_t limit);
		auto Check(size_t length) -> bool;
		auto Allocate(size_t length) -> void* final;
		auto AllocateUninitialized(size_t length) -> void* final;
		void Free(void* data, size_t length) final;
		auto GetFailureCount() const -> int;

	private:
		IsolateEnvironment& env;
		size_t limit;
		size_t v8_heap;
		size_t next_check;
		int failures = 0;
};

} // namespace codejail
