#include "allocator.h"
#include "environment.h"
#include <cstdlib>

using namespace v8;

namespace codejail {

/**
 * The v8 documentation says it's unsafe to call back into v8 from an allocator, but
 * GetHeapStatistics() doesn't touch the JS heap so it's used here to keep the heap size estimate
 * fresh. Allocations only happen on the thread which holds the isolate lock.
 */
LimitedAllocator::LimitedAllocator(IsolateEnvironment& env, size_t limit) :
	env{env}, limit{limit}, v8_heap{1024 * 1024 * 4}, next_check{1024 * 1024} {}

auto LimitedAllocator::Check(const size_t length) -> bool {
	size_t extra = env.extra_allocated_memory;
	if (v8_heap + extra + length > next_check) {
		HeapStatistics heap_statistics;
		Isolate* isolate = env.GetIsolate();
		isolate->GetHeapStatistics(&heap_statistics);
		v8_heap = heap_statistics.used_heap_size();
		if (v8_heap + extra + length > limit + env.misc_memory_size) {
			isolate->LowMemoryNotification();
			isolate->GetHeapStatistics(&heap_statistics);
			v8_heap = heap_statistics.used_heap_size();
			extra = env.extra_allocated_memory;
			if (v8_heap + extra + length > limit + env.misc_memory_size) {
				return false;
			}
		}
		next_check = v8_heap + extra + length + 1024 * 1024;
	}
	return v8_heap + extra + length <= limit + env.misc_memory_size;
}

auto LimitedAllocator::Allocate(size_t length) -> void* {
	if (Check(length)) {
		env.extra_allocated_memory += length;
		return std::calloc(length, 1);
	}
	++failures;
	if (length <= 64) {
		// v8 materializes buffers of tiny typed arrays lazily and crashes if that allocation fails.
		// Let it through and terminate the isolate instead.
		env.extra_allocated_memory += length;
		env.hit_memory_limit = true;
		env.Terminate();
		return std::calloc(length, 1);
	}
	// Larger allocations fail gracefully with a RangeError in the isolate
	return nullptr;
}

auto LimitedAllocator::AllocateUninitialized(size_t length) -> void* {
	if (Check(length)) {
		env.extra_allocated_memory += length;
		return std::malloc(length);
	}
	++failures;
	if (length <= 64) {
		env.extra_allocated_memory += length;
		env.hit_memory_limit = true;
		env.Terminate();
		return std::malloc(length);
	}
	return nullptr;
}

void LimitedAllocator::Free(void* data, size_t length) {
	env.extra_allocated_memory -= length;
	next_check = next_check > length ? next_check - length : 0;
	std::free(data);
}

auto LimitedAllocator::GetFailureCount() const -> int {
	return failures;
}

} // namespace codejail
