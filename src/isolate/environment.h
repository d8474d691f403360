#pragma once
#include <v8.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstddef>
#include <memory>
#include "allocator.h"
#include "executor.h"
#include "scheduler.h"
#include "lib/logging.h"

namespace codejail {

/**
 * Wrapper around a single v8 isolate. The isolate is created with a heap ceiling in the ctor and
 * disposed in the dtor, so the lifetime of this object is the lifetime of the isolate. Only
 * `Terminate()` and `GetScheduler()` may be used from threads which don't hold the isolate lock.
 */
class IsolateEnvironment {
	friend LimitedAllocator;

	public:
		// Smallest memory limit v8 can boot an isolate in
		static constexpr size_t kMinimumMemoryLimitMb = 8;

		explicit IsolateEnvironment(size_t memory_limit_in_mb, std::shared_ptr<spdlog::logger> logger = GetLogger());
		IsolateEnvironment(const IsolateEnvironment&) = delete;
		~IsolateEnvironment();
		auto operator= (const IsolateEnvironment&) = delete;

		static auto GetCurrent() -> IsolateEnvironment* {
			return Executor::GetCurrentEnvironment();
		}

		// Number of isolates which have been created and not yet disposed, process wide
		static auto LiveCount() -> size_t;

		auto GetIsolate() const -> v8::Isolate* { return isolate; }
		auto operator->() const -> v8::Isolate* { return isolate; }
		auto GetScheduler() const -> const std::shared_ptr<Scheduler>& { return scheduler; }
		auto GetMemoryLimit() const -> size_t { return memory_limit; }

		// Creates a fresh context with code generation from strings disabled
		auto NewContext() -> v8::Local<v8::Context>;

		auto DidHitMemoryLimit() const -> bool { return hit_memory_limit; }
		auto IsTerminated() const -> bool { return terminated; }
		// Forcefully stops all execution in this isolate. It can't be resumed afterwards.
		void Terminate();

	private:
		static void OOMErrorCallback(const char* location, const v8::OOMDetails& details);
		static auto NearHeapLimitCallback(void* data, size_t current_heap_limit, size_t initial_heap_limit) -> size_t;
		static void MarkSweepCompactEpilogue(v8::Isolate* isolate, v8::GCType gc_type, v8::GCCallbackFlags gc_flags, void* data);

		v8::Isolate* isolate = nullptr;
		std::shared_ptr<spdlog::logger> logger;
		std::shared_ptr<v8::ArrayBuffer::Allocator> allocator_ptr;
		std::shared_ptr<Scheduler> scheduler = std::make_shared<Scheduler>();
		size_t memory_limit = 0;
		size_t misc_memory_size = 0;
		std::atomic<size_t> extra_allocated_memory{0};
		std::atomic<bool> hit_memory_limit{false};
		std::atomic<bool> terminated{false};
		static std::atomic<size_t> live_count;
};

} // namespace codejail
