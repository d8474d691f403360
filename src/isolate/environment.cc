#include "environment.h"
#include "platform.h"
#include "isolate/generic/error.h"
#include "lib/logging.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

using namespace v8;

namespace codejail {

std::atomic<size_t> IsolateEnvironment::live_count{0};

/**
 * IsolateEnvironment implementation
 */
void IsolateEnvironment::OOMErrorCallback(const char* location, const OOMDetails& details) {
	// v8 aborts the process after this returns. The near heap limit callback exists so that this
	// isn't reached in practice.
	IsolateEnvironment* env = GetCurrent();
	auto logger = env == nullptr ? GetLogger() : env->logger;
	logger->critical("v8 out of memory in {} (is_heap_oom = {}): {}",
		location == nullptr ? "unknown" : location,
		details.is_heap_oom,
		details.detail == nullptr ? "" : details.detail);
	logger->flush();
}

auto IsolateEnvironment::NearHeapLimitCallback(void* data, size_t current_heap_limit, size_t /*initial_heap_limit*/) -> size_t {
	// Give v8 some headroom so it can unwind the terminated script instead of crashing
	auto* that = static_cast<IsolateEnvironment*>(data);
	if (!that->hit_memory_limit) {
		that->logger->error("isolate reached its {} MB heap limit, terminating", that->memory_limit / 1024 / 1024);
	}
	that->hit_memory_limit = true;
	that->Terminate();
	return current_heap_limit + 256 * 1024 * 1024;
}

void IsolateEnvironment::MarkSweepCompactEpilogue(Isolate* /*isolate*/, GCType /*gc_type*/, GCCallbackFlags /*gc_flags*/, void* data) {
	// Array buffer memory lives outside of the v8 heap so it's checked after each full collection
	auto* that = static_cast<IsolateEnvironment*>(data);
	HeapStatistics heap;
	that->isolate->GetHeapStatistics(&heap);
	size_t total_memory = heap.used_heap_size() + that->extra_allocated_memory;
	if (total_memory > that->memory_limit + that->misc_memory_size) {
		that->hit_memory_limit = true;
		that->Terminate();
	}
}

IsolateEnvironment::IsolateEnvironment(size_t memory_limit_in_mb, std::shared_ptr<spdlog::logger> logger) :
		logger{std::move(logger)} {
	if (memory_limit_in_mb < kMinimumMemoryLimitMb) {
		throw ResourceError{"Memory limit of " + std::to_string(memory_limit_in_mb) +
			" MB is below the minimum of " + std::to_string(kMinimumMemoryLimitMb) + " MB"};
	}
	Platform::Initialize();
	memory_limit = memory_limit_in_mb * 1024 * 1024;
	allocator_ptr = std::make_shared<LimitedAllocator>(*this, memory_limit);

	// Calculate resource constraints
	ResourceConstraints rc;
	size_t young_space_in_kb = (size_t)std::pow(2, std::min(sizeof(void*) >= 8 ? 4.0 : 3.0, memory_limit_in_mb / 128.0) + 10);
	rc.set_max_young_generation_size_in_bytes(young_space_in_kb * 1024);
	rc.set_max_old_generation_size_in_bytes(memory_limit);

	Isolate::CreateParams create_params;
	create_params.constraints = rc;
	create_params.array_buffer_allocator_shared = allocator_ptr;
	isolate = Isolate::New(create_params);
	if (isolate == nullptr) {
		throw ResourceError{"Failed to allocate isolate"};
	}

	{
		Locker locker{isolate};
		Isolate::Scope isolate_scope{isolate};
		isolate->SetOOMErrorHandler(OOMErrorCallback);
		isolate->SetMicrotasksPolicy(MicrotasksPolicy::kExplicit);
		isolate->AddGCEpilogueCallback(MarkSweepCompactEpilogue, static_cast<void*>(this), GCType::kGCTypeMarkSweepCompact);
		isolate->AddNearHeapLimitCallback(NearHeapLimitCallback, static_cast<void*>(this));

		// Heap statistics crushes down lots of different memory spaces into a single number. We note
		// the difference between the requested old space and v8's calculated heap size.
		HeapStatistics heap;
		isolate->GetHeapStatistics(&heap);
		misc_memory_size = heap.heap_size_limit() > memory_limit ? heap.heap_size_limit() - memory_limit : 0;
	}

	++live_count;
	this->logger->debug("isolate created with {} MB limit", memory_limit_in_mb);
}

IsolateEnvironment::~IsolateEnvironment() {
	{
		// Dispose() will call destructors for external strings and array buffers, so this scope sets
		// the "current" isolate for those C++ dtors to function correctly without locking v8
		Executor::Scope scope{*this};
		isolate->Dispose();
	}
	--live_count;
	logger->debug("isolate disposed");
}

auto IsolateEnvironment::LiveCount() -> size_t {
	return live_count;
}

auto IsolateEnvironment::NewContext() -> Local<Context> {
	auto context = Context::New(isolate);
	context->AllowCodeGenerationFromStrings(false);
	return context;
}

void IsolateEnvironment::Terminate() {
	terminated = true;
	scheduler->Close();

	// Request interrupt to ensure execution is interrupted in race conditions
	isolate->RequestInterrupt([](Isolate* isolate, void* /* param */) {
		isolate->TerminateExecution();
	}, nullptr);
	isolate->TerminateExecution();
}

} // namespace codejail
