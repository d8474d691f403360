#include "capability_handle.h"
#include "isolate/scheduler.h"
#include "lib/thread_pool.h"
#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace codejail {
namespace {

auto HostPool() -> thread_pool_t& {
	static thread_pool_t pool{std::max<size_t>(4, std::thread::hardware_concurrency())};
	return pool;
}

auto UnknownExceptionMessage(const CapabilityPromise& promise) -> std::string {
	return "Capability '" + promise.GetName() + "' failed with an unknown exception";
}

} // anonymous namespace

/**
 * CapabilityPromise implementation
 */
void CapabilityPromise::Resolve(Value value) const {
	Settle(CapabilityOutcome{std::move(value), std::nullopt});
}

void CapabilityPromise::Reject(std::string message) const {
	Settle(CapabilityOutcome{Value{}, std::move(message)});
}

auto CapabilityPromise::IsSettled() const -> bool {
	return state->settled;
}

auto CapabilityPromise::GetName() const -> const std::string& {
	return state->name;
}

void CapabilityPromise::Settle(CapabilityOutcome outcome) const {
	if (state->settled.exchange(true)) {
		return;
	}
	auto scheduler = state->scheduler.lock();
	if (!scheduler || !scheduler->Post(state->make_task(std::move(outcome)))) {
		state->logger->debug("discarding result of capability '{}' which settled after its sandbox was disposed", state->name);
	}
}

/**
 * CapabilityHandle implementation
 */
CapabilityHandle::CapabilityHandle(std::string name, invoker_t invoker) :
	name{std::move(name)},
	invoker{std::make_shared<const invoker_t>(std::move(invoker))} {}

auto CapabilityHandle::FromFunction(std::string name, function_t fn) -> CapabilityHandle {
	auto shared_fn = std::make_shared<function_t>(std::move(fn));
	return CapabilityHandle{std::move(name), [shared_fn](ValueList arguments, CapabilityPromise promise) {
		HostPool().exec([shared_fn, arguments = std::move(arguments), promise = std::move(promise)]() {
			try {
				promise.Resolve((*shared_fn)(arguments));
			} catch (const std::exception& error) {
				promise.Reject(error.what());
			} catch (...) {
				promise.Reject(UnknownExceptionMessage(promise));
			}
		});
	}};
}

void CapabilityHandle::Invoke(ValueList arguments, const CapabilityPromise& promise) const {
	try {
		(*invoker)(std::move(arguments), promise);
	} catch (const std::exception& error) {
		promise.Reject(error.what());
	} catch (...) {
		promise.Reject(UnknownExceptionMessage(promise));
	}
}

} // namespace codejail
