#pragma once
#include "external_copy/value.h"
#include "isolate/runnable.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace codejail {

class Scheduler;

/**
 * Result of a capability call as seen by the host: either a value or a rejection message.
 */
struct CapabilityOutcome {
	Value value;
	std::optional<std::string> error;
};

/**
 * Settle handle passed to a capability's invoker. Copies share state, may be used from any thread,
 * and only the first `Resolve` or `Reject` has any effect. Settling after the sandbox which made the
 * call was disposed is allowed and does nothing.
 */
class CapabilityPromise {
	friend class BridgeCompiler;

	public:
		void Resolve(Value value) const;
		void Reject(std::string message) const;
		auto IsSettled() const -> bool;
		// Name of the capability this call was made to
		auto GetName() const -> const std::string&;

	private:
		using task_factory_t = std::function<std::unique_ptr<Runnable>(CapabilityOutcome)>;
		struct State {
			std::string name;
			std::weak_ptr<Scheduler> scheduler;
			task_factory_t make_task;
			std::shared_ptr<spdlog::logger> logger;
			std::atomic<bool> settled{false};
		};

		explicit CapabilityPromise(std::shared_ptr<State> state) : state{std::move(state)} {}
		void Settle(CapabilityOutcome outcome) const;

		std::shared_ptr<State> state;
};

/**
 * Host-owned reference to one host function. The sandbox can only start a call through it and
 * receive a copied result; the function itself never crosses into the isolate.
 */
class CapabilityHandle {
	public:
		using invoker_t = std::function<void(ValueList arguments, CapabilityPromise promise)>;
		using function_t = std::function<Value(const ValueList& arguments)>;

		CapabilityHandle(std::string name, invoker_t invoker);

		// Adapts a synchronous host function. Calls run on a shared host worker pool, never on the
		// isolate thread, and exceptions become rejections.
		static auto FromFunction(std::string name, function_t fn) -> CapabilityHandle;

		auto GetName() const -> const std::string& { return name; }

		// Starts a call. If the invoker throws, the call is rejected with the exception's message, or a
		// generic message for exceptions which aren't `std::exception`.
		void Invoke(ValueList arguments, const CapabilityPromise& promise) const;

	private:
		std::string name;
		std::shared_ptr<const invoker_t> invoker;
};

// Capabilities offered to one run, keyed by the global name they are installed under
using CapabilityMap = std::map<std::string, CapabilityHandle>;

} // namespace codejail
