#pragma once
#include "capability_handle.h"
#include <v8.h>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace codejail {

class Scheduler;

/**
 * Generates and installs the in-sandbox shims for a run's capabilities. Each capability becomes a
 * non-writable global async function which forwards copied arguments to a native dispatch function
 * and resolves with the copied result. The dispatch function is only reachable from the shims.
 */
class BridgeCompiler {
	public:
		BridgeCompiler(CapabilityMap capabilities, std::shared_ptr<spdlog::logger> logger);
		BridgeCompiler(const BridgeCompiler&) = delete;
		~BridgeCompiler() = default;
		auto operator= (const BridgeCompiler&) = delete;

		// Throws `BridgeInstallError` if `name` can't be used as a capability name
		static void ValidateName(const std::string& name);
		// Validates every capability, including collisions with globals of `context`
		void Validate(v8::Local<v8::Context> context) const;

		/**
		 * The bootstrap script evaluates to an installer function which takes one `natives` object with
		 * `invoke`, `log`, `error` and `finalAnswer` functions.
		 */
		auto GenerateBootstrap() const -> std::string;
		// Adds `invoke` to the natives object. Settles are posted to `scheduler`.
		void InstallNatives(v8::Local<v8::Context> context, v8::Local<v8::Object> natives, const std::shared_ptr<Scheduler>& scheduler);

		// Number of calls made by the sandbox which haven't been settled into it yet
		auto CallsInFlight() const -> size_t { return resolvers.size(); }
		// Settles one call into the sandbox. Requires the isolate lock and the run's context.
		void Settle(uint32_t id, CapabilityOutcome outcome);
		// Drops every binding and pending call. Requires the isolate lock.
		void Release();

	private:
		static void Dispatch(const v8::FunctionCallbackInfo<v8::Value>& info);
		auto Invoke(const std::string& name, v8::Local<v8::Value> arguments) -> v8::Local<v8::Promise>;

		CapabilityMap capabilities;
		std::shared_ptr<spdlog::logger> logger;
		std::weak_ptr<Scheduler> scheduler;
		std::map<uint32_t, v8::Global<v8::Promise::Resolver>> resolvers;
		uint32_t next_id = 0;
		bool released = false;
};

} // namespace codejail
