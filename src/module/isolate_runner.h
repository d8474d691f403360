#pragma once
#include "evaluation.h"
#include "external_copy/value.h"
#include "isolate/environment.h"
#include "isolate/generic/error.h"
#include <v8.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace codejail {

class BridgeCompiler;
class OutputCollector;

/**
 * Result of running a script in an `IsolateRunner`
 */
struct RunOutcome {
	enum class Status { Completed, TimedOut, Failed };

	static auto Completed(Value value) -> RunOutcome {
		return {Status::Completed, std::move(value), {}, ErrorKind::RuntimeError};
	}
	static auto TimedOut(std::string message) -> RunOutcome {
		return {Status::TimedOut, {}, std::move(message), ErrorKind::TimeoutError};
	}
	static auto Failed(ErrorKind kind, std::string message) -> RunOutcome {
		return {Status::Failed, {}, std::move(message), kind};
	}

	Status status;
	Value value;
	// Only meaningful when not `Completed`
	std::string message;
	ErrorKind error_kind;
};

/**
 * Owns the isolate and context of exactly one run. Operations must be called in state machine
 * order: Create, CreateContext, RunBootstrap, CompileAndRun, Dispose. Calling an operation out of
 * order throws `std::logic_error`. Dispose runs from the destructor if it wasn't called explicitly.
 */
class IsolateRunner {
	public:
		using clock_t = std::chrono::steady_clock;

		enum class State {
			Uninitialized,
			IsolateCreated,
			ContextCreated,
			BootstrapRunning,
			CodeRunning,
			Completed,
			Failed,
			TimedOut,
			Disposed,
		};

		explicit IsolateRunner(std::shared_ptr<spdlog::logger> logger);
		IsolateRunner(const IsolateRunner&) = delete;
		~IsolateRunner();
		auto operator= (const IsolateRunner&) = delete;

		// Throws `ResourceError` if the isolate can't be allocated
		void Create(size_t memory_limit_mb);
		void CreateContext();

		/**
		 * Installs the output collector and capability shims. A failure to install is reported as
		 * `BridgeInstallError`. `bridge` must outlive this runner.
		 */
		auto RunBootstrap(BridgeCompiler& bridge, OutputCollector& output, clock_t::time_point deadline) -> RunOutcome;

		/**
		 * Compiles `code` as the body of an async function and runs it until the returned promise
		 * settles, the deadline passes, or it becomes clear that it can never settle.
		 */
		auto CompileAndRun(const std::string& code, clock_t::time_point deadline) -> RunOutcome;

		// Releases the bridge, context and isolate. Further calls do nothing.
		void Dispose();

		auto GetState() const -> State { return state; }
		auto GetEnvironment() const -> IsolateEnvironment* { return env.get(); }

	private:
		void ExpectState(State expected, const char* operation) const;
		auto Finish(RunOutcome outcome) -> RunOutcome;
		static auto RemainingMs(clock_t::time_point deadline) -> uint32_t;
		auto Evaluate(const std::string& code, const ScriptOriginHolder& origin, clock_t::time_point deadline) -> v8::Local<v8::Value>;
		auto AwaitPromise(v8::Local<v8::Promise> promise, clock_t::time_point deadline) -> RunOutcome;
		void RunMicrotasks(clock_t::time_point deadline);

		std::shared_ptr<spdlog::logger> logger;
		std::unique_ptr<IsolateEnvironment> env;
		v8::Global<v8::Context> context;
		BridgeCompiler* bridge = nullptr;
		State state = State::Uninitialized;
};

auto StateName(IsolateRunner::State state) -> const char*;

} // namespace codejail
