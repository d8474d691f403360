#include "isolate_runner.h"
#include "bridge_compiler.h"
#include "output_collector.h"
#include "external_copy/external_copy.h"
#include "isolate/platform.h"
#include "isolate/run_with_timeout.h"
#include "isolate/util.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace v8;
namespace codejail {
namespace {

constexpr const char* kTimedOutMessage = "Script execution timed out.";

/**
 * Runs `fn` and converts whatever it throws into a run outcome. A pending JS exception is reported
 * with `js_error_kind`.
 */
template <class Function>
auto RunGuarded(ErrorKind js_error_kind, TryCatch& try_catch, Function fn) -> RunOutcome {
	try {
		return fn();
	} catch (const FatalRuntimeError& error) {
		return RunOutcome::Failed(ErrorKind::ResourceError, error.GetMessage());
	} catch (const detail::RuntimeErrorConstructible& error) {
		return RunOutcome::Failed(js_error_kind, error.GetMessage());
	} catch (const RuntimeError& error) {
		if (!try_catch.HasCaught() || try_catch.HasTerminated()) {
			return RunOutcome::Failed(ErrorKind::ResourceError, "Isolate was disposed during execution");
		}
		Local<v8::Value> exception = try_catch.Exception();
		try_catch.Reset();
		try {
			return RunOutcome::Failed(js_error_kind, ExternalCopy::CopyThrownValue(exception));
		} catch (const RuntimeError&) {
			// Only reachable if the isolate was terminated while rendering the message
			return RunOutcome::Failed(ErrorKind::ResourceError, "Isolate was disposed during execution");
		}
	} catch (const TimeoutError& error) {
		return RunOutcome::TimedOut(error.what());
	} catch (const CompileError& error) {
		return RunOutcome::Failed(js_error_kind == ErrorKind::BridgeInstallError ? js_error_kind : ErrorKind::CompileError, error.what());
	} catch (const SandboxError& error) {
		return RunOutcome::Failed(error.Kind(), error.what());
	}
}

} // anonymous namespace

auto StateName(IsolateRunner::State state) -> const char* {
	switch (state) {
		case IsolateRunner::State::Uninitialized: return "Uninitialized";
		case IsolateRunner::State::IsolateCreated: return "IsolateCreated";
		case IsolateRunner::State::ContextCreated: return "ContextCreated";
		case IsolateRunner::State::BootstrapRunning: return "BootstrapRunning";
		case IsolateRunner::State::CodeRunning: return "CodeRunning";
		case IsolateRunner::State::Completed: return "Completed";
		case IsolateRunner::State::Failed: return "Failed";
		case IsolateRunner::State::TimedOut: return "TimedOut";
		case IsolateRunner::State::Disposed: return "Disposed";
	}
	return "Unknown";
}

IsolateRunner::IsolateRunner(std::shared_ptr<spdlog::logger> logger) : logger{std::move(logger)} {}

IsolateRunner::~IsolateRunner() {
	Dispose();
}

void IsolateRunner::ExpectState(State expected, const char* operation) const {
	if (state != expected) {
		throw std::logic_error{std::string{operation} + " is not valid in state " + StateName(state)};
	}
}

auto IsolateRunner::Finish(RunOutcome outcome) -> RunOutcome {
	switch (outcome.status) {
		case RunOutcome::Status::Completed: state = State::Completed; break;
		case RunOutcome::Status::TimedOut: state = State::TimedOut; break;
		case RunOutcome::Status::Failed: state = State::Failed; break;
	}
	return outcome;
}

auto IsolateRunner::RemainingMs(clock_t::time_point deadline) -> uint32_t {
	auto now = clock_t::now();
	if (now >= deadline) {
		throw TimeoutError{kTimedOutMessage};
	}
	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
	return static_cast<uint32_t>(std::clamp<int64_t>(remaining, 1, std::numeric_limits<uint32_t>::max()));
}

void IsolateRunner::Create(size_t memory_limit_mb) {
	ExpectState(State::Uninitialized, "Create");
	try {
		env = std::make_unique<IsolateEnvironment>(memory_limit_mb, logger);
	} catch (const SandboxError&) {
		state = State::Failed;
		throw;
	}
	state = State::IsolateCreated;
}

void IsolateRunner::CreateContext() {
	ExpectState(State::IsolateCreated, "CreateContext");
	Executor::Lock lock{*env};
	Local<Context> context_handle = env->NewContext();
	if (context_handle.IsEmpty()) {
		state = State::Failed;
		throw ResourceError{"Failed to create context"};
	}
	context.Reset(env->GetIsolate(), context_handle);
	state = State::ContextCreated;
}

auto IsolateRunner::Evaluate(const std::string& code, const ScriptOriginHolder& origin, clock_t::time_point deadline) -> Local<v8::Value> {
	Local<Script> script = CompileScript(code, origin);
	Local<Context> context_handle = Deref(context);
	return RunWithTimeout(RemainingMs(deadline), [&]() { return script->Run(context_handle); });
}

void IsolateRunner::RunMicrotasks(clock_t::time_point deadline) {
	Isolate* isolate = env->GetIsolate();
	RunWithTimeout(RemainingMs(deadline), [&]() {
		Platform::PumpMessageLoop(isolate);
		isolate->PerformMicrotaskCheckpoint();
		return MaybeLocal<v8::Value>{Undefined(isolate)};
	});
}

auto IsolateRunner::RunBootstrap(BridgeCompiler& bridge, OutputCollector& output, clock_t::time_point deadline) -> RunOutcome {
	ExpectState(State::ContextCreated, "RunBootstrap");
	state = State::BootstrapRunning;
	this->bridge = &bridge;
	Executor::Lock lock{*env};
	Isolate* isolate = env->GetIsolate();
	Local<Context> context_handle = Deref(context);
	Context::Scope context_scope{context_handle};
	TryCatch try_catch{isolate};
	auto outcome = RunGuarded(ErrorKind::BridgeInstallError, try_catch, [&]() {
		bridge.Validate(context_handle);
		Local<v8::Value> installer = Evaluate(bridge.GenerateBootstrap(), ScriptOriginHolder{"<bootstrap>"}, deadline);
		if (!installer->IsFunction()) {
			throw BridgeInstallError{"Bootstrap script did not produce an installer"};
		}
		Local<Object> natives = Object::New(isolate);
		output.InstallNatives(context_handle, natives);
		bridge.InstallNatives(context_handle, natives, env->GetScheduler());
		Local<v8::Value> argv[] = { natives };
		RunWithTimeout(RemainingMs(deadline), [&]() {
			return installer.As<Function>()->Call(context_handle, Undefined(isolate), 1, argv);
		});
		return RunOutcome::Completed({});
	});
	if (outcome.status != RunOutcome::Status::Completed) {
		return Finish(std::move(outcome));
	}
	logger->debug("bootstrap installed");
	return outcome;
}

auto IsolateRunner::CompileAndRun(const std::string& code, clock_t::time_point deadline) -> RunOutcome {
	if (state != State::ContextCreated) {
		ExpectState(State::BootstrapRunning, "CompileAndRun");
	}
	state = State::CodeRunning;
	Executor::Lock lock{*env};
	Local<Context> context_handle = Deref(context);
	Context::Scope context_scope{context_handle};
	TryCatch try_catch{env->GetIsolate()};
	return Finish(RunGuarded(ErrorKind::RuntimeError, try_catch, [&]() {
		Local<v8::Value> result = Evaluate(WrapAsync(code), ScriptOriginHolder{"<sandbox>", kWrapAsyncLineOffset}, deadline);
		if (!result->IsPromise()) {
			return RunOutcome::Completed(ExternalCopy::Copy(result));
		}
		return AwaitPromise(result.As<Promise>(), deadline);
	}));
}

auto IsolateRunner::AwaitPromise(Local<Promise> promise, clock_t::time_point deadline) -> RunOutcome {
	Isolate* isolate = env->GetIsolate();
	Scheduler& scheduler = *env->GetScheduler();
	while (true) {
		RunMicrotasks(deadline);
		switch (promise->State()) {
			case Promise::kFulfilled: {
				// The completion value is informational, the final answer is the real result channel.
				// Getters on it are user code, so the copy runs under the deadline too.
				Value value;
				TryCatch try_catch{isolate};
				try {
					RunWithTimeout(RemainingMs(deadline), [&]() {
						value = ExternalCopy::Copy(promise->Result());
						return MaybeLocal<v8::Value>{Undefined(isolate)};
					});
				} catch (const FatalRuntimeError&) {
					throw;
				} catch (const RuntimeError& error) {
					if (try_catch.HasTerminated()) {
						throw;
					}
					logger->debug("script completion value could not be copied: {}", error.what());
					try_catch.Reset();
					value = {};
				}
				return RunOutcome::Completed(std::move(value));
			}
			case Promise::kRejected: {
				std::string message;
				RunWithTimeout(RemainingMs(deadline), [&]() {
					message = ExternalCopy::CopyThrownValue(promise->Result());
					return MaybeLocal<v8::Value>{Undefined(isolate)};
				});
				return RunOutcome::Failed(ErrorKind::RuntimeError, std::move(message));
			}
			case Promise::kPending:
				break;
		}

		auto task = scheduler.TakeTask();
		if (!task) {
			if (bridge == nullptr || bridge->CallsInFlight() == 0) {
				return RunOutcome::Failed(ErrorKind::RuntimeError, "Script is awaiting a promise that can never settle");
			}
			task = scheduler.WaitForTask(deadline);
			if (!task) {
				if (env->DidHitMemoryLimit()) {
					throw ResourceError{"Isolate was disposed during execution due to memory limit"};
				} else if (scheduler.IsClosed()) {
					throw FatalRuntimeError("Isolate was disposed during execution");
				}
				throw TimeoutError{kTimedOutMessage};
			}
		}
		RunWithTimeout(RemainingMs(deadline), [&]() {
			task->Run();
			return MaybeLocal<v8::Value>{Undefined(isolate)};
		});
	}
}

void IsolateRunner::Dispose() {
	if (state == State::Disposed) {
		return;
	}
	if (env) {
		env->GetScheduler()->Close();
		{
			Executor::Lock lock{*env};
			if (bridge != nullptr) {
				bridge->Release();
			}
			context.Reset();
		}
		// The isolate can only be disposed once no thread holds its lock
		env.reset();
	}
	bridge = nullptr;
	logger->debug("runner disposed from state {}", StateName(state));
	state = State::Disposed;
}

} // namespace codejail
