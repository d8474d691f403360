#include "sandbox_service.h"
#include "bridge_compiler.h"
#include "isolate_runner.h"
#include "output_collector.h"
#include "isolate/environment.h"
#include "lib/logging.h"
#include <chrono>
#include <new>
#include <stdexcept>
#include <utility>

namespace codejail {
namespace {

void Fail(SandboxResult& result, ErrorKind kind, std::string message) {
	result.final_answer.reset();
	result.error_kind = kind;
	result.error = std::move(message);
}

} // anonymous namespace

void SandboxOptions::Validate() const {
	if (memory_limit_mb < IsolateEnvironment::kMinimumMemoryLimitMb) {
		throw std::invalid_argument{"memory_limit_mb must be at least " + std::to_string(IsolateEnvironment::kMinimumMemoryLimitMb)};
	}
	if (default_timeout_ms == 0) {
		throw std::invalid_argument{"default_timeout_ms must be positive"};
	}
	if (max_output_lines == 0 || max_output_bytes == 0) {
		throw std::invalid_argument{"output limits must be positive"};
	}
	if (worker_threads == 0) {
		throw std::invalid_argument{"worker_threads must be positive"};
	}
}

SandboxService::SandboxService(SandboxOptions options) :
		options{std::move(options)} {
	this->options.Validate();
	logger = this->options.logger ? this->options.logger : GetLogger();
	pool = std::make_unique<thread_pool_t>(this->options.worker_threads);
}

auto SandboxService::GetBudget() const -> RunBudget {
	return RunBudget{options.step_timeout_ms, options.total_timeout_ms, options.memory_limit_mb};
}

auto SandboxService::Run(const std::string& code, const CapabilityMap& capabilities, uint32_t timeout_ms) -> SandboxResult {
	const RunBudget budget = GetBudget();
	const auto started = std::chrono::steady_clock::now();
	const uint32_t effective_timeout_ms = budget.EffectiveTimeoutMs(timeout_ms, options.default_timeout_ms);
	const auto deadline = started + std::chrono::milliseconds{effective_timeout_ms};
	logger->debug("sandbox_run start: {} byte(s) of code, {} capability(s), {} ms deadline",
		code.size(), capabilities.size(), effective_timeout_ms);

	SandboxResult result;
	{
		// Declaration order matters: the runner releases the bridge when it is destroyed
		BridgeCompiler bridge{capabilities, logger};
		OutputCollector output{options.max_output_lines, options.max_output_bytes, logger};
		IsolateRunner runner{logger};
		try {
			runner.Create(budget.memory_limit_mb);
			runner.CreateContext();
			auto outcome = runner.RunBootstrap(bridge, output, deadline);
			if (outcome.status == RunOutcome::Status::Completed) {
				outcome = runner.CompileAndRun(code, deadline);
			}
			result.final_answer = output.GetFinalAnswer();
			if (outcome.status != RunOutcome::Status::Completed) {
				Fail(result, outcome.error_kind, std::move(outcome.message));
			}
		} catch (const SandboxError& error) {
			Fail(result, error.Kind(), error.what());
		} catch (const std::bad_alloc&) {
			Fail(result, ErrorKind::ResourceError, "Host ran out of memory during sandbox run");
		} catch (const std::exception& error) {
			Fail(result, ErrorKind::RuntimeError, error.what());
		}
		runner.Dispose();
		result.stdout_lines = output.GetStdout();
		result.stderr_lines = output.GetStderr();
	}

	result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
	if (result.error) {
		logger->error("sandbox_run failed after {} ms ({}): {}",
			result.wall_time.count(), ErrorKindName(*result.error_kind), *result.error);
	} else {
		logger->debug("sandbox_run finished in {} ms, final answer {}",
			result.wall_time.count(), result.final_answer ? "set" : "absent");
	}
	return result;
}

auto SandboxService::RunAsync(std::string code, CapabilityMap capabilities, uint32_t timeout_ms) -> std::future<SandboxResult> {
	auto promise = std::make_shared<std::promise<SandboxResult>>();
	auto future = promise->get_future();
	pool->exec([this, promise, code = std::move(code), capabilities = std::move(capabilities), timeout_ms]() {
		promise->set_value(Run(code, capabilities, timeout_ms));
	});
	return future;
}

} // namespace codejail
