#pragma once
#include "capability_handle.h"
#include "sandbox_options.h"
#include "sandbox_result.h"
#include "lib/thread_pool.h"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace codejail {

/**
 * Public entry point. Each call to `Run` gets its own isolate, context, output collector and
 * capability bindings, all of which are torn down before it returns. Runs on different threads are
 * independent.
 */
class SandboxService {
	public:
		// Throws `std::invalid_argument` if `options` don't validate
		explicit SandboxService(SandboxOptions options = {});
		SandboxService(const SandboxService&) = delete;
		~SandboxService() = default;
		auto operator= (const SandboxService&) = delete;

		/**
		 * Runs `code` with access to `capabilities` only. Blocks the calling thread until the run is
		 * finished and never throws; every failure is reported in the result. A `timeout_ms` of 0
		 * uses the configured default.
		 */
		auto Run(const std::string& code, const CapabilityMap& capabilities, uint32_t timeout_ms = 0) -> SandboxResult;

		// Same as `Run` but on the service's worker pool
		auto RunAsync(std::string code, CapabilityMap capabilities, uint32_t timeout_ms = 0) -> std::future<SandboxResult>;

		auto GetOptions() const -> const SandboxOptions& { return options; }
		auto GetBudget() const -> RunBudget;

	private:
		SandboxOptions options;
		std::shared_ptr<spdlog::logger> logger;
		// Declared last so workers are joined before anything they use is destroyed
		std::unique_ptr<thread_pool_t> pool;
};

} // namespace codejail
