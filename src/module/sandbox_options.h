#pragma once
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>

namespace codejail {

/**
 * Host configuration for a `SandboxService`. Timeouts of 0 mean "not set".
 */
struct SandboxOptions {
	size_t memory_limit_mb = 128;
	uint32_t default_timeout_ms = 30000;
	uint32_t step_timeout_ms = 0;
	uint32_t total_timeout_ms = 0;
	size_t max_output_lines = 1000;
	size_t max_output_bytes = 1024 * 1024;
	size_t worker_threads = 4;
	// Defaults to `GetLogger()`
	std::shared_ptr<spdlog::logger> logger;

	// Throws `std::invalid_argument`
	void Validate() const;
};

/**
 * Limits for one run, fixed before the run starts.
 */
struct RunBudget {
	uint32_t step_timeout_ms = 0;
	uint32_t total_timeout_ms = 0;
	size_t memory_limit_mb = 0;

	// Single deadline for the whole run: the smallest timeout which is set, or `fallback_ms`
	auto EffectiveTimeoutMs(uint32_t requested_ms, uint32_t fallback_ms) const -> uint32_t {
		uint32_t timeout_ms = 0;
		for (uint32_t candidate : { requested_ms, step_timeout_ms, total_timeout_ms }) {
			if (candidate != 0) {
				timeout_ms = timeout_ms == 0 ? candidate : std::min(timeout_ms, candidate);
			}
		}
		return timeout_ms == 0 ? fallback_ms : timeout_ms;
	}
};

} // namespace codejail
