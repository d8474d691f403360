#pragma once
#include <cstdint>
#include <functional>
#include <memory>

namespace codejail {

/**
 * Deadlines are armed from whichever thread happens to be running a sandbox, so rather than spawning
 * a thread per deadline all timers share one lazily started timer thread. Callbacks run on that
 * thread and must be short; they typically just interrupt an isolate or post a task.
 */
struct timer_data_t;
class timer_t {
	public:
		using callback_t = std::function<void()>;

		// Runs `callback` in `ms` milliseconds unless the `timer_t` is destroyed first.
		timer_t(uint32_t ms, callback_t callback);
		timer_t(const timer_t&) = delete;
		// Cancels the timer. If the callback is running right now this waits for it to return.
		~timer_t();
		auto operator= (const timer_t&) = delete;

		// Runs a callback in `ms` with no `timer_t` object.
		static void wait_detached(uint32_t ms, callback_t callback);

	private:
		std::shared_ptr<timer_data_t> data;
};

} // namespace codejail
