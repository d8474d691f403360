#pragma once
#include "runnable.h"
#include "lib/lockable.h"
#include <chrono>
#include <memory>
#include <queue>

namespace codejail {

/**
 * Queue of work for an isolate. Host threads post tasks here and the thread running the isolate
 * drains them while it holds the isolate lock. Once closed, new tasks are refused and queued tasks
 * are destroyed without running.
 */
class Scheduler {
	public:
		Scheduler() = default;
		Scheduler(const Scheduler&) = delete;
		~Scheduler() = default;
		auto operator= (const Scheduler&) = delete;

		// Returns false if the scheduler is closed, in which case the task was destroyed
		auto Post(std::unique_ptr<Runnable> task) -> bool;
		// Returns nullptr if there is nothing to do
		auto TakeTask() -> std::unique_ptr<Runnable>;
		// Blocks until a task is posted or `deadline` passes. Returns nullptr on timeout or close.
		auto WaitForTask(std::chrono::steady_clock::time_point deadline) -> std::unique_ptr<Runnable>;
		void Close();
		auto IsClosed() const -> bool;

	private:
		struct State {
			std::queue<std::unique_ptr<Runnable>> tasks;
			bool closed = false;
		};
		lockable_t<State, true> state;
};

} // namespace codejail
