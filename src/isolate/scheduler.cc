#include "scheduler.h"
#include <utility>

namespace codejail {

auto Scheduler::Post(std::unique_ptr<Runnable> task) -> bool {
	{
		auto lock = state.write();
		if (!lock->closed) {
			lock->tasks.push(std::move(task));
			state.notify_all();
			return true;
		}
	}
	// Destroy outside of the lock
	task.reset();
	return false;
}

auto Scheduler::TakeTask() -> std::unique_ptr<Runnable> {
	auto lock = state.write();
	if (lock->closed || lock->tasks.empty()) {
		return nullptr;
	}
	auto task = std::move(lock->tasks.front());
	lock->tasks.pop();
	return task;
}

auto Scheduler::WaitForTask(std::chrono::steady_clock::time_point deadline) -> std::unique_ptr<Runnable> {
	auto lock = state.write();
	while (!lock->closed) {
		if (!lock->tasks.empty()) {
			auto task = std::move(lock->tasks.front());
			lock->tasks.pop();
			return task;
		}
		if (!lock.wait_until(deadline) && lock->tasks.empty()) {
			break;
		}
	}
	return nullptr;
}

void Scheduler::Close() {
	std::queue<std::unique_ptr<Runnable>> tasks;
	{
		auto lock = state.write();
		lock->closed = true;
		std::swap(tasks, lock->tasks);
		state.notify_all();
	}
}

auto Scheduler::IsClosed() const -> bool {
	return state.read()->closed;
}

} // namespace codejail
