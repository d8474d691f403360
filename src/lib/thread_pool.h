#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace codejail {

/**
 * Fixed set of worker threads which is grown lazily up to `desired_size`. Once every thread is busy
 * new work waits in a FIFO queue for the next free worker.
 */
class thread_pool_t {
	public:
		using task_t = std::function<void()>;

		explicit thread_pool_t(size_t desired_size) noexcept : desired_size{desired_size} {}
		thread_pool_t(const thread_pool_t&) = delete;
		~thread_pool_t() { resize(0); }
		auto operator= (const thread_pool_t&) = delete;

		void exec(task_t task);
		// Shrinking joins the surplus threads after they finish their current task. Shrinking to 0
		// drains the pending queue first.
		void resize(size_t size);
		auto size() -> size_t;

	private:
		auto new_thread(std::lock_guard<std::mutex>& /*lock*/) -> size_t;

		struct thread_data_t {
			std::thread thread;
			task_t task;
			bool should_exit = false;
		};

		size_t desired_size;
		size_t busy = 0;
		std::mutex mutex;
		std::condition_variable cv;
		std::deque<task_t> pending;
		std::deque<thread_data_t> thread_data;
};

} // namespace codejail
