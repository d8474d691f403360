#include "thread_pool.h"
#include <utility>

namespace codejail {

void thread_pool_t::exec(task_t task) {
	std::lock_guard<std::mutex> lock{mutex};
	pending.push_back(std::move(task));
	if (busy + pending.size() > thread_data.size() && thread_data.size() < desired_size) {
		// Thread pool hasn't yet reached `desired_size`, so we can make a new thread
		new_thread(lock);
	} else if (thread_data.empty()) {
		// Pool has been shut down, run this in a new thread so the task is not lost
		auto orphan = std::move(pending.back());
		pending.pop_back();
		std::thread tmp_thread{std::move(orphan)};
		tmp_thread.detach();
		return;
	}
	cv.notify_one();
}

void thread_pool_t::resize(size_t size) {
	std::unique_lock<std::mutex> lock{mutex};
	desired_size = size;
	if (thread_data.size() > desired_size) {
		for (size_t ii = desired_size; ii < thread_data.size(); ++ii) {
			thread_data[ii].should_exit = true;
		}
		cv.notify_all();
		lock.unlock();
		for (size_t ii = desired_size; ii < thread_data.size(); ++ii) {
			thread_data[ii].thread.join();
		}
		lock.lock();
		thread_data.resize(desired_size);
	}
}

auto thread_pool_t::size() -> size_t {
	std::lock_guard<std::mutex> lock{mutex};
	return thread_data.size();
}

auto thread_pool_t::new_thread(std::lock_guard<std::mutex>& /*lock*/) -> size_t {
	thread_data.emplace_back();
	auto& data = thread_data.back();
	data.thread = std::thread{[this, &data]() {
		std::unique_lock<std::mutex> lock{mutex};
		while (true) {
			if (pending.empty()) {
				if (data.should_exit) {
					break;
				}
				cv.wait(lock);
			} else {
				data.task = std::move(pending.front());
				pending.pop_front();
				++busy;
				lock.unlock();
				data.task();
				data.task = nullptr;
				lock.lock();
				--busy;
			}
		}
	}};
	return thread_data.size() - 1;
}

} // namespace codejail
