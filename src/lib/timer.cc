#include "timer.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

namespace codejail {

/**
 * Contains data on a timer. This is shared between the timer_t handle and the timer thread.
 */
struct timer_data_t {
	timer_data_t(std::chrono::steady_clock::time_point timeout, timer_t::callback_t callback) :
		callback{std::move(callback)}, timeout{timeout} {}

	struct cmp {
		auto operator()(const std::shared_ptr<timer_data_t>& left, const std::shared_ptr<timer_data_t>& right) const {
			return left->timeout > right->timeout;
		}
	};

	timer_t::callback_t callback;
	std::chrono::steady_clock::time_point timeout;
	bool is_alive = true;
	bool is_running = false;
};

namespace {

/**
 * Kept in a shared_ptr so the detached timer thread can outlive static destruction.
 */
struct shared_state_t {
	std::priority_queue<
		std::shared_ptr<timer_data_t>,
		std::deque<std::shared_ptr<timer_data_t>>,
		timer_data_t::cmp
	> queue;
	std::condition_variable cv;
	std::condition_variable finished_cv;
	std::mutex mutex;
	bool has_thread = false;
};
auto global_shared_state = std::make_shared<shared_state_t>();

void timer_thread_entry(std::shared_ptr<shared_state_t> state) {
	std::unique_lock<std::mutex> lock{state->mutex};
	while (true) {
		if (state->queue.empty()) {
			state->cv.wait(lock);
			continue;
		}
		auto next = state->queue.top();
		if (!next->is_alive) {
			state->queue.pop();
			continue;
		}
		if (std::chrono::steady_clock::now() < next->timeout) {
			// Woken early if a sooner timer is pushed
			state->cv.wait_until(lock, next->timeout);
			continue;
		}
		state->queue.pop();
		next->is_running = true;
		auto callback = std::exchange(next->callback, {});
		lock.unlock();
		callback();
		callback = nullptr;
		lock.lock();
		next->is_running = false;
		state->finished_cv.notify_all();
	}
}

void start_timer(std::shared_ptr<timer_data_t> data) {
	auto state = global_shared_state;
	std::lock_guard<std::mutex> lock{state->mutex};
	state->queue.push(std::move(data));
	if (!state->has_thread) {
		state->has_thread = true;
		std::thread thread{timer_thread_entry, state};
		thread.detach();
	}
	state->cv.notify_one();
}

} // anonymous namespace

/**
 * timer_t implementation
 */
timer_t::timer_t(uint32_t ms, callback_t callback) :
		data{std::make_shared<timer_data_t>(
			std::chrono::steady_clock::now() + std::chrono::milliseconds{ms}, std::move(callback))} {
	start_timer(data);
}

timer_t::~timer_t() {
	std::unique_lock<std::mutex> lock{global_shared_state->mutex};
	data->is_alive = false;
	// Drop captures now instead of whenever the dead entry reaches the front of the queue
	auto callback = std::exchange(data->callback, {});
	while (data->is_running) {
		global_shared_state->finished_cv.wait(lock);
	}
	lock.unlock();
}

void timer_t::wait_detached(uint32_t ms, callback_t callback) {
	start_timer(std::make_shared<timer_data_t>(
		std::chrono::steady_clock::now() + std::chrono::milliseconds{ms}, std::move(callback)));
}

} // namespace codejail
