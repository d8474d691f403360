#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <type_traits>

namespace codejail {
namespace detail {

template <class Lockable, bool Waitable>
class lock_holder_t;

// Condition variable storage, only present for waitable resources
template <bool Waitable>
class condition_variable_holder_t {};

template <>
class condition_variable_holder_t<true> {
	template <class, bool> friend class lock_holder_t;

	public:
		void notify_one() {
			cv.notify_one();
		}

		void notify_all() {
			cv.notify_all();
		}

	private:
		mutable std::condition_variable cv;
};

// Holds the lock and provides pointer semantics to the guarded resource
template <class Lockable, bool Waitable>
class lock_holder_t {
	public:
		explicit lock_holder_t(Lockable& lockable) : lockable{lockable}, lock{lockable.mutex} {}

		auto operator*() -> auto& { return lockable.resource; }
		auto operator*() const -> auto& { return lockable.resource; }
		auto operator->() { return &lockable.resource; }
		auto operator->() const { return &lockable.resource; }

		template <bool Enable = Waitable, std::enable_if_t<Enable, int> = 0>
		void wait() {
			lockable.cv.wait(lock);
		}

		// Returns false if `deadline` passed without a notification
		template <class Clock, class Duration, bool Enable = Waitable, std::enable_if_t<Enable, int> = 0>
		auto wait_until(const std::chrono::time_point<Clock, Duration>& deadline) -> bool {
			return lockable.cv.wait_until(lock, deadline) == std::cv_status::no_timeout;
		}

	private:
		Lockable& lockable;
		std::unique_lock<std::mutex> lock;
};

// Holds resource and mutex
template <class Type, bool Waitable>
class lockable_impl_t : public condition_variable_holder_t<Waitable> {
	template <class, bool> friend class lock_holder_t;

	public:
		lockable_impl_t() = default;
		template <class... Args>
		explicit lockable_impl_t(Args&&... args) : resource{std::forward<Args>(args)...} {}
		lockable_impl_t(const lockable_impl_t&) = delete;
		~lockable_impl_t() = default;
		auto operator=(const lockable_impl_t&) = delete;

		auto read() const {
			return lock_holder_t<const lockable_impl_t, Waitable>{*this};
		}

		auto write() {
			return lock_holder_t<lockable_impl_t, Waitable>{*this};
		}

	private:
		Type resource{};
		mutable std::mutex mutex;
};

} // namespace detail

/**
 * A resource which can only be reached through a lock. `Waitable` resources also carry a condition
 * variable which lock holders can wait on.
 */
template <class Type, bool Waitable = false>
using lockable_t = detail::lockable_impl_t<Type, Waitable>;

} // namespace codejail
