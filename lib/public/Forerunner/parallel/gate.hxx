#pragma once

#include <Forerunner/parallel/visibility.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace Forerunner::Parallel {
	/**
	 * @class Gate
	 * @brief Counting concurrency limiter with cancellable waits.
	 *
	 * @par Overview
	 *  A Gate hands out at most @ref Capacity() tokens. @ref Acquire() takes one,
	 *  blocking while none is left; @ref Release() gives one back and never blocks.
	 *  The preprocessor uses one Gate to bound the number of items in flight and
	 *  a second one inside @ref SharedFIFO to bound its queued items.
	 *
	 * @par Cancellation
	 *  A blocked @ref Acquire() wakes as soon as its @c std::stop_token is stopped
	 *  or the gate is closed with @ref Close(), and reports the abort by returning
	 *  @c false. Cancellation never throws.
	 *
	 * @par Thread safety
	 *  All member functions are thread-safe. The token counter is atomic; the
	 *  mutex and condition variable are used only to park waiters.
	 */
	class FORERUNNER_PARALLEL_PUBLIC Gate final {
		public:
			/**
			 * @brief Construct a gate with all tokens available.
			 * @param capacity Number of tokens.
			 */
			explicit Gate(std::size_t capacity) noexcept;

			Gate(const Gate&) = delete;
			Gate& operator=(const Gate&) = delete;
			Gate(Gate&&) = delete;
			Gate& operator=(Gate&&) = delete;

			~Gate() = default;

			/**
			 * @brief Take one token, blocking until one is available.
			 * @param token Stop token observed while waiting.
			 * @return true if a token was taken, false if stopped or closed first.
			 */
			bool Acquire(std::stop_token token = {});

			/**
			 * @brief Take one token without blocking.
			 * @return true if a token was taken.
			 */
			bool TryAcquire() noexcept;

			/**
			 * @brief Give one token back and wake a waiter.
			 * @return false if every token was already available (nothing released).
			 */
			bool Release() noexcept;

			/**
			 * @brief Abort every current and future @ref Acquire().
			 * @details Tokens can still be released after closing.
			 */
			void Close() noexcept;

			/** @brief Total number of tokens. */
			inline std::size_t Capacity() const noexcept { return m_capacity; }

			/** @brief Tokens currently available. */
			std::size_t Available() const noexcept;

			/** @brief Tokens currently held. */
			std::size_t InUse() const noexcept;

			/** @brief Highest number of tokens held at the same time. */
			std::size_t Peak() const noexcept;

			/** @brief Whether @ref Close() was called. */
			bool IsClosed() const noexcept;

		private:
			void UpdatePeak(std::size_t in_use) noexcept;

			const std::size_t m_capacity;
			std::atomic<std::size_t> m_available;
			std::atomic<std::size_t> m_peak;
			std::atomic<bool> m_closed;

			/** @brief Guards waiter parking only, never the counter. */
			mutable std::mutex m_mutex;
			mutable std::condition_variable_any m_cv;
	};
}
