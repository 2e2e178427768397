#pragma once

#include <Forerunner/parallel/fifo.hxx>
#include <Forerunner/parallel/gate.hxx>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace Forerunner::Parallel {
	/**
	 * @class SharedFIFO
	 * @brief Thread-safe, capacity-bounded FIFO built on top of @ref FIFO.
	 *
	 * @par Overview
	 *  SharedFIFO wraps the non-thread-safe @ref FIFO with a mutex and a
	 *  condition variable to hand items from many producer threads to a
	 *  consumer. Its capacity is enforced by its own @ref Gate: every queued
	 *  item holds one slot, taken by @ref Write() and given back by @ref Extract().
	 *
	 * @par Blocking semantics
	 *  - @ref Write(T, std::stop_token) blocks while the FIFO is full, until a
	 *    slot frees up, the FIFO is closed or errored, or the stop token fires.
	 *  - @ref Extract(std::stop_token) blocks until an item is queued, the FIFO
	 *    is closed or errored, or the stop token fires. The timed overload also
	 *    gives up after the given interval.
	 *
	 * @par Close behavior
	 *  @ref Close() marks the FIFO as complete and wakes every waiting thread.
	 *  It is idempotent and never reverts. Subsequent writes are refused; queued
	 *  items remain readable, and readers see @ref EoF() once they are drained.
	 *
	 * @par Thread safety
	 *  All public member functions of SharedFIFO are thread-safe.
	 */
	template<typename T>
	class SharedFIFO final: public FIFO<T> {
		public:
			/**
			 * @brief Construct a SharedFIFO holding at most @p capacity items.
			 */
			explicit SharedFIFO(std::size_t capacity) noexcept:
			FIFO<T>(), m_slots(capacity), m_peak(0) {}

			SharedFIFO(const SharedFIFO&) = delete;
			SharedFIFO& operator=(const SharedFIFO&) = delete;
			SharedFIFO(SharedFIFO&&) = delete;
			SharedFIFO& operator=(SharedFIFO&&) = delete;

			/**
			 * @brief Virtual destructor.
			 */
			virtual ~SharedFIFO() = default;

			/**
			 * @name Thread-safe overrides
			 * @{
			 */

			std::size_t Size() const noexcept override {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return FIFO<T>::Size();
			}

			bool Empty() const noexcept override {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return FIFO<T>::Empty();
			}

			/**
			 * @brief Thread-safe discard of every queued item; their slots are given back.
			 */
			void Clear() noexcept override {
				std::size_t discarded;
				{
					std::scoped_lock<std::mutex> lock(m_mutex);
					discarded = FIFO<T>::Size();
					FIFO<T>::Clear();
				}
				for (std::size_t i = 0; i < discarded; ++i)
					m_slots.Release();
			}

			/**
			 * @brief Thread-safe close for further writes.
			 * @details Wakes blocked readers and writers. Queued items stay readable.
			 */
			void Close() noexcept override {
				{
					std::scoped_lock<std::mutex> lock(m_mutex);
					this->m_closed = true;
				}
				m_cv.notify_all();
				m_slots.Close();
			}

			/**
			 * @brief Thread-safe error state setting.
			 * @details Wakes blocked readers and writers; nothing is readable afterwards.
			 */
			void SetError() noexcept override {
				{
					std::scoped_lock<std::mutex> lock(m_mutex);
					this->m_error = true;
				}
				m_cv.notify_all();
				m_slots.Close();
			}

			/**
			 * @brief Thread-safe write, blocking while the FIFO is full.
			 * @return true if written, false if closed or in error state.
			 */
			bool Write(T item) override {
				return Write(std::move(item), std::stop_token());
			}

			/**
			 * @brief Thread-safe non-blocking extract of the oldest item.
			 * @return The item, or InsufficientData if none is queued.
			 */
			ExpectedItem<T, InsufficientData> Extract() override {
				std::unique_lock<std::mutex> lock(m_mutex);
				return Take(lock);
			}

			bool IsReadable() const noexcept override {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return FIFO<T>::IsReadable();
			}

			bool IsWritable() const noexcept override {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return FIFO<T>::IsWritable();
			}

			bool EoF() const noexcept override {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return FIFO<T>::EoF();
			}
			/** @} */

			/**
			 * @brief Write one item, blocking while the FIFO is full.
			 * @param item Item to queue.
			 * @param token Stop token observed while waiting for a free slot.
			 * @return true if queued; false if the stop token fired first or the
			 *         FIFO was closed or errored. The item is dropped in that case.
			 */
			bool Write(T item, std::stop_token token) {
				if (!m_slots.Acquire(token))
					return false;

				bool written;
				try {
					std::scoped_lock<std::mutex> lock(m_mutex);
					written = FIFO<T>::Write(std::move(item));
					if (written)
						m_peak = std::max(m_peak, this->m_items.size());
				}
				catch (...) {
					m_slots.Release();
					throw;
				}

				if (!written) {
					m_slots.Release();
					return false;
				}
				m_cv.notify_all();
				return true;
			}

			/**
			 * @brief Extract the oldest item, blocking until one is queued.
			 * @param token Stop token observed while waiting.
			 * @return The item, or InsufficientData when woken by close, error or stop.
			 */
			ExpectedItem<T, InsufficientData> Extract(std::stop_token token) {
				std::unique_lock<std::mutex> lock(m_mutex);
				m_cv.wait(lock, token, [this] { return Ready(); });
				return Take(lock);
			}

			/**
			 * @brief Extract the oldest item, waiting at most @p timeout for one.
			 * @param token Stop token observed while waiting.
			 * @param timeout Longest time to wait.
			 * @return The item, or InsufficientData when none arrived in time or the
			 *         wait was ended by close, error or stop.
			 */
			ExpectedItem<T, InsufficientData> Extract(std::stop_token token, std::chrono::milliseconds timeout) {
				std::unique_lock<std::mutex> lock(m_mutex);
				m_cv.wait_for(lock, token, timeout, [this] { return Ready(); });
				return Take(lock);
			}

			/** @brief Maximum number of queued items. */
			inline std::size_t Capacity() const noexcept { return m_slots.Capacity(); }

			/** @brief Highest number of items ever queued at once. */
			std::size_t PeakSize() const noexcept {
				std::scoped_lock<std::mutex> lock(m_mutex);
				return m_peak;
			}

		private:
			/** @brief Predicate for waiting readers; call with the mutex held. */
			bool Ready() const noexcept {
				return this->m_error || this->m_closed || !this->m_items.empty();
			}

			/**
			 * @brief Extract under the caller's lock, then give the slot back.
			 * @param lock Held lock on @ref m_mutex; released before returning.
			 */
			ExpectedItem<T, InsufficientData> Take(std::unique_lock<std::mutex>& lock) {
				auto item = FIFO<T>::Extract();
				lock.unlock();
				if (item)
					m_slots.Release();
				return item;
			}

			/** @brief Capacity gate; one slot per queued item. */
			Gate m_slots;
			/** @brief Highest observed queue size. */
			std::size_t m_peak;
			/** @brief Internal mutex guarding all state mutations and reads. */
			mutable std::mutex m_mutex;
			/** @brief Condition variable used to block until data is available or closed. */
			mutable std::condition_variable_any m_cv;
	};
}
