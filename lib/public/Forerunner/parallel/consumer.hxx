#pragma once

#include <Forerunner/parallel/shared_fifo.hxx>

#include <memory>

namespace Forerunner::Parallel {
	/**
	 * @class Consumer
	 * @brief Read-only interface for consuming items from a shared FIFO buffer.
	 *
	 * @par Overview
	 *  Consumer provides a read-only interface to a SharedFIFO buffer. Copies
	 *  share the same underlying buffer. Consumers can only be created through
	 *  a Producer instance.
	 *
	 * @par Thread safety
	 *  All operations are thread-safe as they delegate to the underlying
	 *  SharedFIFO which is fully thread-safe.
	 *
	 * @par Blocking behavior
	 *  - @ref Extract() returns immediately with the oldest item or an error.
	 *  - @ref Extract(std::stop_token) blocks until an item is available or the
	 *    buffer is closed, errored or stopped.
	 *
	 * @see Producer
	 */
	template<typename T>
	class Consumer final {
		template<typename> friend class Producer;
		public:
			Consumer(const Consumer&) = default;
			Consumer& operator=(const Consumer&) = default;
			Consumer(Consumer&&) = default;
			Consumer& operator=(Consumer&&) = default;
			~Consumer() = default;

			/**
			 * @brief Number of queued items.
			 * @see SharedFIFO::Size()
			 */
			inline std::size_t Size() const noexcept { return m_buffer->Size(); }

			/**
			 * @brief Check if no item is queued.
			 */
			inline bool Empty() const noexcept { return m_buffer->Empty(); }

			/**
			 * @brief Discard every queued item. Affects all handles sharing this buffer.
			 */
			inline void Clear() noexcept { m_buffer->Clear(); }

			/**
			 * @brief Non-blocking extract of the oldest item.
			 * @see SharedFIFO::Extract()
			 */
			inline ExpectedItem<T, InsufficientData> Extract() { return m_buffer->Extract(); }

			/**
			 * @brief Extract the oldest item, blocking until one is available.
			 * @see SharedFIFO::Extract(std::stop_token)
			 */
			inline ExpectedItem<T, InsufficientData> Extract(std::stop_token token) { return m_buffer->Extract(token); }

			/**
			 * @brief Extract the oldest item, waiting at most @p timeout.
			 * @see SharedFIFO::Extract(std::stop_token, std::chrono::milliseconds)
			 */
			inline ExpectedItem<T, InsufficientData> Extract(std::stop_token token, std::chrono::milliseconds timeout) {
				return m_buffer->Extract(token, timeout);
			}

			/**
			 * @brief Check if the buffer is readable (not in error state).
			 */
			inline bool IsReadable() const noexcept { return m_buffer->IsReadable(); }

			/**
			 * @brief Check if the buffer is writable (not closed and not in error state).
			 * @details While a consumer cannot write, it tells whether more items may still arrive.
			 */
			inline bool IsWritable() const noexcept { return m_buffer->IsWritable(); }

			/**
			 * @brief Check if the reader has reached end-of-file.
			 * @return true if errored, or closed with nothing left to extract.
			 */
			inline bool EoF() const noexcept { return m_buffer->EoF(); }

			/** @brief Capacity of the underlying buffer. */
			inline std::size_t Capacity() const noexcept { return m_buffer->Capacity(); }

			/** @brief Highest number of items ever queued at once. */
			inline std::size_t PeakSize() const noexcept { return m_buffer->PeakSize(); }

		private:
			/** @brief Shared pointer to the underlying thread-safe FIFO buffer. */
			std::shared_ptr<SharedFIFO<T>> m_buffer;

			/**
			 * @brief Construct a Consumer with an existing SharedFIFO buffer.
			 * @details Only accessible by Producer; use Producer::Consumer() to obtain one.
			 */
			inline Consumer(std::shared_ptr<SharedFIFO<T>> buffer): m_buffer(std::move(buffer)) {}
	};
}
