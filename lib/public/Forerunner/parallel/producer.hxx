#pragma once

#include <Forerunner/parallel/consumer.hxx>

namespace Forerunner::Parallel {
	/**
	 * @class Producer
	 * @brief Producer interface for writing items to a shared FIFO buffer.
	 *
	 * @par Overview
	 *  Producer provides a write-only interface to a capacity-bounded SharedFIFO.
	 *  Copies share the same underlying buffer, so every worker of a pool can
	 *  hold its own Producer and publish concurrently.
	 *
	 * @par Thread safety
	 *  All write operations are thread-safe as they delegate to the underlying
	 *  SharedFIFO which is fully thread-safe.
	 */
	template<typename T>
	class Producer final {
		public:
			/**
			 * @brief Construct a Producer with a new SharedFIFO buffer.
			 * @param capacity Maximum number of queued items.
			 */
			explicit Producer(std::size_t capacity): m_buffer(std::make_shared<SharedFIFO<T>>(capacity)) {}

			/**
			 * @brief Construct a Producer sharing a Consumer's buffer.
			 */
			Producer(const Parallel::Consumer<T>& consumer): m_buffer(consumer.m_buffer) {}

			Producer(const Producer&) = default;
			Producer& operator=(const Producer&) = default;
			Producer(Producer&&) = default;
			Producer& operator=(Producer&&) = default;
			~Producer() = default;

			/**
			 * @brief Close the buffer for further writes.
			 * @details Queued items remain readable. Wakes waiting consumers.
			 * @see SharedFIFO::Close()
			 */
			inline void Close() noexcept { m_buffer->Close(); }

			/**
			 * @brief Mark the buffer as erroneous, making it unreadable and unwritable.
			 * @details Wakes all waiting threads.
			 * @see SharedFIFO::SetError()
			 */
			inline void SetError() noexcept { m_buffer->SetError(); }

			/**
			 * @brief Check if the buffer is writable (not closed and not in error state).
			 */
			inline bool IsWritable() const noexcept { return m_buffer->IsWritable(); }

			/**
			 * @brief Write one item, blocking while the buffer is full.
			 * @see SharedFIFO::Write(T)
			 */
			inline bool Write(T item) { return m_buffer->Write(std::move(item)); }

			/**
			 * @brief Write one item, blocking while the buffer is full or until stopped.
			 * @see SharedFIFO::Write(T, std::stop_token)
			 */
			inline bool Write(T item, std::stop_token token) { return m_buffer->Write(std::move(item), token); }

			/**
			 * @brief Create a Consumer for reading from this Producer's buffer.
			 * @return A Consumer instance sharing the underlying buffer.
			 */
			inline Parallel::Consumer<T> Consumer() const {
				return { m_buffer };
			}

		private:
			/** @brief Shared pointer to the underlying thread-safe FIFO buffer. */
			std::shared_ptr<SharedFIFO<T>> m_buffer;
	};
}
