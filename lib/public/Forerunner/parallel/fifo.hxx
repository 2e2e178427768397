#pragma once

#include <Forerunner/parallel/typedefs.hxx>

#include <cstddef>
#include <deque>
#include <utility>

/**
 * @namespace Parallel
 * @brief Namespace for the bounded parallel preprocessing components of Forerunner.
 *
 * The Parallel namespace provides the admission gate, the shared source cursor,
 * the bounded result buffer with its producer/consumer handles, the worker pool,
 * the completion monitor and the preprocessor that ties them together.
 */
namespace Forerunner::Parallel {
	/**
	 * @class FIFO
	 * @brief Item-oriented FIFO queue with closed and error states.
	 *
	 * @par Overview
	 *  A first-in first-out queue of @c T implemented atop @c std::deque<T>.
	 *  Items leave the queue in the order they were written. Writing can be
	 *  stopped with @ref Close() (queued items stay readable) or with
	 *  @ref SetError() (nothing is readable any more).
	 *
	 * @par Thread safety
	 *  This class is **not thread-safe**. For concurrent access, use @ref SharedFIFO.
	 *
	 * @see SharedFIFO for thread-safe version
	 * @see Producer and Consumer for the producer-consumer handles
	 */
	template<typename T>
	class FIFO {
		public:
			/**
			 * 	@brief Construct an empty, writable FIFO.
			 */
			FIFO() noexcept: m_items(), m_closed(false), m_error(false) {}

			FIFO(const FIFO& other)					= default;
			FIFO(FIFO&& other) noexcept				= default;
			FIFO& operator=(const FIFO& other)		= default;
			FIFO& operator=(FIFO&& other) noexcept	= default;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~FIFO() = default;

			/**
			 * @brief Number of queued items.
			 * @see Empty()
			 */
			virtual std::size_t Size() const noexcept {
				return m_items.size();
			}

			/**
			 * @brief Check if no item is queued.
			 * @see Size()
			 */
			virtual bool Empty() const noexcept {
				return m_items.empty();
			}

			/**
			 * @brief Discard every queued item.
			 * @details Closed and error states are kept.
			 */
			virtual void Clear() noexcept {
				m_items.clear();
			}

			/**
			 * @brief Close the FIFO for further writes.
			 * @details Subsequent Write() calls are refused. Queued items stay readable
			 *          until all of them have been extracted. Closing twice is harmless.
			 * @see IsWritable(), SetError()
			 */
			virtual void Close() noexcept {
				m_closed = true;
			}

			/**
			 * @brief Mark the FIFO as erroneous, making it unreadable and unwritable.
			 * @see IsReadable(), IsWritable(), EoF()
			 */
			virtual void SetError() noexcept {
				m_error = true;
			}

			/**
			 * @brief Append one item.
			 * @param item Item to move into the queue.
			 * @return true if written, false if closed or in error state.
			 */
			virtual bool Write(T item) {
				if (!FIFO::IsWritable()) return false;
				m_items.push_back(std::move(item));
				return true;
			}

			/**
			 * @brief Remove and return the oldest item.
			 * @return The item, or InsufficientData when the queue is empty or unreadable.
			 * @note This class is not thread-safe. For blocking behavior, see SharedFIFO::Extract().
			 */
			virtual ExpectedItem<T, InsufficientData> Extract() {
				if (m_error)
					return StormByte::Unexpected(InsufficientData("FIFO is not readable"));

				if (m_items.empty())
					return StormByte::Unexpected(InsufficientData("No item to extract"));

				T item = std::move(m_items.front());
				m_items.pop_front();
				return item;
			}

			/**
			 * @brief Check if the FIFO is readable (not in error state).
			 */
			virtual bool IsReadable() const noexcept { return !m_error; }

			/**
			 * @brief Check if the FIFO is writable (not closed and not in error state).
			 */
			virtual bool IsWritable() const noexcept { return !m_closed && !m_error; }

			/**
			 * @brief Check if the reader has reached end-of-file.
			 * @return true when in error state, or when closed and no item is left.
			 */
			virtual bool EoF() const noexcept { return m_error || (m_closed && m_items.empty()); }

		protected:
			/** @brief Internal deque storing the queued items. */
			std::deque<T> m_items;

			/** @brief Whether the FIFO is closed for further writes. */
			bool m_closed;

			/** @brief Whether the FIFO is in error state. */
			bool m_error;
	};
}
