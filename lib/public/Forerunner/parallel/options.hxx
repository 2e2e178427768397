#pragma once

#include <Forerunner/parallel/typedefs.hxx>

#include <chrono>
#include <cstddef>
#include <stop_token>

namespace Forerunner::Parallel {
	/**
	 * @struct Options
	 * @brief Configuration of a @ref Preprocessor.
	 *
	 * @par Limits
	 *  @c max_threads bounds how many items are transformed at once, while
	 *  @c max_preprocessed bounds how many items may be in flight (being
	 *  transformed or transformed but not yet consumed). A small worker count
	 *  can still stage a larger backlog, and a large worker count cannot flood
	 *  memory with unconsumed results.
	 *
	 * @par Buffer capacity
	 *  The result buffer holds @c max_preprocessed + 1 items, leaving one slot of
	 *  slack so a worker can publish right after the consumer gives a token back.
	 *  Set @c strict_capacity to size it at exactly @c max_preprocessed.
	 */
	struct FORERUNNER_PARALLEL_PUBLIC Options {
		std::size_t max_threads = 1;										///< Number of workers, at least 1
		int max_preprocessed = -1;											///< In-flight limit; < 1 means max_threads
		std::chrono::milliseconds idle_poll_interval { 200 };				///< Longest single consumer wait
		FaultPolicy fault_policy = FaultPolicy::Abort;						///< Transform error handling
		ExecutionMode mode = ExecutionMode::Async;							///< Threaded or inline
		bool strict_capacity = false;										///< Drop the extra buffer slot
		std::stop_token stop_token;											///< Caller cancellation
		Log logger;															///< Fault sink, may be null

		/**
		 * @brief In-flight limit after default resolution.
		 * @return @c max_preprocessed, or @c max_threads when it is lower than 1.
		 */
		std::size_t ResolvedMaxPreprocessed() const noexcept;

		/**
		 * @brief Capacity of the result buffer.
		 * @return ResolvedMaxPreprocessed() + 1, or ResolvedMaxPreprocessed() with strict capacity.
		 */
		std::size_t BufferCapacity() const noexcept;

		/**
		 * @brief Check the options are usable.
		 * @throw InvalidOptions when @c max_threads is 0 or the poll interval is not positive.
		 */
		void Validate() const;
	};
}
