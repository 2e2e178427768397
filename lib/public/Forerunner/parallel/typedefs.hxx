#pragma once

#include <Forerunner/parallel/exception.hxx>
#include <StormByte/expected.hxx>
#include <StormByte/logger.hxx>

#include <cstdint>
#include <functional>
#include <memory>

/**
 * @namespace Parallel
 * @brief Namespace for the bounded parallel preprocessing components of Forerunner.
 *
 * The Parallel namespace provides the admission gate, the shared source cursor,
 * the bounded result buffer with its producer/consumer handles, the worker pool,
 * the completion monitor and the preprocessor that ties them together.
 */
namespace Forerunner::Parallel {
	/** @brief Forward declaration of Consumer class template. */
	template<typename T> class Consumer;

	/** @brief Forward declaration of Producer class template. */
	template<typename T> class Producer;

	/**
	 * @brief Type alias for Expected containing one buffered item.
	 * @tparam T Item type.
	 * @tparam Exception The exception type to use for error cases.
	 *
	 * @details Result of buffer extract operations: either the extracted item, or
	 *          an exception wrapped in std::unexpected (e.g. InsufficientData).
	 *
	 * @see Expected, InsufficientData
	 */
	template<typename T, class Exception>
	using ExpectedItem = StormByte::Expected<T, Exception>;

	/**
	 * @brief Type alias for the per-item transform run by the workers.
	 * @details Called synchronously, once per claimed source item, possibly from
	 *          several worker threads at the same time.
	 */
	template<typename T, typename TResult>
	using TransformFunction = std::function<TResult(T)>;

	/** @brief Shared logger handle, as handed around by every StormByte component. */
	using Log = std::shared_ptr<StormByte::Logger>;

	/**
	 * @brief Execution mode selector for preprocessing.
	 *
	 * @details
	 *  - ExecutionMode::Async : items are transformed ahead of consumption by a
	 *                           pool of worker threads (default).
	 *  - ExecutionMode::Sync  : no threads are started; each pull claims and
	 *                           transforms one item in the caller's thread.
	 *
	 * @note Sync gives deterministic ordering and simplifies debugging.
	 */
	enum class FORERUNNER_PARALLEL_PUBLIC ExecutionMode {
		Sync,   ///< Transform inline on the consumer thread.
		Async   ///< Transform ahead of consumption on worker threads.
	};

	/**
	 * @brief What to do when a transform raises an error.
	 */
	enum class FORERUNNER_PARALLEL_PUBLIC FaultPolicy {
		Abort,  ///< Stop the pipeline and throw TransformFault to the consumer.
		Skip    ///< Log the fault, drop the item and keep going.
	};

	/**
	 * @brief Lifecycle of a preprocessor.
	 */
	enum class FORERUNNER_PARALLEL_PUBLIC State: std::uint8_t {
		Idle,       ///< Constructed, workers not started yet.
		Running,    ///< Workers are claiming items from the source.
		Draining,   ///< Source exhausted; remaining results are being delivered.
		Completed   ///< Everything delivered, or stopped by cancellation or fault.
	};
}
