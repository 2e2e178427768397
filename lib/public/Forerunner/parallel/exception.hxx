#pragma once

#include <Forerunner/parallel/visibility.h>
#include <StormByte/exception.hxx>

#include <cstddef>
#include <string>

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
	 * @class Exception
	 * @brief Base class for every exception raised by the Parallel components.
	 */
	class FORERUNNER_PARALLEL_PUBLIC Exception: public StormByte::Exception {
		public:
			/**
			 * @brief Construct with a message.
			 * @param message Human readable description.
			 */
			Exception(const std::string& message);
	};

	/**
	 * @class InsufficientData
	 * @brief No item could be extracted from a buffer.
	 * @details Returned (not thrown) by @ref FIFO::Extract and @ref SharedFIFO::Extract
	 *          when the buffer is empty, closed and drained, or in error state.
	 */
	class FORERUNNER_PARALLEL_PUBLIC InsufficientData final: public Exception {
		public:
			InsufficientData(const std::string& message);
	};

	/**
	 * @class InvalidOptions
	 * @brief Thrown when a preprocessor is configured with unusable @ref Options.
	 */
	class FORERUNNER_PARALLEL_PUBLIC InvalidOptions final: public Exception {
		public:
			InvalidOptions(const std::string& message);
	};

	/**
	 * @class TransformFault
	 * @brief A transform function failed while processing one item.
	 *
	 * @details Under @ref FaultPolicy::Abort the first fault stops the whole
	 *          pipeline and is thrown to the consumer on its next pull.
	 */
	class FORERUNNER_PARALLEL_PUBLIC TransformFault final: public Exception {
		public:
			/**
			 * @brief Construct a transform fault.
			 * @param worker Index of the worker whose transform failed.
			 * @param reason Message of the original error.
			 */
			TransformFault(std::size_t worker, const std::string& reason);

			/** @brief Index of the worker that observed the fault. */
			inline std::size_t Worker() const noexcept { return m_worker; }

			/** @brief Message of the original error, without decoration. */
			inline const std::string& Reason() const noexcept { return m_reason; }

		private:
			std::size_t m_worker;
			std::string m_reason;
	};
}
