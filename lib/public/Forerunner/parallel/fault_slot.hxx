#pragma once

#include <Forerunner/parallel/exception.hxx>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace Forerunner::Parallel {
	/**
	 * @class FaultSlot
	 * @brief Holds the first transform fault raised by any worker.
	 *
	 * @details Workers record a failing transform with @ref Capture(); only the
	 *          first fault is kept. The consumer checks @ref HasFault() on each
	 *          pull and rethrows it with @ref Throw().
	 */
	class FORERUNNER_PARALLEL_PUBLIC FaultSlot final {
		public:
			FaultSlot() noexcept;

			FaultSlot(const FaultSlot&) = delete;
			FaultSlot& operator=(const FaultSlot&) = delete;
			FaultSlot(FaultSlot&&) = delete;
			FaultSlot& operator=(FaultSlot&&) = delete;
			~FaultSlot() = default;

			/**
			 * @brief Record a fault unless one is already stored.
			 * @param worker Index of the failing worker.
			 * @param reason Message of the original error.
			 * @return true if this fault was stored, false if an earlier one wins.
			 */
			bool Capture(std::size_t worker, const std::string& reason);

			/** @brief Whether a fault has been recorded. */
			bool HasFault() const noexcept;

			/**
			 * @brief Throw the recorded fault.
			 * @throw TransformFault always when a fault is recorded; does nothing otherwise.
			 */
			void Throw() const;

		private:
			std::atomic<bool> m_has_fault;
			mutable std::mutex m_mutex;
			std::optional<TransformFault> m_fault;
	};
}
