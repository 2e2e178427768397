#pragma once

#include <Forerunner/parallel/visibility.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

namespace Forerunner::Parallel {
	/**
	 * @class WorkerGroup
	 * @brief Fixed set of threads that report their own exit.
	 *
	 * @details Each thread runs the body given to @ref Launch() with its index.
	 *          However the body returns, the thread increments the exited counter
	 *          exactly once and counts down a latch, so @ref WaitExited() returns
	 *          right after the last one finishes, without polling.
	 *          Threads are joined by @ref Join() or, at the latest, by the destructor.
	 */
	class FORERUNNER_PARALLEL_PUBLIC WorkerGroup final {
		public:
			using Body = std::function<void(std::size_t)>;

			/**
			 * @brief Construct a group of @p size workers; nothing runs until Launch().
			 */
			explicit WorkerGroup(std::size_t size);

			WorkerGroup(const WorkerGroup&) = delete;
			WorkerGroup& operator=(const WorkerGroup&) = delete;
			WorkerGroup(WorkerGroup&&) = delete;
			WorkerGroup& operator=(WorkerGroup&&) = delete;

			~WorkerGroup() noexcept;

			/**
			 * @brief Start every worker thread on @p body.
			 * @details Only the first call has any effect.
			 */
			void Launch(const Body& body);

			/** @brief Block until every worker has exited. */
			void WaitExited() const;

			/** @brief Join every worker thread. Safe to call more than once. */
			void Join();

			/** @brief Number of workers. */
			inline std::size_t Size() const noexcept { return m_size; }

			/** @brief Number of workers that have exited. */
			inline std::size_t Exited() const noexcept { return m_exited.load(); }

			/** @brief Number of workers that have not exited yet. */
			inline std::size_t Running() const noexcept { return m_size - m_exited.load(); }

		private:
			void Exit() noexcept;

			const std::size_t m_size;
			std::vector<std::thread> m_threads;
			std::atomic<std::size_t> m_exited;
			mutable std::latch m_latch;
			std::mutex m_join_mutex;
	};
}
