#pragma once

#include <Forerunner/parallel/log_sink.hxx>
#include <Forerunner/parallel/worker_group.hxx>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace Forerunner::Parallel {
	/**
	 * @class CompletionMonitor
	 * @brief Signals completion exactly once, after the last worker of a group exits.
	 *
	 * @par Overview
	 *  Workers finish at unpredictable times and completion must be signaled
	 *  after the last one, not the first. The monitor runs one thread that
	 *  blocks on the group's exit latch, joins the worker threads and finally
	 *  runs the completion action (for a preprocessor: closing the result
	 *  buffer).
	 *
	 * @par Thread safety
	 *  @ref Start() and @ref Join() are meant to be called from the owning
	 *  thread; the observers are thread-safe.
	 */
	class FORERUNNER_PARALLEL_PUBLIC CompletionMonitor final {
		public:
			using Action = std::function<void()>;

			/**
			 * @brief Construct a monitor for @p group.
			 * @param group Workers to watch.
			 * @param on_complete Action run once all workers are joined.
			 * @param log Sink for the completion line.
			 */
			CompletionMonitor(std::shared_ptr<WorkerGroup> group, Action on_complete, std::shared_ptr<LogSink> log);

			CompletionMonitor(const CompletionMonitor&) = delete;
			CompletionMonitor& operator=(const CompletionMonitor&) = delete;
			CompletionMonitor(CompletionMonitor&&) = delete;
			CompletionMonitor& operator=(CompletionMonitor&&) = delete;

			/**
			 * @brief Destructor; waits for the monitor thread.
			 */
			~CompletionMonitor() noexcept;

			/** @brief Start watching. Only the first call has any effect. */
			void Start();

			/** @brief Wait until the completion action has run. */
			void Join();

			/** @brief Whether the completion action has run. */
			inline bool IsCompleted() const noexcept { return m_completed.load(); }

		private:
			void Watch();

			std::shared_ptr<WorkerGroup> m_group;
			Action m_on_complete;
			std::shared_ptr<LogSink> m_log;
			std::thread m_thread;
			std::atomic<bool> m_completed;
	};
}
