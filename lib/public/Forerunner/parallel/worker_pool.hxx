#pragma once

#include <Forerunner/parallel/fault_slot.hxx>
#include <Forerunner/parallel/gate.hxx>
#include <Forerunner/parallel/log_sink.hxx>
#include <Forerunner/parallel/producer.hxx>
#include <Forerunner/parallel/shared_cursor.hxx>
#include <Forerunner/parallel/worker_group.hxx>

#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace Forerunner::Parallel {
	/**
	 * @class WorkerPool
	 * @brief Fixed pool of workers transforming source items ahead of consumption.
	 *
	 * @par Worker loop
	 *  Each worker repeats until told to stop:
	 *   1. take an admission token from the @ref Gate (blocking),
	 *   2. claim the next item from the @ref SharedCursor,
	 *   3. run the transform on it,
	 *   4. publish the result through its @ref Producer (blocking while full).
	 *  The admission token stays held until the consumer extracts the result.
	 *  It is given back right away when the source is exhausted, the transform
	 *  fails, or the publish is refused.
	 *
	 * @par Faults
	 *  A failure while reading the source item, transforming it or publishing
	 *  the result never kills its thread. With
	 *  FaultPolicy::Abort the fault is stored in the @ref FaultSlot, the pipeline
	 *  stop source is triggered and the buffer is put in error state. With
	 *  FaultPolicy::Skip the fault is logged, the item dropped and the worker
	 *  carries on.
	 *
	 * @tparam Range Source range type.
	 * @tparam TResult Transform result type.
	 */
	template<std::ranges::input_range Range, typename TResult>
	class WorkerPool final {
		public:
			using Cursor = SharedCursor<Range>;
			using Item = typename Cursor::Item;
			using Transform = TransformFunction<Item, TResult>;

			WorkerPool(std::size_t size, Transform transform, FaultPolicy policy,
					   std::shared_ptr<Gate> gate, std::shared_ptr<Cursor> cursor,
					   Producer<TResult> producer, std::shared_ptr<FaultSlot> fault,
					   std::stop_source stop, std::shared_ptr<LogSink> log):
			m_group(std::make_shared<WorkerGroup>(size)), m_transform(std::move(transform)), m_policy(policy),
			m_gate(std::move(gate)), m_cursor(std::move(cursor)), m_producer(std::move(producer)),
			m_fault(std::move(fault)), m_stop(std::move(stop)), m_log(std::move(log)) {}

			WorkerPool(const WorkerPool&) = delete;
			WorkerPool& operator=(const WorkerPool&) = delete;
			WorkerPool(WorkerPool&&) = delete;
			WorkerPool& operator=(WorkerPool&&) = delete;

			/**
			 * @brief Destructor; joins the workers, which must have been told to stop.
			 */
			~WorkerPool() noexcept {
				m_group->Join();
			}

			/** @brief Launch every worker. */
			void Start() {
				m_group->Launch([this](std::size_t id) { Run(id); });
			}

			/** @brief Worker threads, for the completion monitor. */
			inline std::shared_ptr<WorkerGroup> Group() const noexcept { return m_group; }

		private:
			void Run(std::size_t id) {
				const std::stop_token token = m_stop.get_token();
				m_log->Write(StormByte::Logger::Level::LowLevel, "Worker ", id, " started");

				while (!token.stop_requested()) {
					if (!m_gate->Acquire(token))
						break;

					// Reading the source, the transform and the publish may all throw
					try {
						std::optional<Item> item = m_cursor->Claim(token);
						if (!item) {
							m_gate->Release();
							break;
						}

						TResult result = m_transform(std::move(*item));
						if (!m_producer.Write(std::move(result), token)) {
							m_gate->Release();
							if (token.stop_requested())
								m_log->Write(StormByte::Logger::Level::LowLevel, "Worker ", id, ": publish aborted by cancellation");
							else
								m_log->Write(StormByte::Logger::Level::Error, "Worker ", id, ": failed to add item to result buffer");
							break;
						}
					}
					catch (const std::exception& e) {
						if (!Fault(id, e.what())) break;
					}
					catch (...) {
						if (!Fault(id, "unknown error")) break;
					}
				}

				m_log->Write(StormByte::Logger::Level::LowLevel, "Worker ", id, " exited");
			}

			// Returns whether the worker keeps going
			bool Fault(std::size_t id, const std::string& reason) {
				m_gate->Release();

				if (m_policy == FaultPolicy::Skip) {
					m_log->Write(StormByte::Logger::Level::Error, "Worker ", id, ": item dropped: ", reason);
					return true;
				}

				if (!m_fault->Capture(id, reason))
					m_log->Write(StormByte::Logger::Level::LowLevel, "Worker ", id, ": later fault ignored: ", reason);
				m_stop.request_stop();
				m_producer.SetError();
				return false;
			}

			std::shared_ptr<WorkerGroup> m_group;
			Transform m_transform;
			FaultPolicy m_policy;
			std::shared_ptr<Gate> m_gate;
			std::shared_ptr<Cursor> m_cursor;
			Producer<TResult> m_producer;
			std::shared_ptr<FaultSlot> m_fault;
			std::stop_source m_stop;
			std::shared_ptr<LogSink> m_log;
	};
}
