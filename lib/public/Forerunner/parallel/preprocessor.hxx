#pragma once

#include <Forerunner/parallel/completion_monitor.hxx>
#include <Forerunner/parallel/options.hxx>
#include <Forerunner/parallel/worker_pool.hxx>

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
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
	 * @class Preprocessor
	 * @brief Transforms a source range on a bounded pool of workers, ahead of consumption.
	 *
	 * @par Overview
	 *  Up to @c max_threads items are transformed concurrently, before and while
	 *  the caller consumes the results. At most @c max_preprocessed items are in
	 *  flight at any time (being transformed, or transformed but not yet
	 *  consumed). The results are exposed as a single-pass input range:
	 *  @code{.cpp}
	 *  std::vector<std::string> files = ...;
	 *  Options options;
	 *  options.max_threads = 4;
	 *  for (auto& image : Preprocess(files, LoadImage, options))
	 *      Render(image);
	 *  @endcode
	 *
	 * @par Ordering
	 *  Items are claimed from the source in order, but results are delivered in
	 *  the order the transforms finish. Only one worker (or ExecutionMode::Sync)
	 *  preserves source order.
	 *
	 * @par Lifecycle
	 *  Workers and the completion monitor start in the constructor
	 *  (State::Idle to State::Running). Once the source is exhausted the state is
	 *  State::Draining; it becomes State::Completed when the consumer has drained
	 *  the buffer, or right away on cancellation or an aborting fault. The
	 *  results can be iterated only once; build a new Preprocessor per source.
	 *
	 * @par Cancellation
	 *  The stop token in @ref Options is observed at every wait and on every
	 *  pull: iteration ends cleanly and no further item is claimed. @ref Cancel()
	 *  and the destructor stop the workers, discard buffered results and wait
	 *  for every thread. A transform that ignores cancellation delays that wait
	 *  until it returns.
	 *
	 * @warning An lvalue source range is referenced, not copied: it must outlive
	 *          the Preprocessor. Rvalue ranges are moved in.
	 *
	 * @tparam Range Source range type as deduced by a forwarding reference.
	 * @tparam TResult Transform result type.
	 *
	 * @see Options, Preprocess()
	 */
	template<std::ranges::input_range Range, typename TResult>
	class Preprocessor final {
		public:
			using Cursor = SharedCursor<Range>;
			using Item = typename Cursor::Item;
			using Transform = TransformFunction<Item, TResult>;
			using Pool = WorkerPool<Range, TResult>;

			/**
			 * @class Iterator
			 * @brief Single-pass input iterator over the preprocessed results.
			 * @details Incrementing pulls the next result, blocking until one is
			 *          available; it throws TransformFault under FaultPolicy::Abort.
			 */
			class Iterator final {
				public:
					using iterator_concept = std::input_iterator_tag;
					using iterator_category = std::input_iterator_tag;
					using difference_type = std::ptrdiff_t;
					using value_type = TResult;

					Iterator() noexcept: m_owner(nullptr) {}
					explicit Iterator(Preprocessor* owner) noexcept: m_owner(owner) {}

					TResult& operator*() const { return *m_owner->m_current; }
					TResult* operator->() const { return std::addressof(*m_owner->m_current); }

					Iterator& operator++() {
						m_owner->Advance();
						return *this;
					}

					void operator++(int) { ++*this; }

					friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept {
						return it.AtEnd();
					}

				private:
					bool AtEnd() const noexcept {
						return m_owner == nullptr || !m_owner->m_current.has_value();
					}

					Preprocessor* m_owner;
			};

			/**
			 * @brief Start preprocessing @p source.
			 * @param source Source range, finite or unbounded.
			 * @param transform Function applied to every claimed item.
			 * @param options Limits, cancellation, fault policy and logger.
			 * @throw InvalidOptions if @p options fail Options::Validate().
			 */
			Preprocessor(Range&& source, Transform transform, Options options = {}):
			m_options(Validated(std::move(options))),
			m_log(std::make_shared<LogSink>(m_options.logger)),
			m_stop(), m_stop_link(),
			m_gate(std::make_shared<Gate>(m_options.ResolvedMaxPreprocessed())),
			m_cursor(std::make_shared<Cursor>(std::forward<Range>(source))),
			m_fault(std::make_shared<FaultSlot>()),
			m_producer(m_options.BufferCapacity()),
			m_consumer(m_producer.Consumer()),
			m_transform(std::move(transform)),
			m_pool(), m_monitor(), m_current(),
			m_delivered(0), m_started(false), m_state(Parallel::State::Idle) {
				if (m_options.stop_token.stop_possible())
					m_stop_link.emplace(m_options.stop_token, [this]() { m_stop.request_stop(); });

				if (m_options.mode == ExecutionMode::Async)
					Start();

				m_state = Parallel::State::Running;
			}

			Preprocessor(const Preprocessor&) = delete;
			Preprocessor& operator=(const Preprocessor&) = delete;
			Preprocessor(Preprocessor&&) = delete;
			Preprocessor& operator=(Preprocessor&&) = delete;

			/**
			 * @brief Destructor; cancels and waits for every thread.
			 */
			~Preprocessor() noexcept {
				Cancel();
			}

			/**
			 * @brief Begin iterating the results.
			 * @throw Exception when called a second time.
			 */
			Iterator begin() {
				if (m_started)
					throw Exception("Preprocessed results can only be iterated once");
				m_started = true;
				Advance();
				return Iterator(this);
			}

			inline std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

			/**
			 * @brief Pull the next result.
			 * @return The result, or std::nullopt once every result was delivered
			 *         or the pipeline was cancelled.
			 * @throw TransformFault if a transform failed under FaultPolicy::Abort.
			 */
			std::optional<TResult> Next() {
				if (m_state.load() == Parallel::State::Completed && !m_fault->HasFault())
					return std::nullopt;

				return m_options.mode == ExecutionMode::Sync ? NextInline() : NextBuffered();
			}

			/**
			 * @brief Stop every worker, discard buffered results and wait for all threads.
			 * @details Idempotent. Iteration ends on the next pull.
			 */
			void Cancel() noexcept {
				Shutdown();
				if (m_monitor)
					m_monitor->Join();
				m_state = Parallel::State::Completed;
			}

			/** @brief Current lifecycle state. */
			Parallel::State State() const noexcept {
				const Parallel::State state = m_state.load();
				if (state == Parallel::State::Running && m_cursor->Exhausted())
					return Parallel::State::Draining;
				return state;
			}

			/** @brief Number of workers. */
			inline std::size_t MaxThreads() const noexcept { return m_options.max_threads; }

			/** @brief In-flight limit after default resolution. */
			inline std::size_t MaxPreprocessed() const noexcept { return m_gate->Capacity(); }

			/** @brief Capacity of the result buffer. */
			inline std::size_t BufferCapacity() const noexcept { return m_consumer.Capacity(); }

			/** @brief Items currently being transformed or waiting to be consumed. */
			inline std::size_t InFlight() const noexcept { return m_gate->InUse(); }

			/** @brief Highest number of items ever in flight at once. */
			inline std::size_t PeakInFlight() const noexcept { return m_gate->Peak(); }

			/** @brief Results currently waiting in the buffer. */
			inline std::size_t Buffered() const noexcept { return m_consumer.Size(); }

			/** @brief Highest number of results ever waiting in the buffer at once. */
			inline std::size_t PeakBuffered() const noexcept { return m_consumer.PeakSize(); }

			/** @brief Items claimed from the source so far. */
			inline std::size_t Claimed() const noexcept { return m_cursor->Claimed(); }

			/** @brief Results handed to the consumer so far. */
			inline std::size_t Delivered() const noexcept { return m_delivered.load(); }

			/** @brief Workers still running. */
			inline std::size_t WorkersRunning() const noexcept {
				return m_pool ? m_pool->Group()->Running() : 0;
			}

		private:
			static Options Validated(Options options) {
				options.Validate();
				return options;
			}

			void Start() {
				m_pool = std::make_unique<Pool>(m_options.max_threads, m_transform, m_options.fault_policy,
												m_gate, m_cursor, m_producer, m_fault, m_stop, m_log);
				m_monitor = std::make_unique<CompletionMonitor>(m_pool->Group(),
					[producer = m_producer]() mutable { producer.Close(); }, m_log);

				try {
					m_pool->Start();
					m_monitor->Start();
				}
				catch (...) {
					Shutdown();
					throw;
				}
			}

			void Shutdown() noexcept {
				m_stop.request_stop();
				m_gate->Close();
				m_producer.SetError();
				m_consumer.Clear();
			}

			void Finish() noexcept {
				m_state = Parallel::State::Completed;
			}

			void Advance() {
				m_current.reset();
				std::optional<TResult> next = Next();
				if (next)
					m_current.emplace(std::move(*next));
			}

			// Throws a recorded fault, otherwise reports whether the pipeline was stopped.
			// Stop is read before the fault: an aborting worker records its fault first.
			bool Halted(const std::stop_token& token) {
				const bool stopped = token.stop_requested();
				if (m_fault->HasFault()) {
					Finish();
					m_fault->Throw();
				}
				if (stopped)
					Finish();
				return stopped;
			}

			std::optional<TResult> NextBuffered() {
				const std::stop_token token = m_stop.get_token();
				while (!Halted(token)) {
					auto item = m_consumer.Extract(token, m_options.idle_poll_interval);
					if (item) {
						// Admit the next claim before the caller starts on this result
						m_gate->Release();
						++m_delivered;
						return std::move(*item);
					}

					if (m_consumer.EoF() && !m_fault->HasFault()) {
						Finish();
						return std::nullopt;
					}
				}
				return std::nullopt;
			}

			std::optional<TResult> NextInline() {
				const std::stop_token token = m_stop.get_token();
				while (!Halted(token)) {
					try {
						std::optional<Item> item = m_cursor->Claim(token);
						if (!item) {
							Finish();
							return std::nullopt;
						}

						std::optional<TResult> result(std::in_place, m_transform(std::move(*item)));
						++m_delivered;
						return result;
					}
					catch (const std::exception& e) {
						InlineFault(e.what());
					}
					catch (...) {
						InlineFault("unknown error");
					}
				}
				return std::nullopt;
			}

			void InlineFault(const std::string& reason) {
				if (m_options.fault_policy == FaultPolicy::Skip) {
					m_log->Write(StormByte::Logger::Level::Error, "Caller thread: item dropped: ", reason);
					return;
				}
				m_fault->Capture(0, reason);
			}

			Options m_options;
			std::shared_ptr<LogSink> m_log;
			std::stop_source m_stop;
			std::optional<std::stop_callback<std::function<void()>>> m_stop_link;
			std::shared_ptr<Gate> m_gate;
			std::shared_ptr<Cursor> m_cursor;
			std::shared_ptr<FaultSlot> m_fault;
			Producer<TResult> m_producer;
			Consumer<TResult> m_consumer;
			Transform m_transform;
			std::unique_ptr<Pool> m_pool;
			std::unique_ptr<CompletionMonitor> m_monitor;		///< Declared after m_pool: destroyed first
			std::optional<TResult> m_current;
			std::atomic<std::size_t> m_delivered;
			bool m_started;
			std::atomic<Parallel::State> m_state;
	};

	/**
	 * @brief Preprocess @p source in parallel ahead of consumption.
	 * @param source Source range; preferably items that are expensive to load or parse.
	 * @param transform Transform applied to every item; should involve real work,
	 *        an identity transform only adds overhead.
	 * @param options Limits, cancellation, fault policy and logger.
	 * @return Single-pass range of the transformed items.
	 * @see Preprocessor
	 */
	template<std::ranges::input_range Range, typename Function>
	auto Preprocess(Range&& source, Function&& transform, Options options = {}) {
		using Item = std::ranges::range_value_t<std::views::all_t<Range>>;
		using Result = std::remove_cvref_t<std::invoke_result_t<Function&, Item>>;
		return Preprocessor<Range, Result>(std::forward<Range>(source),
										   std::forward<Function>(transform), std::move(options));
	}
}
