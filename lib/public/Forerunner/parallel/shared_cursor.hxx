#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <ranges>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace Forerunner::Parallel {
	/**
	 * @class SharedCursor
	 * @brief Serialized cursor over a single-pass source range.
	 *
	 * @par Overview
	 *  The source range is not assumed to be thread-safe, so every advance goes
	 *  through @ref Claim(), which holds a mutex for the duration of one
	 *  dereference and increment. Each source item is therefore handed to exactly
	 *  one caller, and items are handed out in source order.
	 *
	 * @par Ownership
	 *  The range is stored through @c std::views::all: an lvalue range is
	 *  referenced (and must outlive the cursor) and its items are copied out.
	 *  An rvalue container is moved in and owned, and its items are moved out,
	 *  so move-only items are supported. Unbounded ranges such as
	 *  @c std::views::iota(0) are supported.
	 *
	 * @par Failures
	 *  When reading an item throws, the cursor still steps past it and the
	 *  exception reaches the caller. When stepping throws, the cursor is
	 *  exhausted.
	 *
	 * @tparam Range Range type as deduced by a forwarding reference.
	 */
	template<std::ranges::input_range Range>
	class SharedCursor final {
		public:
			using View = std::views::all_t<Range>;
			using Item = std::ranges::range_value_t<View>;

			/**
			 * @brief Construct a cursor positioned at the first item of @p range.
			 */
			explicit SharedCursor(Range&& range):
			m_view(std::views::all(std::forward<Range>(range))),
			m_current(std::ranges::begin(m_view)), m_end(std::ranges::end(m_view)),
			m_claimed(0), m_exhausted(false) {}

			SharedCursor(const SharedCursor&) = delete;
			SharedCursor& operator=(const SharedCursor&) = delete;
			SharedCursor(SharedCursor&&) = delete;
			SharedCursor& operator=(SharedCursor&&) = delete;
			~SharedCursor() = default;

			/**
			 * @brief Claim the next source item.
			 * @param token When stopped, nothing more is claimed.
			 * @return The item, or std::nullopt once the range is exhausted or the
			 *         token is stopped. Exhaustion is sticky: the underlying range is
			 *         never advanced again afterwards.
			 * @throw Whatever reading or advancing the source throws.
			 */
			std::optional<Item> Claim(std::stop_token token = {}) {
				std::scoped_lock<std::mutex> lock(m_mutex);
				if (token.stop_requested() || m_exhausted.load())
					return std::nullopt;

				if (m_current == m_end) {
					m_exhausted = true;
					return std::nullopt;
				}

				std::optional<Item> item;
				try {
					item.emplace(Read());
				}
				catch (...) {
					// An unreadable item is passed over, never retried
					Step();
					throw;
				}
				Step();
				return item;
			}

			/** @brief Number of items taken from the source so far, unreadable ones included. */
			inline std::size_t Claimed() const noexcept { return m_claimed.load(); }

			/** @brief Whether the end of the range has been reached. */
			inline bool Exhausted() const noexcept { return m_exhausted.load(); }

		private:
			static constexpr bool Owning = std::is_same_v<View, std::ranges::owning_view<std::remove_cvref_t<Range>>>;

			decltype(auto) Read() {
				if constexpr (Owning)
					return std::ranges::iter_move(m_current);
				else
					return *m_current;
			}

			void Step() {
				++m_claimed;
				try {
					++m_current;
				}
				catch (...) {
					m_exhausted = true;
					throw;
				}
			}

			View m_view;
			std::ranges::iterator_t<View> m_current;
			std::ranges::sentinel_t<View> m_end;
			std::atomic<std::size_t> m_claimed;
			std::atomic<bool> m_exhausted;
			std::mutex m_mutex;
	};
}
