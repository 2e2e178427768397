#pragma once

#include <Forerunner/parallel/typedefs.hxx>

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <sstream>
#include <string>

namespace Forerunner::Parallel {
	/**
	 * @class LogSink
	 * @brief Line-oriented, thread-safe front for a shared StormByte::Logger.
	 *
	 * @details Every worker of a preprocessor writes through the same sink; a
	 *          mutex keeps lines from interleaving. A sink built from a null
	 *          logger discards everything.
	 *
	 * @par Failures
	 *  Writing never throws. A line that cannot be formatted or written (a
	 *  throwing stream, exhausted memory) is counted in @ref Dropped() instead.
	 */
	class FORERUNNER_PARALLEL_PUBLIC LogSink final {
		public:
			explicit LogSink(Log logger) noexcept;

			LogSink(const LogSink&) = delete;
			LogSink& operator=(const LogSink&) = delete;
			~LogSink() = default;

			/**
			 * @brief Write one line at the given level.
			 * @param level Logger level of the line.
			 * @param parts Pieces of the line, streamed in order, without trailing newline.
			 */
			template<typename... Parts>
			void Write(const StormByte::Logger::Level& level, const Parts&... parts) noexcept {
				if (!m_logger) return;
				try {
					std::ostringstream line;
					(line << ... << parts);
					WriteLine(level, line.str());
				}
				catch (const std::exception&) {
					m_dropped.fetch_add(1);
				}
			}

			/** @brief Whether a logger is attached. */
			inline bool Enabled() const noexcept { return static_cast<bool>(m_logger); }

			/** @brief Number of lines lost to a failing logger. */
			inline std::size_t Dropped() const noexcept { return m_dropped.load(); }

		private:
			void WriteLine(const StormByte::Logger::Level& level, const std::string& line);

			Log m_logger;
			std::mutex m_mutex;
			std::atomic<std::size_t> m_dropped;
	};
}
