#include <Forerunner/parallel/log_sink.hxx>

#include <ostream>

using namespace Forerunner::Parallel;

LogSink::LogSink(Log logger) noexcept: m_logger(std::move(logger)), m_dropped(0) {}

void LogSink::WriteLine(const StormByte::Logger::Level& level, const std::string& line) {
	std::scoped_lock<std::mutex> lock(m_mutex);
	*m_logger << level << line << std::endl;
}
