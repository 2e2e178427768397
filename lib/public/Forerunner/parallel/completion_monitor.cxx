#include <Forerunner/parallel/completion_monitor.hxx>

using namespace Forerunner::Parallel;

CompletionMonitor::CompletionMonitor(std::shared_ptr<WorkerGroup> group, Action on_complete, std::shared_ptr<LogSink> log):
m_group(std::move(group)), m_on_complete(std::move(on_complete)), m_log(std::move(log)),
m_thread(), m_completed(false) {}

CompletionMonitor::~CompletionMonitor() noexcept {
	Join();
}

void CompletionMonitor::Start() {
	if (m_thread.joinable() || m_completed.load()) return;
	m_thread = std::thread([this]() { Watch(); });
}

void CompletionMonitor::Join() {
	if (m_thread.joinable())
		m_thread.join();
}

void CompletionMonitor::Watch() {
	m_group->WaitExited();

	m_log->Write(StormByte::Logger::Level::LowLevel,
		"Completion monitor: ", m_group->Exited(), " workers exited");

	m_group->Join();
	m_on_complete();
	m_completed = true;
}
