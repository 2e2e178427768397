#include <Forerunner/parallel/fault_slot.hxx>

using namespace Forerunner::Parallel;

FaultSlot::FaultSlot() noexcept: m_has_fault(false), m_fault() {}

bool FaultSlot::Capture(std::size_t worker, const std::string& reason) {
	std::scoped_lock<std::mutex> lock(m_mutex);
	if (m_fault)
		return false;
	m_fault.emplace(worker, reason);
	m_has_fault = true;
	return true;
}

bool FaultSlot::HasFault() const noexcept {
	return m_has_fault.load();
}

void FaultSlot::Throw() const {
	std::scoped_lock<std::mutex> lock(m_mutex);
	if (m_fault)
		throw *m_fault;
}
