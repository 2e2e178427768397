#include <Forerunner/parallel/gate.hxx>

using namespace Forerunner::Parallel;

Gate::Gate(std::size_t capacity) noexcept:
m_capacity(capacity), m_available(capacity), m_peak(0), m_closed(false) {}

bool Gate::Acquire(std::stop_token token) {
	while (!token.stop_requested()) {
		if (TryAcquire()) return true;
		if (m_closed.load()) return false;

		std::unique_lock<std::mutex> lock(m_mutex);
		m_cv.wait(lock, token, [this] {
			return m_closed.load() || m_available.load() > 0;
		});
	}
	return false;
}

bool Gate::TryAcquire() noexcept {
	if (m_closed.load()) return false;
	std::size_t current = m_available.load();
	while (current > 0) {
		if (m_available.compare_exchange_weak(current, current - 1)) {
			UpdatePeak(m_capacity - current + 1);
			return true;
		}
	}
	return false;
}

bool Gate::Release() noexcept {
	std::size_t current = m_available.load();
	do {
		if (current >= m_capacity) return false;
	} while (!m_available.compare_exchange_weak(current, current + 1));

	// Waiters test the counter under the mutex, so taking it here orders the
	// increment before any of them can go back to sleep.
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
	}
	m_cv.notify_all();
	return true;
}

void Gate::Close() noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_closed = true;
	}
	m_cv.notify_all();
}

std::size_t Gate::Available() const noexcept {
	return m_available.load();
}

std::size_t Gate::InUse() const noexcept {
	return m_capacity - m_available.load();
}

std::size_t Gate::Peak() const noexcept {
	return m_peak.load();
}

bool Gate::IsClosed() const noexcept {
	return m_closed.load();
}

void Gate::UpdatePeak(std::size_t in_use) noexcept {
	std::size_t peak = m_peak.load();
	while (in_use > peak && !m_peak.compare_exchange_weak(peak, in_use)) {}
}
