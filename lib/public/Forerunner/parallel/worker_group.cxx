#include <Forerunner/parallel/worker_group.hxx>

using namespace Forerunner::Parallel;

namespace {
	// Marks the owning worker as exited when its body leaves, on every path
	class ExitGuard final {
		public:
			explicit ExitGuard(std::function<void()> on_exit) noexcept: m_on_exit(std::move(on_exit)) {}
			ExitGuard(const ExitGuard&) = delete;
			ExitGuard& operator=(const ExitGuard&) = delete;
			~ExitGuard() noexcept { m_on_exit(); }

		private:
			std::function<void()> m_on_exit;
	};
}

WorkerGroup::WorkerGroup(std::size_t size):
m_size(size), m_threads(), m_exited(0), m_latch(static_cast<std::ptrdiff_t>(size)) {
	m_threads.reserve(m_size);
}

WorkerGroup::~WorkerGroup() noexcept {
	Join();
}

void WorkerGroup::Launch(const Body& body) {
	std::scoped_lock<std::mutex> lock(m_join_mutex);
	if (!m_threads.empty()) return;

	for (std::size_t i = 0; i < m_size; ++i) {
		m_threads.emplace_back([this, body, i]() {
			ExitGuard guard([this] { Exit(); });
			body(i);
		});
	}
}

void WorkerGroup::WaitExited() const {
	m_latch.wait();
}

void WorkerGroup::Join() {
	std::scoped_lock<std::mutex> lock(m_join_mutex);
	for (auto& thread : m_threads) {
		if (thread.joinable())
			thread.join();
	}
}

void WorkerGroup::Exit() noexcept {
	m_exited.fetch_add(1);
	m_latch.count_down();
}
