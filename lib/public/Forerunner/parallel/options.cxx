#include <Forerunner/parallel/options.hxx>

using namespace Forerunner::Parallel;

std::size_t Options::ResolvedMaxPreprocessed() const noexcept {
	if (max_preprocessed < 1)
		return max_threads;
	return static_cast<std::size_t>(max_preprocessed);
}

std::size_t Options::BufferCapacity() const noexcept {
	const std::size_t limit = ResolvedMaxPreprocessed();
	return strict_capacity ? limit : limit + 1;
}

void Options::Validate() const {
	if (max_threads < 1)
		throw InvalidOptions("max_threads must be at least 1");
	if (idle_poll_interval.count() <= 0)
		throw InvalidOptions("idle_poll_interval must be positive");
}
