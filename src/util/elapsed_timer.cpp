#include <cubeland/util/elapsed_timer.hpp>

#include <cubeland/util/log.hpp>

namespace cubeland
{

ElapsedTimer::ElapsedTimer(std::string section_name) : m_section_name(std::move(section_name)), m_start(Clock::now())
{}

ElapsedTimer::~ElapsedTimer() noexcept
{
	if (!m_finished) {
		Log::warn("Elapsed timer for section \"{}\" destroyed without stop!", m_section_name);
	}
}

double ElapsedTimer::stop()
{
	std::chrono::duration<double, std::milli> elapsed = Clock::now() - m_start;
	Log::debug("Section \"{}\" took {:.2f} ms", m_section_name, elapsed.count());

	m_finished = true;
	return elapsed.count();
}

} // namespace cubeland
