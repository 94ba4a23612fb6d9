#pragma once

#include <cubeland/visibility.hpp>

#include <chrono>
#include <string>

namespace cubeland
{

// Measures a code section and reports it to the log (Debug level) on `stop()`:
//    ElapsedTimer timer("world warmup");
//    <measurable code here>
//    double ms = timer.stop();
class CUBELAND_API ElapsedTimer {
public:
	explicit ElapsedTimer(std::string section_name);
	ElapsedTimer(const ElapsedTimer &other) = delete;
	ElapsedTimer(ElapsedTimer &&other) = delete;
	ElapsedTimer &operator=(const ElapsedTimer &other) = delete;
	ElapsedTimer &operator=(ElapsedTimer &&other) = delete;
	~ElapsedTimer() noexcept;

	// Returns elapsed time in milliseconds
	double stop();

private:
	using Clock = std::chrono::steady_clock;

	const std::string m_section_name;

	bool m_finished = false;
	Clock::time_point m_start;
};

} // namespace cubeland
