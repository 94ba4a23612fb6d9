#pragma once

#include <cubeland/visibility.hpp>

#include <exception>
#include <source_location>
#include <string>
#include <system_error>

namespace cubeland
{

// Base exception class for everything thrown by the engine.
//
// Throwing is reserved for truly exceptional situations such as broken
// configuration. Normal outcomes like a rejected block edit are reported
// with a plain `std::error_condition` return value instead.
class CUBELAND_API Exception : public std::exception {
public:
	using Location = std::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Source location where the exception was thrown
	const Location &where() const noexcept { return m_where; }

	// Construct exception from `std::error_condition`, usually `CubelandErrc`.
	// `what()` is formatted as "<details> (cond [<category>:<value>] <message>)"
	static Exception fromError(std::error_condition ec, const char *details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace cubeland
