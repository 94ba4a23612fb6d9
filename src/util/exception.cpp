#include <cubeland/util/exception.hpp>

#include <fmt/format.h>

namespace cubeland
{

// Not defining inline to satisfy -Wweak-vtables
Exception::~Exception() = default;

Exception Exception::fromError(std::error_condition ec, const char *details, Location loc)
{
	return { fmt::format("{} (cond [{}:{}] {})", details, ec.category().name(), ec.value(), ec.message()), ec, loc };
}

Exception::Exception(std::string what, std::error_condition error, Location loc)
	: m_what(std::move(what)), m_error(error), m_where(loc)
{}

} // namespace cubeland
