#pragma once

#include <cubeland/visibility.hpp>

#include <extras/enum_utils.hpp>

#include <fmt/core.h>

#include <source_location>
#include <string_view>

namespace cubeland
{

class CUBELAND_API Log {
public:
	// Levels are ordered by increasing severity, comparing them as integers is valid
	enum class Level : int {
		// Per-iteration details of some algorithm, useful during one debugging session only
		Trace,
		// Low-level workflow, e.g. chunk state transitions or rejected edits
		Debug,
		// High-level workflow, e.g. world creation or configuration summary
		Info,
		// Something went wrong but the current action completed with reduced result
		Warn,
		// The current action could not be completed
		Error,
		// Further execution is impossible
		Fatal,

		// Not a logging level, use it with `setLevel` to disable logging completely
		Off
	};

	using Location = std::source_location;

	template<typename... Args>
	static void log(Level level, Location where, std::string_view format_str, Args &&...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, where, format_str, fmt::make_format_args(args...));
	}

	// Initially set to `Info`, tests and tools lower it explicitly when needed
	static Level level() noexcept { return m_current_level; }
	static void setLevel(Level level) noexcept;
	// Whether logging with the given level will output something
	static bool willBeLogged(Level level) noexcept { return level >= m_current_level; }

private:
	Log() = delete;

	static Level m_current_level;

	static void doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept;

public:
	// Default arguments can't follow a parameter pack, hence the overload ladder
#define LOG_MAKE_FUNCTIONS(name, level) \
	template<typename T1> \
	static void name(T1 &&arg1, Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1)); \
	} \
	template<typename T1, typename T2> \
	static void name(T1 &&arg1, T2 &&arg2, Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2)); \
	} \
	template<typename T1, typename T2, typename T3> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)); \
	} \
	template<typename T1, typename T2, typename T3, typename T4> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, T4 &&arg4, Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3), \
			std::forward<T4>(arg4)); \
	} \
	template<typename T1, typename T2, typename T3, typename T4, typename T5> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, T4 &&arg4, T5 &&arg5, \
		Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3), \
			std::forward<T4>(arg4), std::forward<T5>(arg5)); \
	} \
	template<typename T1, typename T2, typename T3, typename T4, typename T5, typename T6> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, T4 &&arg4, T5 &&arg5, T6 &&arg6, \
		Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3), \
			std::forward<T4>(arg4), std::forward<T5>(arg5), std::forward<T6>(arg6)); \
	} \
	template<typename T1, typename T2, typename T3, typename T4, typename T5, typename T6, typename T7> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, T4 &&arg4, T5 &&arg5, T6 &&arg6, T7 &&arg7, \
		Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3), \
			std::forward<T4>(arg4), std::forward<T5>(arg5), std::forward<T6>(arg6), std::forward<T7>(arg7)); \
	} \
	template<typename T1, typename T2, typename T3, typename T4, typename T5, typename T6, typename T7, typename T8> \
	static void name(T1 &&arg1, T2 &&arg2, T3 &&arg3, T4 &&arg4, T5 &&arg5, T6 &&arg6, T7 &&arg7, T8 &&arg8, \
		Location where = Location::current()) noexcept \
	{ \
		log(level, where, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3), \
			std::forward<T4>(arg4), std::forward<T5>(arg5), std::forward<T6>(arg6), std::forward<T7>(arg7), \
			std::forward<T8>(arg8)); \
	}

	LOG_MAKE_FUNCTIONS(trace, Level::Trace)
	LOG_MAKE_FUNCTIONS(debug, Level::Debug)
	LOG_MAKE_FUNCTIONS(info, Level::Info)
	LOG_MAKE_FUNCTIONS(warn, Level::Warn)
	LOG_MAKE_FUNCTIONS(error, Level::Error)
	LOG_MAKE_FUNCTIONS(fatal, Level::Fatal)

#undef LOG_MAKE_FUNCTIONS
};

} // namespace cubeland

namespace extras
{

template<>
CUBELAND_API std::string_view enum_name(cubeland::Log::Level value) noexcept;

}
