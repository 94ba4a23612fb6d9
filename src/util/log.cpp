#include <cubeland/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <system_error>

namespace cubeland
{

Log::Level Log::m_current_level = Log::Level::Info;

// Reused between calls to avoid allocating on each print
static thread_local fmt::memory_buffer t_message_buffer;

static fmt::text_style styleForLevel(Log::Level level) noexcept
{
	fmt::text_style style;

	switch (level) {
	case Log::Level::Trace:
		style |= fmt::fg(fmt::color::wheat);
		break;
	case Log::Level::Debug:
		style |= fmt::fg(fmt::color::light_sea_green);
		break;
	case Log::Level::Info:
		style |= fmt::fg(fmt::color::green);
		break;
	case Log::Level::Warn:
		style |= fmt::fg(fmt::color::yellow);
		break;
	case Log::Level::Error:
		style |= fmt::fg(fmt::color::red);
		break;
	case Log::Level::Fatal:
		style = fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
		break;
	case Log::Level::Off:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return style;
}

// Strip directories, full build paths only clutter the output
static std::string_view shortFileName(const char *path) noexcept
{
	std::string_view name(path);
	if (size_t pos = name.find_last_of('/'); pos != std::string_view::npos) {
		name.remove_prefix(pos + 1);
	}
	return name;
}

void Log::doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept
{
	std::string_view text;

	try {
		auto &msgbuf = t_message_buffer;

		try {
			msgbuf.clear();
			fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
		}
		catch (const fmt::format_error &err) {
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
		}

		text = { msgbuf.data(), msgbuf.size() };
	}
	catch (const std::bad_alloc &) {
		level = std::max(level, Level::Error);
		text = "Caught std::bad_alloc when trying to log";
	}

	const auto pid = getpid();
	const auto tid = gettid();
	const std::string_view file = shortFileName(where.file_name());

	try {
		// stdout for `X <= Info`, stderr for `X >= Warn`
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Keep the relative order of messages when both streams go to the same output
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid, file,
			where.line(), fmt::styled(extras::enum_name(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%.*s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, int(file.size()), file.data(), unsigned(where.line()), err.code().category().name(),
			err.code().value(), err.what());
	}
	catch (const std::exception &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%.*s:%u][ERROR] Exception when printing log: %s\n", pid, tid,
			int(file.size()), file.data(), unsigned(where.line()), err.what());
	}
}

void Log::setLevel(Level level) noexcept
{
	m_current_level = level;
	debug("Changing log level to [{}]", extras::enum_name(level));
}

} // namespace cubeland

namespace extras
{

using cubeland::Log;

template<>
std::string_view enum_name(Log::Level value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case Log::Level::Trace:
		return "TRACE"sv;
	case Log::Level::Debug:
		return "DEBUG"sv;
	case Log::Level::Info:
		return "INFO"sv;
	case Log::Level::Warn:
		return "WARN"sv;
	case Log::Level::Error:
		return "ERROR"sv;
	case Log::Level::Fatal:
		return "FATAL"sv;
	case Log::Level::Off:
		return "OFF"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "UNKNOWN"sv;
}

} // namespace extras
