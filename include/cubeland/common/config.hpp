#pragma once

#include <cubeland/visibility.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <SimpleIni.h>

namespace cubeland
{

// INI-backed key-value configuration with a fixed scheme.
// Every scheme entry is always present: values missing in the file
// are taken from scheme defaults and written back on destruction.
class CUBELAND_API Config {
public:
	using Location = std::source_location;
	using option_t = std::variant<std::string, int64_t, double, bool>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// Empty `config_filepath` makes an in-memory config filled with defaults
	Config(std::filesystem::path config_filepath, Scheme scheme);
	Config(Config &&) = delete;
	Config(const Config &) = delete;
	Config &operator=(Config &&) = delete;
	Config &operator=(const Config &) = delete;
	~Config() noexcept;

	// Parse `value_string` as the type of the existing option and replace its value.
	// Throws `Exception(CubelandErrc::OptionMissing)` for unknown options
	// and `Exception(CubelandErrc::InvalidData)` for unparsable values.
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		bool save_to_config_file = false, Location loc = Location::current());

	// These return `std::nullopt` if the option is missing or has a different type
	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;
	std::optional<int32_t> optionInt32(std::string_view section, std::string_view parameter_name) const;
	std::optional<double> optionDouble(std::string_view section, std::string_view parameter_name) const;
	std::optional<bool> optionBool(std::string_view section, std::string_view parameter_name) const;

	// These throw `Exception(CubelandErrc::OptionMissing)` instead of returning `std::nullopt`
	int64_t getInt64(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	int32_t getInt32(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	double getDouble(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	bool getBool(std::string_view section, std::string_view parameter_name, Location loc = Location::current()) const;

	// Scheme of all options known to the engine
	static Scheme mainConfigScheme();

	static std::string optionToString(const option_t &value);

	// Throws std::invalid_argument, std::out_of_range
	static option_t optionFromString(std::string_view s, size_t type);

private:
	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	CSimpleIniA m_ini;

	const option_t *findOption(std::string_view section, std::string_view parameter_name) const noexcept;
};

} // namespace cubeland
