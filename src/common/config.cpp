#include <cubeland/common/config.hpp>

#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <limits>
#include <stdexcept>

using std::string_view;

namespace cubeland
{

Config::Config(std::filesystem::path path, Config::Scheme scheme) : m_path(std::move(path))
{
	m_ini.SetUnicode();

	if (!m_path.empty()) {
		// Missing file is expected on the first run, everything will be filled from defaults
		SI_Error err = m_ini.LoadFile(m_path.string().c_str());
		if (err < 0 && err != SI_FILE) {
			Log::warn("Failed to parse config file '{}' (SimpleIni error {}), using defaults", m_path.string(),
				int(err));
		}
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value = entry.default_value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());

		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// Works only for one-line descriptions, multiline ones need '; ' on each line
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
		} else {
			try {
				value = optionFromString(string_view(value_ptr), entry.default_value.index());
			}
			catch (const std::logic_error &err) {
				Log::warn("Config option {}/{} has invalid value '{}' ({}), using default", entry.section,
					entry.parameter_name, value_ptr, err.what());
			}
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

Config::~Config() noexcept
{
	if (m_path.empty()) {
		return;
	}

	std::error_code ec;
	if (m_path.has_parent_path()) {
		std::filesystem::create_directories(m_path.parent_path(), ec);
	}

	SI_Error err = m_ini.SaveFile(m_path.string().c_str());
	if (err < 0) {
		Log::warn("Failed to save config file '{}' (SimpleIni error {})", m_path.string(), int(err));
	}
}

Config::Scheme Config::mainConfigScheme()
{
	Config::Scheme s;

	s.push_back({ "world", "seed", "World generation seed", int64_t(1337) });
	s.push_back({ "world", "load_radius", "Horizontal chunk load radius around the character", int64_t(3) });
	s.push_back({ "world", "height_chunks", "World height in chunks, starting from Y=0", int64_t(4) });

	s.push_back({ "game", "creative", "Creative mode: flying, block picking, infinite inventory", true });
	s.push_back({ "game", "breakable_bedrock", "Allow breaking the bottom bedrock layer", false });
	s.push_back({ "game", "max_reach", "Maximal block interaction distance", 6.0 });

	s.push_back({ "physics", "gravity", "Gravity acceleration, blocks/s^2", 24.0 });
	s.push_back({ "physics", "sprint_factor", "Horizontal speed multiplier when sprinting", 1.5 });
	s.push_back({ "physics", "sneak_factor", "Horizontal speed multiplier when sneaking", 0.6 });
	s.push_back({ "physics", "max_fall_speed", "Terminal falling speed, blocks/s", 60.0 });

	s.push_back({ "generator", "base_height", "Average terrain surface height", int64_t(48) });
	s.push_back({ "generator", "amplitude", "Terrain height noise amplitude", 16.0 });
	s.push_back({ "generator", "octaves", "Number of terrain noise octaves", int64_t(4) });
	s.push_back({ "generator", "frequency", "Base frequency of terrain noise", 0.01 });
	s.push_back({ "generator", "persistence", "Amplitude multiplier between octaves", 0.5 });
	s.push_back({ "generator", "lacunarity", "Frequency multiplier between octaves", 2.0 });
	s.push_back({ "generator", "dirt_depth", "Number of dirt layers under the grass", int64_t(3) });
	s.push_back({ "generator", "sea_level", "Water fills air below this height", int64_t(44) });
	s.push_back({ "generator", "tree_density", "Probability of a tree in every 8x8 cell", 0.3 });

	return s;
}

const Config::option_t *Config::findOption(string_view section, string_view parameter_name) const noexcept
{
	auto it_ext = m_data.find(section);
	if (it_ext == m_data.end()) {
		return nullptr;
	}

	auto it_inter = it_ext->second.find(parameter_name);
	if (it_inter == it_ext->second.end()) {
		return nullptr;
	}

	return &it_inter->second;
}

std::optional<std::string> Config::optionString(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (const auto *value = std::get_if<std::string>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<int64_t> Config::optionInt64(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (const auto *value = std::get_if<int64_t>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<int32_t> Config::optionInt32(string_view section, string_view parameter_name) const
{
	std::optional<int64_t> opt = optionInt64(section, parameter_name);
	if (!opt.has_value()) {
		return std::nullopt;
	}

	int64_t value = *opt;
	if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
		Log::warn("Option {}/{} value {} does not fit into int32", section, parameter_name, value);
		return std::nullopt;
	}

	return static_cast<int32_t>(value);
}

std::optional<double> Config::optionDouble(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (const auto *value = std::get_if<double>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<bool> Config::optionBool(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (const auto *value = std::get_if<bool>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

int64_t Config::getInt64(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt64(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (int64) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

int32_t Config::getInt32(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt32(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (int32) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

double Config::getDouble(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionDouble(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (double) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

bool Config::getBool(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionBool(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (bool) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

void Config::patch(string_view section, string_view parameter_name, string_view value_string,
	bool save_to_config_file, Location loc)
{
	auto it_ext = m_data.find(section);
	if (it_ext != m_data.end()) {
		if (auto it_inter = it_ext->second.find(parameter_name); it_inter != it_ext->second.end()) {
			try {
				it_inter->second = optionFromString(value_string, it_inter->second.index());
			}
			catch (const std::logic_error &err) {
				Log::error("Can't parse '{}' for option {}/{}: {}", value_string, section, parameter_name, err.what());
				throw Exception::fromError(CubelandErrc::InvalidData, "unparsable config option value", loc);
			}

			if (save_to_config_file) {
				const std::string str = optionToString(it_inter->second);
				m_ini.SetValue(it_ext->first.c_str(), it_inter->first.c_str(), str.c_str());
			}

			return;
		}
	}

	Log::error("Option {}/{} not found for patching", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option for patching", loc);
}

std::string Config::optionToString(const option_t &value)
{
	using namespace std;

	switch (value.index()) {
	case 0:
		static_assert(is_same_v<string, variant_alternative_t<0, Config::option_t>>);
		return get<string>(value);

	case 1:
		static_assert(is_same_v<int64_t, variant_alternative_t<1, Config::option_t>>);
		return to_string(get<int64_t>(value));

	case 2:
		static_assert(is_same_v<double, variant_alternative_t<2, Config::option_t>>);
		return fmt::format("{}", get<double>(value));

	case 3:
		static_assert(is_same_v<bool, variant_alternative_t<3, Config::option_t>>);
		return get<bool>(value) ? "true" : "false";

	default:
		static_assert(std::variant_size_v<Config::option_t> == 4);
		return "";
	}
}

Config::option_t Config::optionFromString(string_view s, size_t type)
{
	// `std::sto*` need a null-terminated string
	const std::string str(s);

	switch (type) {
	case 0:
		static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
		return str;

	case 1: {
		static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
		size_t parsed = 0;
		int64_t value = std::stoll(str, &parsed);
		if (parsed != str.size()) {
			throw std::invalid_argument("trailing characters after integer");
		}
		return value;
	}

	case 2: {
		static_assert(std::is_same_v<double, std::variant_alternative_t<2, Config::option_t>>);
		size_t parsed = 0;
		double value = std::stod(str, &parsed);
		if (parsed != str.size()) {
			throw std::invalid_argument("trailing characters after number");
		}
		return value;
	}

	case 3: {
		static_assert(std::is_same_v<bool, std::variant_alternative_t<3, Config::option_t>>);
		std::string lower;
		for (char c : str) {
			lower += char(std::tolower(static_cast<unsigned char>(c)));
		}

		if (lower == "true" || lower == "1" || lower == "yes") {
			return true;
		}
		if (lower == "false" || lower == "0" || lower == "no") {
			return false;
		}
		throw std::invalid_argument("not a boolean");
	}

	default:
		static_assert(std::variant_size_v<Config::option_t> == 4);
		throw std::invalid_argument("unknown option type");
	}
}

} // namespace cubeland
