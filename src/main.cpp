#include <cubeland/common/config.hpp>
#include <cubeland/land/chunk_mesh.hpp>
#include <cubeland/util/elapsed_timer.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>
#include <cubeland/world/world.hpp>

#include <cxxopts.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace
{

using cubeland::Config;
using cubeland::Log;

constexpr std::string_view CLI_SECTION_SEPARATOR = "__";

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("cubeland_sim", "Cubeland - headless voxel world simulation");
	Config::Scheme scheme = Config::mainConfigScheme();

	for (Config::SchemeEntry &entry : scheme) {
		std::shared_ptr<cxxopts::Value> default_cli_value;
		switch (entry.default_value.index()) {
		case 0:
			static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
			default_cli_value = cxxopts::value<std::string>();
			break;

		case 1:
			static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
			default_cli_value = cxxopts::value<int64_t>();
			break;

		case 2:
			static_assert(std::is_same_v<double, std::variant_alternative_t<2, Config::option_t>>);
			default_cli_value = cxxopts::value<double>();
			break;

		case 3:
			static_assert(std::is_same_v<bool, std::variant_alternative_t<3, Config::option_t>>);
			// Allows `--game__creative` instead of strict `--game__creative=true` form
			default_cli_value = cxxopts::value<bool>()->default_value("true");
			break;

		default:
			static_assert(std::variant_size_v<Config::option_t> == 4);
			break;
		}

		options.add_options(entry.section)(entry.section + std::string(CLI_SECTION_SEPARATOR) + entry.parameter_name,
			entry.description, default_cli_value);
	}

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information")
		("c,config", "Path to INI config file, empty to use defaults only",
			cxxopts::value<std::string>()->default_value(""))
		("s,steps", "Number of simulation steps", cxxopts::value<int64_t>()->default_value("600"))
		("dt", "Simulation step length in seconds", cxxopts::value<double>()->default_value("0.05"))
		("l,log_level", "Minimal logged level (trace, debug, info, warn, error, fatal, off)",
			cxxopts::value<std::string>()->default_value("info"));
	// clang-format on

	return options;
}

void patchConfig(const cxxopts::ParseResult &result, Config &config)
{
	for (const auto &keyvalue : result.arguments()) {
		size_t sep_idx = keyvalue.key().find(CLI_SECTION_SEPARATOR);
		if (sep_idx == std::string::npos) {
			continue;
		}

		std::string section = keyvalue.key().substr(0, sep_idx);
		std::string parameter = keyvalue.key().substr(sep_idx + CLI_SECTION_SEPARATOR.size());

		config.patch(section, parameter, keyvalue.value());
	}
}

Log::Level parseLogLevel(std::string_view name)
{
	for (int i = 0; i <= int(Log::Level::Off); i++) {
		auto level = Log::Level(i);
		std::string lowered(extras::enum_name(level));
		for (char &c : lowered) {
			c = char(std::tolower(static_cast<unsigned char>(c)));
		}

		if (lowered == name) {
			return level;
		}
	}

	throw cubeland::Exception::fromError(cubeland::CubelandErrc::InvalidData, "unknown log level name");
}

// Walk the character along +X, digging into the ground ahead
// and placing blocks back every few steps
void runSimulation(cubeland::world::World &world, int64_t steps, double dt)
{
	using namespace cubeland;

	constexpr double WALK_SPEED = 4.3;
	constexpr int64_t EDIT_PERIOD = 20;

	world.setCharacterInput(glm::dvec3(WALK_SPEED, 0.0, 0.0), cubeland::world::Gait::Walk, false);

	size_t total_breaks = 0;
	size_t total_places = 0;

	for (int64_t i = 0; i < steps; i++) {
		const glm::dvec3 feet = world.character().feetPosition();
		const glm::dvec3 eye = feet + glm::dvec3(0.0, world::World::CHARACTER_HEIGHT * 0.9, 0.0);
		world.setAim(eye, glm::dvec3(1.0, -1.0, 0.0));

		if (i % EDIT_PERIOD == 0) {
			if (const auto &target = world.aimTarget(); target) {
				if ((i / EDIT_PERIOD) % 2 == 0) {
					world.requestBreak(target->block);
					total_breaks++;
				} else {
					world.requestPlaceSelected(target->adjacentBlock());
					total_places++;
				}
			}
		}

		world.step(dt);
	}

	size_t num_meshes = 0;
	size_t num_quads = 0;
	world.forEachReadyMesh([&](const land::Chunk &, const land::ChunkMesh &mesh) {
		num_meshes++;
		num_quads += mesh.numQuads();
	});

	uint64_t checksum_sum = 0;
	world.store().forEachChunk([&](const land::Chunk &chunk) { checksum_sum += chunk.checksum(); });

	const glm::dvec3 feet = world.character().feetPosition();
	Log::info("Simulated {} steps, character at ({:.2f}, {:.2f}, {:.2f})", steps, feet.x, feet.y, feet.z);
	Log::info("Requested {} breaks and {} places", total_breaks, total_places);
	Log::info("{} chunks loaded, {} meshes with {} quads, checksum sum {:x}", world.store().size(), num_meshes,
		num_quads, checksum_sum);
}

} // namespace

int main(int argc, char *argv[])
{
	try {
		cxxopts::Options opts = makeCliOptions();
		cxxopts::ParseResult parsed;

		try {
			parsed = opts.parse(argc, argv);
		}
		catch (cxxopts::exceptions::exception &ex) {
			fmt::print(stderr, "Invalid options provided, use -h (--help) to get usage help.\nError details:\n{}\n",
				ex.what());
			return EXIT_FAILURE;
		}

		if (parsed.count("help")) {
			fmt::print("{}\n", opts.help());
			return EXIT_SUCCESS;
		}

		if (const auto &unmatched = parsed.unmatched(); !unmatched.empty()) {
			fmt::print(stderr, "Unknown arguments provided:\n{}\n", unmatched);
			return EXIT_FAILURE;
		}

		Log::setLevel(parseLogLevel(parsed["log_level"].as<std::string>()));

		Config config(parsed["config"].as<std::string>(), Config::mainConfigScheme());
		patchConfig(parsed, config);

		const auto settings = cubeland::world::WorldSettings::fromConfig(config);

		cubeland::ElapsedTimer warmup_timer("world warmup");
		cubeland::world::World world(settings);
		// The first step meshes everything loaded in the constructor
		world.step(0.0);
		Log::info("World warmup took {:.1f} ms", warmup_timer.stop());

		cubeland::ElapsedTimer sim_timer("simulation");
		runSimulation(world, parsed["steps"].as<int64_t>(), parsed["dt"].as<double>());
		Log::info("Simulation took {:.1f} ms", sim_timer.stop());
	}
	catch (const cubeland::Exception &e) {
		Log::fatal("Uncaught cubeland::Exception instance");
		Log::fatal("what(): {}", e.what());
		auto loc = e.where();
		Log::fatal("where(): {}:{}", loc.file_name(), loc.line());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}

	Log::info("Exiting normally");
	return EXIT_SUCCESS;
}
