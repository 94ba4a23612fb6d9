#pragma once

#include <cubeland/land/land_generator.hpp>
#include <cubeland/visibility.hpp>

#include <cstdint>

namespace cubeland
{

class Config;

}

namespace cubeland::world
{

// Everything needed to construct a `World`, normally read from `Config`
struct CUBELAND_API WorldSettings {
	// Upper bounds accepted by `fromConfig`, keep the loaded area within a few hundred chunks
	constexpr static int32_t MAX_LOAD_RADIUS = 16;
	constexpr static int32_t MAX_HEIGHT_CHUNKS = 16;

	uint64_t seed = 1337;
	// Chunks within this Chebyshev XZ distance from the character's chunk are loaded
	int32_t load_radius = 3;
	// Chunk Y range [0; height_chunks) is loaded in every column
	int32_t height_chunks = 4;

	// Creative mode enables flying, block picking and infinite inventory
	bool creative = true;
	bool breakable_bedrock = false;
	double max_reach = 6.0;

	double gravity = 24.0;
	double sprint_factor = 1.5;
	double sneak_factor = 0.6;
	double max_fall_speed = 60.0;

	land::GeneratorParams generator;

	// Throws `Exception(CubelandErrc::OptionMissing)` if `cfg` lacks some option
	// and `Exception(CubelandErrc::InvalidData)` if a value is out of its valid range
	static WorldSettings fromConfig(const Config &cfg);
};

} // namespace cubeland::world
