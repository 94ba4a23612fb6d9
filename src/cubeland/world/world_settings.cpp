#include <cubeland/world/world_settings.hpp>

#include <cubeland/common/config.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

namespace cubeland::world
{

WorldSettings WorldSettings::fromConfig(const Config &cfg)
{
	WorldSettings s;

	s.seed = static_cast<uint64_t>(cfg.getInt64("world", "seed"));
	s.load_radius = cfg.getInt32("world", "load_radius");
	s.height_chunks = cfg.getInt32("world", "height_chunks");

	s.creative = cfg.getBool("game", "creative");
	s.breakable_bedrock = cfg.getBool("game", "breakable_bedrock");
	s.max_reach = cfg.getDouble("game", "max_reach");

	s.gravity = cfg.getDouble("physics", "gravity");
	s.sprint_factor = cfg.getDouble("physics", "sprint_factor");
	s.sneak_factor = cfg.getDouble("physics", "sneak_factor");
	s.max_fall_speed = cfg.getDouble("physics", "max_fall_speed");

	land::GeneratorParams &gen = s.generator;
	gen.base_height = cfg.getInt32("generator", "base_height");
	gen.amplitude = cfg.getDouble("generator", "amplitude");
	gen.octaves = cfg.getInt32("generator", "octaves");
	gen.frequency = cfg.getDouble("generator", "frequency");
	gen.persistence = cfg.getDouble("generator", "persistence");
	gen.lacunarity = cfg.getDouble("generator", "lacunarity");
	gen.dirt_depth = cfg.getInt32("generator", "dirt_depth");
	gen.sea_level = cfg.getInt32("generator", "sea_level");
	gen.tree_density = cfg.getDouble("generator", "tree_density");

	auto check = [](bool valid, const char *what) {
		if (!valid) {
			throw Exception::fromError(CubelandErrc::InvalidData, what);
		}
	};

	// Negated comparisons also reject NaN
	check(s.load_radius >= 0 && s.load_radius <= MAX_LOAD_RADIUS, "world.load_radius is out of [0; 16] range");
	check(s.height_chunks >= 1 && s.height_chunks <= MAX_HEIGHT_CHUNKS, "world.height_chunks is out of [1; 16] range");
	check(s.max_reach > 0.0 && s.max_reach <= 64.0, "game.max_reach is out of (0; 64] range");
	check(s.gravity >= 0.0 && s.gravity <= 1000.0, "physics.gravity is out of [0; 1000] range");
	check(s.sprint_factor > 0.0 && s.sprint_factor <= 10.0, "physics.sprint_factor is out of (0; 10] range");
	check(s.sneak_factor > 0.0 && s.sneak_factor <= 10.0, "physics.sneak_factor is out of (0; 10] range");
	check(s.max_fall_speed > 0.0 && s.max_fall_speed <= 1000.0, "physics.max_fall_speed is out of (0; 1000] range");

	check(gen.octaves >= 0 && gen.octaves <= 16, "generator.octaves is out of [0; 16] range");
	check(gen.dirt_depth >= 0, "generator.dirt_depth must not be negative");
	check(gen.tree_density >= 0.0 && gen.tree_density <= 1.0, "generator.tree_density is out of [0; 1] range");

	Log::info("World settings: seed {}, load radius {}, height {} chunks, {} mode", s.seed, s.load_radius,
		s.height_chunks, s.creative ? "creative" : "survival");
	return s;
}

} // namespace cubeland::world
