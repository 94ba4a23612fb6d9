#pragma once

#include <cubeland/util/aabb.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

namespace cubeland::land
{

class ChunkStore;

}

namespace cubeland::world
{

struct MovementFlags {
	// No gravity and no vertical collision response
	bool fly = false;
	// Multiplier of horizontal displacement (sprint/sneak)
	double speed_modifier = 1.0;
};

struct MovementResult {
	Aabb box;
	glm::dvec3 velocity;
	// Downward movement was stopped by a solid block during this step
	bool on_ground;
};

// Moves an AABB through the voxel world one axis at a time (X, Y, Z).
// Every axis is swept over the full step displacement, so fast
// movement can't skip over a thin wall.
class CUBELAND_API CollisionResolver {
public:
	// Longest displacement per axis in one step, the rest of a faster move is dropped
	constexpr static double MAX_STEP_DISPLACEMENT = 64.0;

	CollisionResolver(double gravity, double max_fall_speed) noexcept
		: m_gravity(gravity), m_max_fall_speed(max_fall_speed)
	{}

	double gravity() const noexcept { return m_gravity; }
	double maxFallSpeed() const noexcept { return m_max_fall_speed; }

	// Integrate one step of `dt` seconds. Blocks of unloaded chunks are not solid.
	// Unless flying, downward speed is capped at `maxFallSpeed()` after applying gravity.
	// Non-positive `dt`, non-finite velocity or zero displacement (after gravity) return input unchanged.
	MovementResult resolve(const Aabb &box, const glm::dvec3 &velocity, double dt, const land::ChunkStore &store,
		MovementFlags flags) const noexcept;

	// Maximal displacement along `axis` not greater than `distance` in magnitude
	// (itself capped at `MAX_STEP_DISPLACEMENT`) that keeps `box` out of solid
	// blocks it doesn't overlap already
	static double sweepAxis(const Aabb &box, int axis, double distance, const land::ChunkStore &store) noexcept;

private:
	double m_gravity;
	double m_max_fall_speed;
};

} // namespace cubeland::world
