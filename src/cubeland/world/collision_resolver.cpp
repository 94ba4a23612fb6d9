#include <cubeland/world/collision_resolver.hpp>

#include <cubeland/land/chunk_store.hpp>

#include <glm/common.hpp>
#include <glm/vector_relational.hpp>

#include <algorithm>
#include <cmath>

namespace cubeland::world
{

namespace
{

// Box faces are compared against block boundaries with this tolerance,
// so a box resting exactly on a block neither sinks nor snags on walls it touches
constexpr double CONTACT_EPSILON = 1e-7;

} // namespace

MovementResult CollisionResolver::resolve(const Aabb &box, const glm::dvec3 &velocity, double dt,
	const land::ChunkStore &store, MovementFlags flags) const noexcept
{
	if (!(dt > 0.0) || !std::isfinite(dt) || glm::any(glm::isnan(velocity)) || glm::any(glm::isinf(velocity))) {
		return MovementResult { .box = box, .velocity = velocity, .on_ground = false };
	}

	glm::dvec3 vel = velocity;
	if (!flags.fly) {
		vel.y = std::max(vel.y - m_gravity * dt, -m_max_fall_speed);
	}

	glm::dvec3 displacement = vel * dt;
	displacement.x *= flags.speed_modifier;
	displacement.z *= flags.speed_modifier;
	displacement = glm::clamp(displacement, -MAX_STEP_DISPLACEMENT, MAX_STEP_DISPLACEMENT);

	if (displacement == glm::dvec3(0.0)) {
		return MovementResult { .box = box, .velocity = vel, .on_ground = false };
	}

	Aabb result = box;
	bool on_ground = false;

	for (int axis = 0; axis < 3; axis++) {
		const double wanted = displacement[axis];
		if (wanted == 0.0) {
			continue;
		}

		double allowed = wanted;
		if (!(flags.fly && axis == 1)) {
			allowed = sweepAxis(result, axis, wanted, store);
		}

		if (allowed != wanted) {
			if (axis == 1 && wanted < 0.0) {
				on_ground = true;
			}
			vel[axis] = 0.0;
		}

		glm::dvec3 offset(0.0);
		offset[axis] = allowed;
		result = result.translated(offset);
	}

	return MovementResult { .box = result, .velocity = vel, .on_ground = on_ground };
}

double CollisionResolver::sweepAxis(const Aabb &box, int axis, double distance, const land::ChunkStore &store) noexcept
{
	// Bounds the layer range below, keeps integer conversions defined
	distance = std::clamp(distance, -MAX_STEP_DISPLACEMENT, MAX_STEP_DISPLACEMENT);

	const int u_axis = (axis + 1) % 3;
	const int v_axis = (axis + 2) % 3;

	// Blocks strictly overlapping the box cross-section
	const auto u_begin = static_cast<int32_t>(std::floor(box.min()[u_axis] + CONTACT_EPSILON));
	const auto u_end = static_cast<int32_t>(std::ceil(box.max()[u_axis] - CONTACT_EPSILON));
	const auto v_begin = static_cast<int32_t>(std::floor(box.min()[v_axis] + CONTACT_EPSILON));
	const auto v_end = static_cast<int32_t>(std::ceil(box.max()[v_axis] - CONTACT_EPSILON));

	auto layer_blocked = [&](int32_t layer) {
		glm::ivec3 block;
		block[axis] = layer;
		for (int32_t u = u_begin; u < u_end; u++) {
			for (int32_t v = v_begin; v < v_end; v++) {
				block[u_axis] = u;
				block[v_axis] = v;
				if (store.isSolidBlock(block)) {
					return true;
				}
			}
		}
		return false;
	};

	if (distance > 0.0) {
		const double face = box.max()[axis];
		// Layers fully ahead of the face and reachable within `distance`
		const auto first = static_cast<int32_t>(std::ceil(face - CONTACT_EPSILON));
		const auto last = static_cast<int32_t>(std::ceil(face + distance)) - 1;

		for (int32_t layer = first; layer <= last; layer++) {
			if (layer_blocked(layer)) {
				return std::max(0.0, double(layer) - face);
			}
		}
	} else {
		const double face = box.min()[axis];
		const auto first = static_cast<int32_t>(std::floor(face + CONTACT_EPSILON)) - 1;
		const auto last = static_cast<int32_t>(std::floor(face + distance));

		for (int32_t layer = first; layer >= last; layer--) {
			if (layer_blocked(layer)) {
				return std::min(0.0, double(layer + 1) - face);
			}
		}
	}

	return distance;
}

} // namespace cubeland::world
