#include <cubeland/world/voxel_raycast.hpp>

#include <cubeland/land/chunk_store.hpp>
#include <cubeland/land/land_utils.hpp>

#include <glm/geometric.hpp>

#include <cmath>
#include <limits>

namespace cubeland::world
{

std::optional<RaycastHit> VoxelRaycaster::cast(const glm::dvec3 &origin, const glm::dvec3 &direction,
	double max_distance, const land::ChunkStore &store) noexcept
{
	const double length = glm::length(direction);
	if (!(length > 0.0) || !(max_distance > 0.0) || !std::isfinite(length)) {
		return std::nullopt;
	}

	const glm::dvec3 dir = direction / length;
	constexpr double INF = std::numeric_limits<double>::infinity();

	glm::ivec3 voxel = land::Utils::blockAt(origin);
	glm::ivec3 step(0);
	// Ray parameter of the next boundary crossing per axis
	glm::dvec3 t_max(INF);
	// Ray parameter between two successive boundaries per axis
	glm::dvec3 t_delta(INF);

	for (int i = 0; i < 3; i++) {
		if (dir[i] > 0.0) {
			step[i] = 1;
			t_max[i] = (double(voxel[i]) + 1.0 - origin[i]) / dir[i];
			t_delta[i] = 1.0 / dir[i];
		} else if (dir[i] < 0.0) {
			step[i] = -1;
			t_max[i] = (origin[i] - double(voxel[i])) / -dir[i];
			t_delta[i] = -1.0 / dir[i];
		}
	}

	glm::ivec3 normal(0);
	double t = 0.0;

	while (true) {
		if (store.isSolidBlock(voxel)) {
			const land::ChunkKey chunk = land::ChunkKey::fromBlock(voxel);
			return RaycastHit {
				.block = voxel,
				.chunk = chunk,
				.local = land::Utils::localBlock(voxel),
				.block_id = store.blockAt(voxel).value_or(land::BlockRegistry::BlockAir),
				.normal = normal,
				.point = origin + dir * t,
				.distance = t,
			};
		}

		int axis;
		if (t_max.x <= t_max.y && t_max.x <= t_max.z) {
			axis = 0;
		} else if (t_max.y <= t_max.z) {
			axis = 1;
		} else {
			axis = 2;
		}

		if (t_max[axis] > max_distance) {
			return std::nullopt;
		}

		t = t_max[axis];
		voxel[axis] += step[axis];
		t_max[axis] += t_delta[axis];

		normal = glm::ivec3(0);
		normal[axis] = -step[axis];
	}
}

} // namespace cubeland::world
