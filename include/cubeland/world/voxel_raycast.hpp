#pragma once

#include <cubeland/land/block_registry.hpp>
#include <cubeland/land/chunk_key.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

#include <optional>

namespace cubeland::land
{

class ChunkStore;

}

namespace cubeland::world
{

struct RaycastHit {
	// World coordinate of the struck block
	glm::ivec3 block;
	land::ChunkKey chunk;
	// Coordinate of the struck block inside `chunk`
	glm::uvec3 local;
	land::BlockId block_id;
	// Outward normal of the entered face, zero if the ray started inside the block
	glm::ivec3 normal;
	glm::dvec3 point;
	// Distance from the ray origin to `point`
	double distance;

	// Neighbor block touching the hit face, i.e. where a placed block would go
	glm::ivec3 adjacentBlock() const noexcept { return block + normal; }
};

// Amanatides-Woo voxel traversal over the loaded blocks
class CUBELAND_API VoxelRaycaster {
public:
	// Find the first solid block along the ray not farther than `max_distance`.
	// Blocks of unloaded chunks are treated as non-solid. Direction need not be
	// normalized. Zero direction or non-positive distance give no hit.
	// When a ray passes exactly through an edge or a corner, X boundary
	// is crossed first, then Y, then Z.
	static std::optional<RaycastHit> cast(const glm::dvec3 &origin, const glm::dvec3 &direction,
		double max_distance, const land::ChunkStore &store) noexcept;

private:
	VoxelRaycaster() = delete;
};

} // namespace cubeland::world
