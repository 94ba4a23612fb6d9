#pragma once

#include <cubeland/land/block_face.hpp>
#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/util/hash.hpp>

#include <glm/vec3.hpp>

#include <functional>

namespace cubeland::land
{

// Integer chunk coordinate. Useable as search key for associative containers.
struct ChunkKey {
	ChunkKey() = default;
	explicit ChunkKey(glm::ivec3 base) noexcept : x(base.x), y(base.y), z(base.z) {}
	explicit ChunkKey(int32_t x, int32_t y, int32_t z) noexcept : x(x), y(y), z(z) {}

	// Key of the chunk containing block at world block coordinate `block`
	static ChunkKey fromBlock(glm::ivec3 block) noexcept
	{
		// Arithmetic shift rounds towards negative infinity, as needed
		return ChunkKey(block.x >> Consts::CHUNK_SIZE_LOG2, block.y >> Consts::CHUNK_SIZE_LOG2,
			block.z >> Consts::CHUNK_SIZE_LOG2);
	}

	bool operator==(const ChunkKey &other) const = default;
	bool operator!=(const ChunkKey &other) const = default;

	glm::ivec3 base() const noexcept { return glm::ivec3(x, y, z); }
	// World coordinate of the block at local (0, 0, 0)
	glm::ivec3 firstBlock() const noexcept { return base() * Consts::CHUNK_SIZE_BLOCKS; }

	ChunkKey adjacent(BlockFace face) const noexcept { return ChunkKey(base() + faceNormal(face)); }

	// 21 bits per component. Larger coordinates wrap, this only affects
	// hash quality, not equality comparison.
	uint64_t packed() const noexcept
	{
		constexpr uint64_t MASK = (1u << 21) - 1u;
		return ((uint64_t(uint32_t(x)) & MASK) << 42) | ((uint64_t(uint32_t(y)) & MASK) << 21)
			| (uint64_t(uint32_t(z)) & MASK);
	}

	uint64_t hash() const noexcept { return Hash::xxh64Fixed(packed()); }

	int32_t x = 0;
	int32_t y = 0;
	int32_t z = 0;
};

} // namespace cubeland::land

namespace std
{

template<>
struct hash<cubeland::land::ChunkKey> {
	size_t operator()(const cubeland::land::ChunkKey &ck) const noexcept { return size_t(ck.hash()); }
};

} // namespace std
