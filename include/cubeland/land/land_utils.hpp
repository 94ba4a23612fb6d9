#pragma once

#include <cubeland/land/land_public_consts.hpp>

#include <glm/common.hpp>
#include <glm/vec3.hpp>

#include <cstdint>
#include <type_traits>

namespace cubeland::land::Utils
{

// Visit all points in [0; N)^3 space in YXZ order, calling F(x, y, z)
template<uint32_t N, typename F>
inline void forYXZ(F &&fn) noexcept(std::is_nothrow_invocable_v<F, uint32_t, uint32_t, uint32_t>)
{
	for (uint32_t y = 0; y < N; y++) {
		for (uint32_t x = 0; x < N; x++) {
			for (uint32_t z = 0; z < N; z++) {
				fn(x, y, z);
			}
		}
	}
}

// Position of world block coordinate inside its chunk, always in [0; CHUNK_SIZE_BLOCKS)
inline glm::uvec3 localBlock(glm::ivec3 block) noexcept
{
	return glm::uvec3(block & (Consts::CHUNK_SIZE_BLOCKS - 1));
}

// World block coordinate containing world-space point `pos`
inline glm::ivec3 blockAt(const glm::dvec3 &pos) noexcept
{
	return glm::ivec3(glm::floor(pos));
}

} // namespace cubeland::land::Utils
