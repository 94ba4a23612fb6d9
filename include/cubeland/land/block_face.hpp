#pragma once

#include <cubeland/visibility.hpp>

#include <extras/enum_utils.hpp>

#include <glm/vec3.hpp>

#include <cstdint>

namespace cubeland::land
{

// Axis-aligned face directions in "cubemap order".
// Opposite faces differ only in the lowest bit.
enum class BlockFace : uint8_t {
	XPos,
	XNeg,
	YPos,
	YNeg,
	ZPos,
	ZNeg,

	EnumSize
};

constexpr uint32_t NUM_BLOCK_FACES = extras::enum_size_v<BlockFace>;

constexpr glm::ivec3 FACE_NORMAL[NUM_BLOCK_FACES] = {
	glm::ivec3(1, 0, 0),
	glm::ivec3(-1, 0, 0),
	glm::ivec3(0, 1, 0),
	glm::ivec3(0, -1, 0),
	glm::ivec3(0, 0, 1),
	glm::ivec3(0, 0, -1),
};

constexpr BlockFace oppositeFace(BlockFace face) noexcept
{
	return static_cast<BlockFace>(extras::to_underlying(face) ^ 1u);
}

// 0 for X, 1 for Y, 2 for Z
constexpr int faceAxis(BlockFace face) noexcept
{
	return extras::to_underlying(face) >> 1;
}

constexpr bool isPositiveFace(BlockFace face) noexcept
{
	return (extras::to_underlying(face) & 1u) == 0;
}

constexpr glm::ivec3 faceNormal(BlockFace face) noexcept
{
	return FACE_NORMAL[extras::to_underlying(face)];
}

} // namespace cubeland::land

namespace extras
{

template<>
CUBELAND_API std::string_view enum_name(cubeland::land::BlockFace value) noexcept;

}
