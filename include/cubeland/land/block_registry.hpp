#pragma once

#include <cubeland/land/block_face.hpp>

#include <cstdint>
#include <string_view>

namespace cubeland::land
{

using BlockId = uint16_t;

// Static table of block type properties.
// Any ID outside of the table is treated as `BlockAir`.
class BlockRegistry {
public:
	enum Block : BlockId {
		BlockAir = 0,

		BlockBedrock,
		BlockStone,
		BlockDirt,
		BlockGrass,
		BlockSand,
		BlockGravel,
		BlockCobble,
		BlockBricks,
		BlockWood,
		BlockPlanks,
		BlockLeaves,
		BlockGlass,
		BlockWater,

		BlockCount
	};

	constexpr static BlockId NUM_BLOCKS = BlockCount;

	struct Properties {
		std::string_view name;
		// Blocks movement and stops picking rays
		bool solid;
		// Lets neighbor faces be seen through it, meshed separately from opaque blocks
		bool transparent;
		// Can be broken at all. Bedrock is additionally gated by world settings.
		bool breakable;
		// Texture array layer per face, in `BlockFace` order
		uint8_t layers[NUM_BLOCK_FACES];
	};

	// clang-format off: keep table columns aligned
	constexpr static Properties PROPERTIES[NUM_BLOCKS] = {
		{ "Air",     false, true,  false, { 0, 0, 0, 0, 0, 0 } },
		{ "Bedrock", true,  false, true,  { 13, 13, 13, 13, 13, 13 } },
		{ "Stone",   true,  false, true,  { 12, 12, 12, 12, 12, 12 } },
		{ "Dirt",    true,  false, true,  { 1, 1, 1, 1, 1, 1 } },
		{ "Grass",   true,  false, true,  { 3, 3, 2, 1, 3, 3 } },
		{ "Sand",    true,  false, true,  { 6, 6, 6, 6, 6, 6 } },
		{ "Gravel",  true,  false, true,  { 8, 8, 8, 8, 8, 8 } },
		{ "Cobble",  true,  false, true,  { 4, 4, 4, 4, 4, 4 } },
		{ "Bricks",  true,  false, true,  { 7, 7, 7, 7, 7, 7 } },
		{ "Wood",    true,  false, true,  { 11, 11, 10, 10, 11, 11 } },
		{ "Planks",  true,  false, true,  { 5, 5, 5, 5, 5, 5 } },
		{ "Leaves",  true,  true,  true,  { 9, 9, 9, 9, 9, 9 } },
		{ "Glass",   true,  true,  true,  { 14, 14, 14, 14, 14, 14 } },
		{ "Water",   false, true,  false, { 15, 15, 15, 15, 15, 15 } },
	};
	// clang-format on

	static bool isValid(BlockId id) noexcept { return id < NUM_BLOCKS; }

	static const Properties &properties(BlockId id) noexcept
	{
		return isValid(id) ? PROPERTIES[id] : PROPERTIES[BlockAir];
	}

	static bool isSolid(BlockId id) noexcept { return properties(id).solid; }
	static bool isTransparent(BlockId id) noexcept { return properties(id).transparent; }
	// Hides faces of any block behind it
	static bool isOpaque(BlockId id) noexcept { return properties(id).solid && !properties(id).transparent; }

	static bool isBreakable(BlockId id, bool bedrock_breakable) noexcept
	{
		if (id == BlockBedrock) {
			return bedrock_breakable;
		}
		return properties(id).breakable;
	}

	static uint32_t textureLayer(BlockId id, BlockFace face) noexcept
	{
		return properties(id).layers[extras::to_underlying(face)];
	}

	static std::string_view name(BlockId id) noexcept { return properties(id).name; }

private:
	BlockRegistry() = delete;
};

} // namespace cubeland::land
