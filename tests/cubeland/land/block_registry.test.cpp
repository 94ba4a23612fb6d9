#include <cubeland/land/block_registry.hpp>
#include <cubeland/land/land_public_consts.hpp>

#include "../../test_common.hpp"

namespace cubeland::land
{

TEST_CASE("'BlockRegistry' properties", "[cubeland::land::block_registry]")
{
	using R = BlockRegistry;

	CHECK_FALSE(R::isSolid(R::BlockAir));
	CHECK(R::isTransparent(R::BlockAir));
	CHECK(R::isSolid(R::BlockStone));
	CHECK(R::isOpaque(R::BlockStone));

	// Solid but see-through
	CHECK(R::isSolid(R::BlockGlass));
	CHECK_FALSE(R::isOpaque(R::BlockGlass));
	CHECK(R::isSolid(R::BlockLeaves));
	CHECK(R::isTransparent(R::BlockLeaves));

	CHECK_FALSE(R::isSolid(R::BlockWater));
	CHECK(R::isTransparent(R::BlockWater));

	CHECK(R::name(R::BlockCobble) == "Cobble");
	CHECK(R::name(R::BlockWater) == "Water");
}

TEST_CASE("'BlockRegistry' breakability", "[cubeland::land::block_registry]")
{
	using R = BlockRegistry;

	CHECK(R::isBreakable(R::BlockDirt, false));
	CHECK(R::isBreakable(R::BlockDirt, true));

	CHECK_FALSE(R::isBreakable(R::BlockBedrock, false));
	CHECK(R::isBreakable(R::BlockBedrock, true));

	CHECK_FALSE(R::isBreakable(R::BlockAir, true));
	CHECK_FALSE(R::isBreakable(R::BlockWater, true));
}

TEST_CASE("'BlockRegistry' texture layers", "[cubeland::land::block_registry]")
{
	using R = BlockRegistry;

	CHECK(R::textureLayer(R::BlockGrass, BlockFace::YPos) == 2);
	CHECK(R::textureLayer(R::BlockGrass, BlockFace::YNeg) == 1);
	CHECK(R::textureLayer(R::BlockGrass, BlockFace::XPos) == 3);
	CHECK(R::textureLayer(R::BlockWood, BlockFace::YPos) == 10);
	CHECK(R::textureLayer(R::BlockWood, BlockFace::ZNeg) == 11);
	CHECK(R::textureLayer(R::BlockStone, BlockFace::ZPos) == 12);

	for (BlockId id = 0; id < R::NUM_BLOCKS; id++) {
		for (uint32_t f = 0; f < NUM_BLOCK_FACES; f++) {
			CHECK(R::textureLayer(id, BlockFace(f)) < Consts::NUM_TEXTURE_LAYERS);
		}
	}
}

TEST_CASE("'BlockRegistry' out-of-range IDs", "[cubeland::land::block_registry]")
{
	using R = BlockRegistry;

	constexpr BlockId BAD = R::NUM_BLOCKS;
	CHECK_FALSE(R::isValid(BAD));
	CHECK_FALSE(R::isValid(0xFFFF));
	CHECK(R::isValid(R::BlockWater));

	// Treated as air
	CHECK_FALSE(R::isSolid(BAD));
	CHECK(R::isTransparent(BAD));
	CHECK_FALSE(R::isBreakable(BAD, true));
	CHECK(R::textureLayer(BAD, BlockFace::YPos) == 0);
	CHECK(R::name(0xFFFF) == "Air");
}

} // namespace cubeland::land
