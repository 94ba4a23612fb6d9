#include <cubeland/land/land_generator.hpp>

#include "../../cubeland_test_common.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>

namespace cubeland::land
{

namespace
{

GeneratorParams flatParams(int32_t height, int32_t sea_level, double tree_density)
{
	GeneratorParams params;
	params.base_height = height;
	params.amplitude = 0.0;
	params.sea_level = sea_level;
	params.tree_density = tree_density;
	return params;
}

} // namespace

TEST_CASE("'Generator' is deterministic", "[cubeland::land::generator]")
{
	Generator gen;

	const ChunkKey keys[] = { ChunkKey(0, 1, 0), ChunkKey(-3, 1, 7), ChunkKey(5, 0, -2), ChunkKey(100, 2, -100) };

	for (ChunkKey key : keys) {
		auto a = std::make_unique<Chunk>(key);
		auto b = std::make_unique<Chunk>(key);
		gen.generateChunk(key, 1337, *a);
		gen.generateChunk(key, 1337, *b);

		INFO("Chunk " << Catch::StringMaker<ChunkKey>::convert(key));
		CHECK(a->blockIds() == b->blockIds());
		CHECK(a->checksum() == b->checksum());
	}

	// Another generator instance with the same parameters gives the same result
	Generator gen2;
	auto c = std::make_unique<Chunk>(ChunkKey(0, 1, 0));
	auto d = std::make_unique<Chunk>(ChunkKey(0, 1, 0));
	gen.generateChunk(ChunkKey(0, 1, 0), 42, *c);
	gen2.generateChunk(ChunkKey(0, 1, 0), 42, *d);
	CHECK(c->blockIds() == d->blockIds());

	// Different seeds give different terrain
	gen.generateChunk(ChunkKey(0, 1, 0), 43, *d);
	CHECK(c->checksum() != d->checksum());
}

TEST_CASE("'Generator' noise terrain stays within amplitude", "[cubeland::land::generator]")
{
	Generator gen;
	const GeneratorParams &p = gen.params();

	int32_t min_height = INT32_MAX;
	int32_t max_height = INT32_MIN;

	for (int32_t x = -200; x < 200; x += 7) {
		for (int32_t z = -200; z < 200; z += 5) {
			const int32_t h = gen.columnHeight(x, z, 1337);
			min_height = std::min(min_height, h);
			max_height = std::max(max_height, h);
		}
	}

	CHECK(min_height >= p.base_height - int32_t(p.amplitude));
	CHECK(max_height <= p.base_height + int32_t(p.amplitude));
	// Not flat
	CHECK(min_height < max_height);
}

TEST_CASE("'Generator' vertical stratification", "[cubeland::land::generator]")
{
	using R = BlockRegistry;

	Generator gen(flatParams(20, 0, 0.0));
	auto chunk = std::make_unique<Chunk>(ChunkKey(3, 0, -2));
	gen.generateChunk(chunk->key(), 7, *chunk);

	for (uint32_t x = 0; x < 32; x += 5) {
		for (uint32_t z = 0; z < 32; z += 3) {
			CHECK(chunk->blockAt(glm::uvec3(x, 0, z)) == R::BlockBedrock);
			CHECK(chunk->blockAt(glm::uvec3(x, 1, z)) == R::BlockStone);
			CHECK(chunk->blockAt(glm::uvec3(x, 15, z)) == R::BlockStone);
			CHECK(chunk->blockAt(glm::uvec3(x, 16, z)) == R::BlockDirt);
			CHECK(chunk->blockAt(glm::uvec3(x, 18, z)) == R::BlockDirt);
			CHECK(chunk->blockAt(glm::uvec3(x, 19, z)) == R::BlockGrass);
			CHECK(chunk->blockAt(glm::uvec3(x, 20, z)) == R::BlockAir);
			CHECK(chunk->blockAt(glm::uvec3(x, 31, z)) == R::BlockAir);
		}
	}

	// Nothing below the world floor, everything above the surface is air
	auto below = std::make_unique<Chunk>(ChunkKey(0, -1, 0));
	gen.generateChunk(below->key(), 7, *below);
	CHECK(below->blockIds().load(0, 0, 0) == R::BlockAir);
	CHECK(below->blockIds().load(17, 31, 4) == R::BlockAir);

	auto above = std::make_unique<Chunk>(ChunkKey(0, 1, 0));
	above->setAllBlocksUniform(R::BlockStone);
	gen.generateChunk(above->key(), 7, *above);
	CHECK(above->blockIds().load(9, 0, 9) == R::BlockAir);
}

TEST_CASE("'Generator' water and shores", "[cubeland::land::generator]")
{
	using R = BlockRegistry;

	SECTION("Sea bottom")
	{
		Generator gen(flatParams(10, 16, 0.0));
		auto chunk = std::make_unique<Chunk>(ChunkKey(0, 0, 0));
		gen.generateChunk(chunk->key(), 1, *chunk);

		CHECK(chunk->blockAt(glm::uvec3(4, 9, 4)) == R::BlockGravel);
		CHECK(chunk->blockAt(glm::uvec3(4, 8, 4)) == R::BlockSand);
		CHECK(chunk->blockAt(glm::uvec3(4, 5, 4)) == R::BlockStone);
		CHECK(chunk->blockAt(glm::uvec3(4, 10, 4)) == R::BlockWater);
		CHECK(chunk->blockAt(glm::uvec3(4, 15, 4)) == R::BlockWater);
		CHECK(chunk->blockAt(glm::uvec3(4, 16, 4)) == R::BlockAir);
	}

	SECTION("Beach")
	{
		// Surface block right at the sea level
		Generator gen(flatParams(17, 16, 0.0));
		auto chunk = std::make_unique<Chunk>(ChunkKey(0, 0, 0));
		gen.generateChunk(chunk->key(), 1, *chunk);

		CHECK(chunk->blockAt(glm::uvec3(4, 16, 4)) == R::BlockSand);
		CHECK(chunk->blockAt(glm::uvec3(4, 13, 4)) == R::BlockSand);
		CHECK(chunk->blockAt(glm::uvec3(4, 12, 4)) == R::BlockStone);
		CHECK(chunk->blockAt(glm::uvec3(4, 17, 4)) == R::BlockAir);
	}
}

TEST_CASE("'Generator' trees", "[cubeland::land::generator]")
{
	using R = BlockRegistry;

	// Trunks start at Y=30 and cross the chunk border at Y=32
	Generator gen(flatParams(30, 0, 1.0));
	auto lower = std::make_unique<Chunk>(ChunkKey(0, 0, 0));
	auto upper = std::make_unique<Chunk>(ChunkKey(0, 1, 0));
	gen.generateChunk(lower->key(), 5, *lower);
	gen.generateChunk(upper->key(), 5, *upper);

	size_t num_trunks = 0;
	size_t num_leaves = 0;

	for (uint32_t x = 0; x < 32; x++) {
		for (uint32_t z = 0; z < 32; z++) {
			const BlockId at_surface = lower->blockAt(glm::uvec3(x, 30, z));
			if (at_surface == R::BlockWood) {
				num_trunks++;
				// Trunk grows from grass and continues into the upper chunk
				CHECK(lower->blockAt(glm::uvec3(x, 29, z)) == R::BlockGrass);
				CHECK(lower->blockAt(glm::uvec3(x, 31, z)) == R::BlockWood);
				CHECK(upper->blockAt(glm::uvec3(x, 0, z)) == R::BlockWood);
				CHECK(upper->blockAt(glm::uvec3(x, 1, z)) == R::BlockWood);
				// Canopy cap right above the trunk
				CHECK(upper->blockAt(glm::uvec3(x, 8, z)) != R::BlockWood);
			}

			for (uint32_t y = 0; y < 32; y++) {
				num_leaves += upper->blockAt(glm::uvec3(x, y, z)) == R::BlockLeaves ? 1 : 0;
			}
		}
	}

	// Density 1.0 puts a tree in every 8x8 cell
	CHECK(num_trunks == 16);
	CHECK(num_leaves > 16 * 8);
}

} // namespace cubeland::land
