#include <cubeland/land/chunk_key.hpp>

#include "../../cubeland_test_common.hpp"

#include <unordered_set>

namespace cubeland::land
{

TEST_CASE("'ChunkKey' sanity check", "[cubeland::land::chunk_key]")
{
	ChunkKey ck(glm::ivec3(8, 4, 2));
	CHECK(ck.base() == glm::ivec3(8, 4, 2));
	CHECK(ck.firstBlock() == glm::ivec3(256, 128, 64));

	CHECK(ck.adjacent(BlockFace::XPos) == ChunkKey(9, 4, 2));
	CHECK(ck.adjacent(BlockFace::XNeg) == ChunkKey(7, 4, 2));
	CHECK(ck.adjacent(BlockFace::YPos) == ChunkKey(8, 5, 2));
	CHECK(ck.adjacent(BlockFace::YNeg) == ChunkKey(8, 3, 2));
	CHECK(ck.adjacent(BlockFace::ZPos) == ChunkKey(8, 4, 3));
	CHECK(ck.adjacent(BlockFace::ZNeg) == ChunkKey(8, 4, 1));
}

TEST_CASE("'ChunkKey' from block coordinates", "[cubeland::land::chunk_key]")
{
	CHECK(ChunkKey::fromBlock(glm::ivec3(0)) == ChunkKey(0, 0, 0));
	CHECK(ChunkKey::fromBlock(glm::ivec3(31)) == ChunkKey(0, 0, 0));
	CHECK(ChunkKey::fromBlock(glm::ivec3(32, 63, 64)) == ChunkKey(1, 1, 2));

	// Negative coordinates round towards negative infinity
	CHECK(ChunkKey::fromBlock(glm::ivec3(-1, -32, -33)) == ChunkKey(-1, -1, -2));
}

TEST_CASE("'ChunkKey' hashing", "[cubeland::land::chunk_key]")
{
	std::unordered_set<ChunkKey> keys;
	for (int32_t x = -4; x <= 4; x++) {
		for (int32_t y = -4; y <= 4; y++) {
			for (int32_t z = -4; z <= 4; z++) {
				keys.emplace(x, y, z);
			}
		}
	}

	CHECK(keys.size() == 9 * 9 * 9);
	CHECK(keys.contains(ChunkKey(-4, 0, 4)));
	CHECK(ChunkKey(1, 2, 3).hash() != ChunkKey(3, 2, 1).hash());
	CHECK(ChunkKey(-1, 0, 0).packed() != ChunkKey(1, 0, 0).packed());
}

} // namespace cubeland::land
