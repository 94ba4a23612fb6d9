#include <cubeland/land/chunk_store.hpp>
#include <cubeland/world/voxel_raycast.hpp>

#include "../../cubeland_test_common.hpp"

#include <memory>

namespace cubeland::world
{

namespace
{

using land::BlockRegistry;

// Store with one loaded chunk (0, 1, 0) of pure air, flat ground is far below
std::unique_ptr<land::ChunkStore> makeAirStore()
{
	land::GeneratorParams params;
	params.base_height = 8;
	params.amplitude = 0.0;
	params.sea_level = 0;
	params.tree_density = 0.0;

	auto store = std::make_unique<land::ChunkStore>(land::Generator(params), 1);
	store->load(land::ChunkKey(0, 1, 0));
	return store;
}

} // namespace

TEST_CASE("'VoxelRaycaster' hits isolated block from every side", "[cubeland::world::raycast]")
{
	auto store = makeAirStore();
	const glm::ivec3 target(10, 40, 10);
	REQUIRE_FALSE(store->applyEdit(target, BlockRegistry::BlockCobble));

	const glm::dvec3 center = glm::dvec3(target) + 0.5;

	for (uint32_t i = 0; i < land::NUM_BLOCK_FACES; i++) {
		const auto face = land::BlockFace(i);
		const glm::dvec3 normal = glm::dvec3(land::faceNormal(face));
		INFO("From " << extras::enum_name(face));

		// Shoot at the block center from 3 blocks away along the face normal
		auto hit = VoxelRaycaster::cast(center + normal * 3.0, -normal, 10.0, *store);
		REQUIRE(hit.has_value());
		CHECK(hit->block == target);
		CHECK(hit->normal == land::faceNormal(face));
		CHECK(hit->block_id == BlockRegistry::BlockCobble);
		CHECK(hit->chunk == land::ChunkKey(0, 1, 0));
		CHECK(hit->local == glm::uvec3(10, 8, 10));
		CHECK(hit->distance == Approx(2.5));
		CHECK(hit->point.x == Approx(center.x + normal.x * 0.5));
		CHECK(hit->point.y == Approx(center.y + normal.y * 0.5));
		CHECK(hit->point.z == Approx(center.z + normal.z * 0.5));
		CHECK(hit->adjacentBlock() == target + land::faceNormal(face));
	}
}

TEST_CASE("'VoxelRaycaster' respects max distance", "[cubeland::world::raycast]")
{
	auto store = makeAirStore();
	REQUIRE_FALSE(store->applyEdit(glm::ivec3(10, 40, 10), BlockRegistry::BlockCobble));

	const glm::dvec3 origin(5.5, 40.5, 10.5);
	CHECK(VoxelRaycaster::cast(origin, glm::dvec3(1, 0, 0), 4.4, *store).has_value() == false);
	CHECK(VoxelRaycaster::cast(origin, glm::dvec3(1, 0, 0), 4.5, *store).has_value());
	// Direction length does not matter
	CHECK(VoxelRaycaster::cast(origin, glm::dvec3(100, 0, 0), 4.5, *store).has_value());

	// Degenerate input
	CHECK_FALSE(VoxelRaycaster::cast(origin, glm::dvec3(0.0), 10.0, *store).has_value());
	CHECK_FALSE(VoxelRaycaster::cast(origin, glm::dvec3(1, 0, 0), 0.0, *store).has_value());
	CHECK_FALSE(VoxelRaycaster::cast(origin, glm::dvec3(1, 0, 0), -5.0, *store).has_value());

	// Missing the block
	CHECK_FALSE(VoxelRaycaster::cast(origin, glm::dvec3(1, 1, 0), 20.0, *store).has_value());
}

TEST_CASE("'VoxelRaycaster' edge cases", "[cubeland::world::raycast]")
{
	auto store = makeAirStore();

	SECTION("Origin inside a solid block")
	{
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(4, 36, 4), BlockRegistry::BlockStone));
		auto hit = VoxelRaycaster::cast(glm::dvec3(4.5, 36.5, 4.5), glm::dvec3(0, 1, 0), 5.0, *store);
		REQUIRE(hit.has_value());
		CHECK(hit->block == glm::ivec3(4, 36, 4));
		CHECK(hit->normal == glm::ivec3(0));
		CHECK(hit->distance == 0.0);
	}

	SECTION("Unloaded space is transparent")
	{
		// Goes down through the unloaded chunk Y=0, not seeing its ground
		CHECK_FALSE(VoxelRaycaster::cast(glm::dvec3(4.5, 33.5, 4.5), glm::dvec3(0, -1, 0), 30.0, *store).has_value());
	}

	SECTION("Water is not picked")
	{
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(4, 36, 4), BlockRegistry::BlockWater));
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(4, 37, 4), BlockRegistry::BlockGlass));
		auto hit = VoxelRaycaster::cast(glm::dvec3(4.5, 34.5, 4.5), glm::dvec3(0, 1, 0), 5.0, *store);
		REQUIRE(hit.has_value());
		CHECK(hit->block == glm::ivec3(4, 37, 4));
		CHECK(hit->normal == glm::ivec3(0, -1, 0));
	}

	SECTION("Ties prefer X boundary")
	{
		// The ray goes exactly through the corner shared by (5,40,5), (6,40,5), (5,41,5) and (6,41,5)
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(6, 40, 5), BlockRegistry::BlockStone));
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(5, 41, 5), BlockRegistry::BlockStone));

		auto hit = VoxelRaycaster::cast(glm::dvec3(5.5, 40.5, 5.5), glm::dvec3(1, 1, 0), 5.0, *store);
		REQUIRE(hit.has_value());
		CHECK(hit->block == glm::ivec3(6, 40, 5));
		CHECK(hit->normal == glm::ivec3(-1, 0, 0));

		// Same result every time
		auto hit2 = VoxelRaycaster::cast(glm::dvec3(5.5, 40.5, 5.5), glm::dvec3(1, 1, 0), 5.0, *store);
		REQUIRE(hit2.has_value());
		CHECK(hit2->block == hit->block);
		CHECK(hit2->distance == hit->distance);
	}

	SECTION("Negative coordinates")
	{
		store->load(land::ChunkKey(-1, 1, -1));
		REQUIRE_FALSE(store->applyEdit(glm::ivec3(-3, 40, -7), BlockRegistry::BlockBricks));

		auto hit = VoxelRaycaster::cast(glm::dvec3(-0.5, 40.5, -6.5), glm::dvec3(-1, 0, 0), 5.0, *store);
		REQUIRE(hit.has_value());
		CHECK(hit->block == glm::ivec3(-3, 40, -7));
		CHECK(hit->chunk == land::ChunkKey(-1, 1, -1));
		CHECK(hit->local == glm::uvec3(29, 8, 25));
		CHECK(hit->normal == glm::ivec3(1, 0, 0));
		CHECK(hit->distance == Approx(1.5));
	}
}

} // namespace cubeland::world
