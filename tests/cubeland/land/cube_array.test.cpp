#include <cubeland/land/cube_array.hpp>

#include "../../test_common.hpp"

namespace cubeland::land
{

TEST_CASE("'CubeArray' sanity check", "[cubeland::land::cube_array]")
{
	CubeArray<uint16_t, 16> arr;
	CHECK(sizeof(arr) == sizeof(uint16_t) * 16 * 16 * 16);
	CHECK(arr.size() == 16 * 16 * 16);

	constexpr uint16_t A = 0x1234;
	arr.fill(A);
	CHECK(arr[glm::uvec3(15)] == A);
	CHECK(arr.data[15][0][7] == A);

	// YXZ order
	arr.store(1u, 2u, 3u, 7);
	CHECK(arr.data[2][1][3] == 7);
	CHECK(arr.load(1, 2, 3) == 7);
	CHECK(arr[glm::ivec3(1, 2, 3)] == 7);

	constexpr uint16_t B = 0x4321;
	arr.fill(glm::uvec3(1, 2, 3), glm::uvec3(3), B);

	// Corners of updated region
	CHECK(arr.data[2][1][3] == B);
	CHECK(arr.data[4][3][5] == B);

	// Just outside of updated region
	CHECK(arr.data[1][1][3] == A);
	CHECK(arr.data[2][0][3] == A);
	CHECK(arr.data[2][1][2] == A);
	CHECK(arr.data[5][3][5] == A);
	CHECK(arr.data[4][4][5] == A);
	CHECK(arr.data[4][3][6] == A);
}

TEST_CASE("'CubeArray' insert check", "[cubeland::land::cube_array]")
{
	CubeArray<uint32_t, 6> big;
	CubeArray<uint32_t, 3> small;

	big.fill(0);
	small.fill(5);
	small.data[0][1][2] = 9;

	big.insertFrom(glm::uvec3(1, 2, 3), small);
	// `base` is (x, y, z) while storage is YXZ
	CHECK(big.data[2][1][3] == 5);
	CHECK(big.data[2][2][5] == 9);
	CHECK(big.data[4][3][5] == 5);
	CHECK(big.data[1][1][3] == 0);
	CHECK(big.data[5][3][5] == 0);

	CubeArray<uint32_t, 6> copy = big;
	CHECK(copy == big);
	copy.data[0][0][0] = 1;
	CHECK_FALSE(copy == big);
}

} // namespace cubeland::land
