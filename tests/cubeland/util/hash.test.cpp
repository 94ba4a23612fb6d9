#include <cubeland/util/hash.hpp>

#include "../../test_common.hpp"

#include <string_view>

namespace cubeland
{

TEST_CASE("xxh64Fixed", "[cubeland::hash]")
{
	// Compare against values from reference XXH64 implementation with seed 0
	CHECK(Hash::xxh64Fixed(0) == 0x34C96ACDCADB1BBB);

	CHECK(Hash::xxh64Fixed(0xC20369A413E28FC1) == 0xE887D97F3EFE7B44);
	CHECK(Hash::xxh64Fixed(0xC722205F1C53D89F) == 0x68BEC6640212567D);
	CHECK(Hash::xxh64Fixed(0x146AEAC22CD734F6) == 0xECFBB0C2A1E3E878);
}

TEST_CASE("Hash::combine", "[cubeland::hash]")
{
	CHECK(Hash::combine(1, 2) == Hash::combine(1, 2));
	CHECK(Hash::combine(1, 2) != Hash::combine(2, 1));
	CHECK(Hash::combine(1, 2, 3) != Hash::combine(1, 3, 2));
	CHECK(Hash::combine(0, 0) != Hash::combine(0, 1));
}

TEST_CASE("checksumCrc32", "[cubeland::hash]")
{
	using namespace std::string_view_literals;

	// The standard CRC-32 check value
	constexpr auto check = "123456789"sv;
	CHECK(checksumCrc32(std::as_bytes(std::span(check.data(), check.size()))) == 0xCBF43926u);

	CHECK(checksumCrc32({}) == 0u);
}

} // namespace cubeland
