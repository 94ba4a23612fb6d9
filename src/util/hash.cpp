#include <cubeland/util/hash.hpp>

#define ZLIB_CONST
#include <zlib.h>

#include <bit>
#include <limits>

namespace cubeland
{

namespace Hash
{

uint64_t xxh64Fixed(uint64_t data) noexcept
{
	constexpr uint64_t PRIME1 = 11400714785074694791ULL;
	constexpr uint64_t PRIME2 = 14029467366897019727ULL;
	constexpr uint64_t PRIME3 = 1609587929392839161ULL;
	constexpr uint64_t PRIME4 = 9650029242287828579ULL;
	// `prime5` + fixed 8-byte size
	constexpr uint64_t INIT = 2870177450012600261ULL + 8ULL;

	// Perform one single 64-bit processing step
	data = std::rotl(data * PRIME2, 31) * PRIME1;
	uint64_t result = std::rotl(INIT ^ data, 27) * PRIME1 + PRIME4;
	result ^= result >> 33;
	result *= PRIME2;
	result ^= result >> 29;
	result *= PRIME3;
	result ^= result >> 32;
	return result;
}

uint64_t combine(uint64_t a, uint64_t b) noexcept
{
	// Rotation breaks the symmetry of plain XOR
	return xxh64Fixed(xxh64Fixed(a) ^ std::rotl(b, 29));
}

uint64_t combine(uint64_t a, uint64_t b, uint64_t c) noexcept
{
	return combine(combine(a, b), c);
}

} // namespace Hash

uint32_t checksumCrc32(std::span<const std::byte> data) noexcept
{
	// Size argument to crc32 is `uInt`, not `uLong` or `size_t`.
	// So loop several times if requested size is bigger.
	constexpr size_t limit = std::numeric_limits<uInt>::max();

	uLong crc = crc32(0, Z_NULL, 0);

	while (data.size() >= limit) {
		crc = crc32(crc, reinterpret_cast<const Bytef *>(data.data()), limit);
		data = data.subspan(limit);
	}

	crc = crc32(crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size()));
	return static_cast<uint32_t>(crc);
}

} // namespace cubeland
