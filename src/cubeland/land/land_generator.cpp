#include <cubeland/land/land_generator.hpp>

#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/land/land_utils.hpp>
#include <cubeland/util/hash.hpp>

#include <glm/geometric.hpp>
#include <glm/vec2.hpp>
#include <glm/vector_relational.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>

namespace cubeland::land
{

namespace
{

constexpr int32_t N = Consts::CHUNK_SIZE_BLOCKS;

// Sub-seed domains, every noise field gets an independent sequence
constexpr uint64_t HEIGHT_NOISE_DOMAIN = 0x48'45'49'47'48'54;
constexpr uint64_t TREE_DOMAIN = 0x54'52'45'45'53;

constexpr int32_t TREE_CANOPY_RADIUS = 2;
constexpr int32_t TREE_MIN_TRUNK = 4;
constexpr int32_t TREE_TRUNK_VARIANCE = 3;

// Simplex noise output is within about +-1/70 with our gradients
constexpr double SIMPLEX_SCALE = 70.0;

glm::dvec2 grad(int32_t x, int32_t z, uint64_t seed) noexcept
{
	uint64_t kek = Hash::combine(seed, (uint64_t(uint32_t(x)) << 32) | uint64_t(uint32_t(z)));

	uint32_t k1 = uint32_t(kek >> 32);
	uint32_t k2 = uint32_t(kek);

	constexpr uint32_t S = 1u << 31;
	constexpr uint32_t M = 16777215u;
	double gx = ((k1 & S) ? -double(k1 & M) : double(k1 & M)) / double(M);
	double gz = ((k2 & S) ? -double(k2 & M) : double(k2 & M)) / double(M);
	return glm::dvec2(gx, gz);
}

double sampleRawSimplexNoise(double x, double z, uint64_t seed) noexcept
{
	constexpr double F = 0.3660254038;
	constexpr double G = 0.2113248654;

	const double skew = (x + z) * F;
	const double x0d = std::floor(x + skew);
	const double z0d = std::floor(z + skew);
	const auto x0 = static_cast<int32_t>(x0d);
	const auto z0 = static_cast<int32_t>(z0d);

	const double unskew = (x0d + z0d) * G;
	const glm::dvec2 r0(x - (x0d - unskew), z - (z0d - unskew));

	// Pick the middle simplex corner depending on the triangle we're in
	const int32_t i1 = r0.x >= r0.y ? 1 : 0;
	const int32_t j1 = r0.x >= r0.y ? 0 : 1;

	const glm::dvec2 r1(r0.x - double(i1) + G, r0.y - double(j1) + G);
	const glm::dvec2 r2(r0.x - 1.0 + 2.0 * G, r0.y - 1.0 + 2.0 * G);

	auto contribution = [seed](glm::dvec2 r, int32_t gx, int32_t gz) {
		double d = std::max(0.0, 0.5 - glm::dot(r, r));
		d *= d;
		return d * d * glm::dot(grad(gx, gz, seed), r);
	};

	const double result = contribution(r0, x0, z0) + contribution(r1, x0 + i1, z0 + j1)
		+ contribution(r2, x0 + 1, z0 + 1);
	return std::clamp(SIMPLEX_SCALE * result, -1.0, 1.0);
}

double sampleOctavedSimplexNoise(const GeneratorParams &params, double x, double z, uint64_t seed) noexcept
{
	double sum = 0.0;
	double norm = 0.0;
	double amplitude = 1.0;
	double frequency = params.frequency;

	for (int32_t i = 0; i < params.octaves; i++) {
		sum += amplitude * sampleRawSimplexNoise(x * frequency, z * frequency, Hash::combine(seed, uint64_t(i)));
		norm += amplitude;
		amplitude *= params.persistence;
		frequency *= params.lacunarity;
	}

	return norm > 0.0 ? sum / norm : 0.0;
}

int32_t floorDiv(int32_t a, int32_t b) noexcept
{
	int32_t q = a / b;
	return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

struct TreeSpot {
	glm::ivec3 base;
	int32_t trunk_height;
	uint64_t shape_bits;
};

} // namespace

Generator::Generator(GeneratorParams params) noexcept : m_params(params) {}

int32_t Generator::columnHeight(int32_t x, int32_t z, uint64_t seed) const noexcept
{
	const uint64_t noise_seed = Hash::combine(seed, HEIGHT_NOISE_DOMAIN);
	// Sample at block centers
	const double noise = sampleOctavedSimplexNoise(m_params, double(x) + 0.5, double(z) + 0.5, noise_seed);
	const auto height = static_cast<int32_t>(std::lround(double(m_params.base_height) + m_params.amplitude * noise));

	// Bedrock is always there
	return std::max(height, Consts::WORLD_FLOOR_Y + 1);
}

BlockId Generator::columnBlock(int32_t y, int32_t height) const noexcept
{
	if (y < Consts::WORLD_FLOOR_Y) {
		return BlockRegistry::BlockAir;
	}
	if (y == Consts::WORLD_FLOOR_Y) {
		return BlockRegistry::BlockBedrock;
	}

	const int32_t top = height - 1;
	if (y > top) {
		return y < m_params.sea_level ? BlockRegistry::BlockWater : BlockRegistry::BlockAir;
	}

	const bool subsurface = y >= top - m_params.dirt_depth;

	if (top < m_params.sea_level) {
		// Sea bottom
		if (y == top) {
			return BlockRegistry::BlockGravel;
		}
		return subsurface ? BlockRegistry::BlockSand : BlockRegistry::BlockStone;
	}

	if (top <= m_params.sea_level + 1) {
		// Shore
		return subsurface ? BlockRegistry::BlockSand : BlockRegistry::BlockStone;
	}

	if (y == top) {
		return BlockRegistry::BlockGrass;
	}
	return subsurface ? BlockRegistry::BlockDirt : BlockRegistry::BlockStone;
}

void Generator::generateChunk(ChunkKey key, uint64_t seed, Chunk &output) const
{
	const glm::ivec3 first = key.firstBlock();

	if (first.y + N <= Consts::WORLD_FLOOR_Y) {
		// Below the world floor
		output.setAllBlocksUniform(BlockRegistry::BlockAir);
		return;
	}

	int32_t heights[N][N];
	for (int32_t x = 0; x < N; x++) {
		for (int32_t z = 0; z < N; z++) {
			heights[x][z] = columnHeight(first.x + x, first.z + z, seed);
		}
	}

	// Allocate on heap, the array is pretty large
	auto ids = std::make_unique<Chunk::BlockIdArray>();

	Utils::forYXZ<N>([&](uint32_t x, uint32_t y, uint32_t z) {
		ids->store(x, y, z, columnBlock(first.y + int32_t(y), heights[x][z]));
	});

	if (m_params.tree_density > 0.0) {
		placeTrees(key, seed, *ids);
	}

	output.setAllBlocks(*ids);
}

void Generator::placeTrees(ChunkKey key, uint64_t seed, Chunk::BlockIdArray &ids) const noexcept
{
	const uint64_t tree_seed = Hash::combine(seed, TREE_DOMAIN);
	const glm::ivec3 first = key.firstBlock();

	// Returns a tree of the given cell if there is one. Candidate offsets keep
	// the canopy inside the cell, so trees of different cells never overlap.
	auto tree_in_cell = [&](int32_t cx, int32_t cz) -> std::optional<TreeSpot> {
		const uint64_t h = Hash::combine(tree_seed, uint64_t(uint32_t(cx)), uint64_t(uint32_t(cz)));
		const double roll = double(h >> 11) * 0x1.0p-53;
		if (roll >= m_params.tree_density) {
			return std::nullopt;
		}

		constexpr int32_t SPAN = TREE_CELL_SIZE - 2 * TREE_CANOPY_RADIUS;
		const int32_t x = cx * TREE_CELL_SIZE + TREE_CANOPY_RADIUS + int32_t((h >> 3) % SPAN);
		const int32_t z = cz * TREE_CELL_SIZE + TREE_CANOPY_RADIUS + int32_t((h >> 7) % SPAN);

		const int32_t height = columnHeight(x, z, seed);
		if (columnBlock(height - 1, height) != BlockRegistry::BlockGrass) {
			return std::nullopt;
		}

		const int32_t trunk = TREE_MIN_TRUNK + int32_t((h >> 13) % TREE_TRUNK_VARIANCE);
		return TreeSpot { glm::ivec3(x, height, z), trunk, h >> 32 };
	};

	auto store_if = [&](glm::ivec3 world, BlockId id, bool only_into_air) {
		const glm::ivec3 local = world - first;
		if (glm::any(glm::lessThan(local, glm::ivec3(0))) || glm::any(glm::greaterThanEqual(local, glm::ivec3(N)))) {
			return;
		}
		if (only_into_air && ids[local] != BlockRegistry::BlockAir) {
			return;
		}
		ids[local] = id;
	};

	const int32_t cx_begin = floorDiv(first.x - TREE_CANOPY_RADIUS, TREE_CELL_SIZE);
	const int32_t cx_end = floorDiv(first.x + N + TREE_CANOPY_RADIUS, TREE_CELL_SIZE);
	const int32_t cz_begin = floorDiv(first.z - TREE_CANOPY_RADIUS, TREE_CELL_SIZE);
	const int32_t cz_end = floorDiv(first.z + N + TREE_CANOPY_RADIUS, TREE_CELL_SIZE);

	for (int32_t cx = cx_begin; cx <= cx_end; cx++) {
		for (int32_t cz = cz_begin; cz <= cz_end; cz++) {
			const std::optional<TreeSpot> spot = tree_in_cell(cx, cz);
			if (!spot) {
				continue;
			}

			const int32_t top = spot->base.y + spot->trunk_height - 1;
			if (spot->base.y >= first.y + N || top + 1 < first.y) {
				continue;
			}

			for (int32_t i = 0; i < spot->trunk_height; i++) {
				store_if(spot->base + glm::ivec3(0, i, 0), BlockRegistry::BlockWood, false);
			}

			// Two wide layers around the trunk top and a narrow cap above it
			for (int32_t y = top - 1; y <= top + 1; y++) {
				const int32_t r = y <= top ? TREE_CANOPY_RADIUS : 1;

				for (int32_t dx = -r; dx <= r; dx++) {
					for (int32_t dz = -r; dz <= r; dz++) {
						const bool corner = std::abs(dx) == r && std::abs(dz) == r;
						if (corner) {
							// Narrow cap is plus-shaped, wide layers lose random corners
							const int corner_bit = (y - top + 1) * 4 + (dx > 0 ? 2 : 0) + (dz > 0 ? 1 : 0);
							if (r == 1 || (spot->shape_bits >> corner_bit) & 1u) {
								continue;
							}
						}

						store_if(glm::ivec3(spot->base.x + dx, y, spot->base.z + dz), BlockRegistry::BlockLeaves,
							true);
					}
				}
			}
		}
	}
}

} // namespace cubeland::land
