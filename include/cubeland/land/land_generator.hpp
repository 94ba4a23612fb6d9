#pragma once

#include <cubeland/land/chunk_key.hpp>
#include <cubeland/land/land_chunk.hpp>
#include <cubeland/visibility.hpp>

namespace cubeland::land
{

// Tunable terrain generation parameters
struct GeneratorParams {
	// Average height of the terrain surface
	int32_t base_height = 48;
	// Maximal deviation of the surface from `base_height`
	double amplitude = 16.0;
	int32_t octaves = 4;
	// Frequency of the first octave, in 1/blocks
	double frequency = 0.01;
	// Amplitude multiplier between successive octaves
	double persistence = 0.5;
	// Frequency multiplier between successive octaves
	double lacunarity = 2.0;
	// Number of dirt (or sand) layers under the surface block
	int32_t dirt_depth = 3;
	// Air below this height is filled with water
	int32_t sea_level = 44;
	// Probability of a tree in every tree cell, zero disables trees
	double tree_density = 0.3;
};

// Stateless terrain generator. Output depends only on
// the chunk key, the seed and the parameters given at construction.
class CUBELAND_API Generator {
public:
	// Trees are placed at most one per this many blocks along X and Z
	constexpr static int32_t TREE_CELL_SIZE = 8;

	explicit Generator(GeneratorParams params = {}) noexcept;

	const GeneratorParams &params() const noexcept { return m_params; }

	// Fill `output` with block IDs of chunk `key`. Never fails.
	void generateChunk(ChunkKey key, uint64_t seed, Chunk &output) const;

	// Number of terrain blocks in column (x, z) counting from Y = 0,
	// i.e. the Y of the first block above the surface
	int32_t columnHeight(int32_t x, int32_t z, uint64_t seed) const noexcept;

	// Block at height `y` of a column with height `height`, without trees
	BlockId columnBlock(int32_t y, int32_t height) const noexcept;

private:
	GeneratorParams m_params;

	void placeTrees(ChunkKey key, uint64_t seed, Chunk::BlockIdArray &ids) const noexcept;
};

} // namespace cubeland::land
