#pragma once

#include <cubeland/land/block_registry.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <vector>

namespace cubeland::land
{

// Vertices are in chunk-local block units, i.e. in [0; CHUNK_SIZE_BLOCKS]^3.
// Winding is counter-clockwise when looking at the quad against its normal.
// UVs span the merged rectangle, one texture repeat per block.
struct ChunkMeshQuad {
	glm::vec3 positions[4];
	glm::vec3 normal;
	glm::vec2 uvs[4];
	uint32_t atlas_layer;
	BlockId block_id;
	BlockFace face;
	// Quad of a transparent block, must be drawn after all opaque geometry
	bool transparent;
};

// Immutable result of meshing one chunk. Rebuilt from scratch on every remesh,
// renderer holds it via shared pointer and never sees partial updates.
class CUBELAND_API ChunkMesh {
public:
	ChunkMesh() = default;
	explicit ChunkMesh(std::vector<ChunkMeshQuad> quads);

	const std::vector<ChunkMeshQuad> &quads() const noexcept { return m_quads; }
	size_t numQuads() const noexcept { return m_quads.size(); }
	bool empty() const noexcept { return m_quads.empty(); }

	size_t numQuadsFacing(BlockFace face) const noexcept;

	// Sorted list of distinct texture atlas layers referenced by quads
	const std::vector<uint32_t> &referencedLayers() const noexcept { return m_layers; }

private:
	std::vector<ChunkMeshQuad> m_quads;
	std::vector<uint32_t> m_layers;
};

} // namespace cubeland::land
