#pragma once

#include <cubeland/land/chunk_mesh.hpp>
#include <cubeland/land/land_chunk.hpp>
#include <cubeland/visibility.hpp>

#include <memory>

namespace cubeland::land
{

// Builds greedy-merged quad meshes of chunks. Keeps scratch buffers
// between calls, so reuse one instance instead of creating it per chunk.
class CUBELAND_API ChunkMesher {
public:
	// Faces of blocks bordering a missing neighbor are hidden as if it was
	// filled with this (opaque) block, it is remeshed once the neighbor loads
	constexpr static BlockId MISSING_NEIGHBOR_FILL = BlockRegistry::BlockBedrock;

	ChunkMesher();
	ChunkMesher(ChunkMesher &&) = delete;
	ChunkMesher(const ChunkMesher &) = delete;
	ChunkMesher &operator=(ChunkMesher &&) = delete;
	ChunkMesher &operator=(const ChunkMesher &) = delete;
	~ChunkMesher();

	// Result depends only on block IDs of `adj.chunk` and the touching layers of `adj.adjacent`
	ChunkMesh mesh(const ChunkAdjacencyRef &adj);

	// Whether the face of `block` looking at `neighbor` must be drawn
	static bool isFaceVisible(BlockId block, BlockId neighbor) noexcept;

private:
	std::unique_ptr<ChunkAdjacencyRef::ExpandedArray> m_expanded;
};

} // namespace cubeland::land
