#include <cubeland/land/chunk_mesh.hpp>

#include <algorithm>

namespace cubeland::land
{

ChunkMesh::ChunkMesh(std::vector<ChunkMeshQuad> quads) : m_quads(std::move(quads))
{
	for (const ChunkMeshQuad &quad : m_quads) {
		m_layers.emplace_back(quad.atlas_layer);
	}

	std::sort(m_layers.begin(), m_layers.end());
	m_layers.erase(std::unique(m_layers.begin(), m_layers.end()), m_layers.end());
}

size_t ChunkMesh::numQuadsFacing(BlockFace face) const noexcept
{
	return size_t(std::count_if(m_quads.begin(), m_quads.end(),
		[face](const ChunkMeshQuad &quad) { return quad.face == face; }));
}

} // namespace cubeland::land
