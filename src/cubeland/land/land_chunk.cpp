#include <cubeland/land/land_chunk.hpp>

#include <cubeland/land/chunk_mesh.hpp>
#include <cubeland/util/hash.hpp>

#include <span>

namespace cubeland::land
{

Chunk::Chunk(ChunkKey key) noexcept : m_key(key)
{
	m_block_ids.fill(BlockRegistry::BlockAir);
}

Chunk::~Chunk() = default;

void Chunk::setAllBlocks(const BlockIdArray &ids) noexcept
{
	m_block_ids = ids;
}

void Chunk::setAllBlocksUniform(BlockId value) noexcept
{
	m_block_ids.fill(value);
}

uint32_t Chunk::checksum() const noexcept
{
	return checksumCrc32(std::as_bytes(std::span(m_block_ids.begin(), m_block_ids.size())));
}

void Chunk::setMesh(std::shared_ptr<const ChunkMesh> mesh) noexcept
{
	m_mesh = std::move(mesh);
	m_mesh_version++;
}

void ChunkAdjacencyRef::expandBlockIds(ExpandedArray &out, BlockId missing_fill) const noexcept
{
	constexpr static uint32_t N = Consts::CHUNK_SIZE_BLOCKS;

	// Clear everything (second data pass but greatly simplifies the code)
	out.fill(BlockRegistry::BlockAir);

	// Fill the main part (always available)
	out.insertFrom(glm::uvec3(1), chunk.blockIds());

	// Index of the border layer in expanded array and the source layer in neighbor
	auto copy_layer = [&](BlockFace face, uint32_t dst_layer, uint32_t src_layer) {
		const int axis = faceAxis(face);
		const int u_axis = (axis + 1) % 3;
		const int v_axis = (axis + 2) % 3;
		const Chunk *neighbor = adjacent[extras::to_underlying(face)];

		for (uint32_t v = 0; v < N; v++) {
			for (uint32_t u = 0; u < N; u++) {
				glm::uvec3 dst;
				dst[axis] = dst_layer;
				dst[u_axis] = u + 1;
				dst[v_axis] = v + 1;

				if (neighbor) {
					glm::uvec3 src;
					src[axis] = src_layer;
					src[u_axis] = u;
					src[v_axis] = v;
					out[dst] = neighbor->blockAt(src);
				} else {
					out[dst] = missing_fill;
				}
			}
		}
	};

	// Positive neighbors give their lowest layer, negative ones their highest
	copy_layer(BlockFace::XPos, N + 1, 0);
	copy_layer(BlockFace::XNeg, 0, N - 1);
	copy_layer(BlockFace::YPos, N + 1, 0);
	copy_layer(BlockFace::YNeg, 0, N - 1);
	copy_layer(BlockFace::ZPos, N + 1, 0);
	copy_layer(BlockFace::ZNeg, 0, N - 1);
}

} // namespace cubeland::land

namespace extras
{

using cubeland::land::ChunkState;

template<>
std::string_view enum_name(ChunkState value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case ChunkState::Unloaded:
		return "Unloaded"sv;
	case ChunkState::Generating:
		return "Generating"sv;
	case ChunkState::Ready:
		return "Ready"sv;
	case ChunkState::Dirty:
		return "Dirty"sv;
	case ChunkState::Remeshing:
		return "Remeshing"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "Invalid"sv;
}

} // namespace extras
