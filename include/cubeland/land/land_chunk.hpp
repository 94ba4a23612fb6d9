#pragma once

#include <cubeland/land/block_registry.hpp>
#include <cubeland/land/chunk_key.hpp>
#include <cubeland/land/cube_array.hpp>
#include <cubeland/visibility.hpp>

#include <memory>

namespace cubeland::land
{

class ChunkMesh;

// Lifecycle of a chunk inside `ChunkStore`:
//   Unloaded -> Generating -> Ready
//   Ready -> Dirty -> Remeshing -> Ready
//   Ready|Dirty -> Unloaded
enum class ChunkState : uint8_t {
	Unloaded,
	Generating,
	Ready,
	Dirty,
	Remeshing,
};

class CUBELAND_API Chunk {
public:
	using BlockIdArray = CubeArray<BlockId, Consts::CHUNK_SIZE_BLOCKS>;

	// Creates chunk filled with air in `Unloaded` state
	explicit Chunk(ChunkKey key) noexcept;
	Chunk(Chunk &&) = delete;
	Chunk(const Chunk &) = delete;
	Chunk &operator=(Chunk &&) = delete;
	Chunk &operator=(const Chunk &) = delete;
	~Chunk();

	ChunkKey key() const noexcept { return m_key; }
	ChunkState state() const noexcept { return m_state; }
	bool dirty() const noexcept { return m_state == ChunkState::Dirty; }

	const BlockIdArray &blockIds() const noexcept { return m_block_ids; }
	BlockId blockAt(glm::uvec3 local) const noexcept { return m_block_ids[local]; }

	// Bulk fill, intended for generation. Edits of loaded chunks go through `ChunkStore`.
	void setAllBlocks(const BlockIdArray &ids) noexcept;
	void setAllBlocksUniform(BlockId value) noexcept;

	// The most recently built mesh, null if the chunk was never meshed
	const std::shared_ptr<const ChunkMesh> &mesh() const noexcept { return m_mesh; }
	// Incremented on every mesh replacement
	uint32_t meshVersion() const noexcept { return m_mesh_version; }

	// CRC32 of the block grid, cheap way to compare chunk contents
	uint32_t checksum() const noexcept;

private:
	ChunkKey m_key;
	ChunkState m_state = ChunkState::Unloaded;
	uint32_t m_mesh_version = 0;
	std::shared_ptr<const ChunkMesh> m_mesh;
	BlockIdArray m_block_ids;

	// Lifecycle and single-block mutation are owned by the store
	friend class ChunkStore;

	void setBlock(glm::uvec3 local, BlockId id) noexcept { m_block_ids[local] = id; }
	void setState(ChunkState state) noexcept { m_state = state; }
	void setMesh(std::shared_ptr<const ChunkMesh> mesh) noexcept;
};

// A chunk together with its six face-adjacent neighbors (cubemap order: X+, X-, Y+, Y-, Z+, Z-).
// Null entries mean the neighbor is not loaded.
struct CUBELAND_API ChunkAdjacencyRef {
	constexpr static uint32_t SIZE = Consts::CHUNK_SIZE_BLOCKS + 2;
	using ExpandedArray = CubeArray<BlockId, SIZE>;

	const Chunk &chunk;
	const Chunk *adjacent[NUM_BLOCK_FACES];

	// Copy block IDs of the chunk into the center of (N+2)^3 array and the touching
	// layers of adjacent chunks into its borders. Borders facing missing neighbors
	// are filled with `missing_fill`. Edge and corner lines stay air, nobody reads them.
	void expandBlockIds(ExpandedArray &out, BlockId missing_fill) const noexcept;
};

} // namespace cubeland::land

namespace extras
{

template<>
CUBELAND_API std::string_view enum_name(cubeland::land::ChunkState value) noexcept;

}
