#pragma once

#include <cubeland/land/chunk_key.hpp>
#include <cubeland/land/land_chunk.hpp>
#include <cubeland/land/land_generator.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace cubeland::land
{

class ChunkMesher;

// Owns all loaded chunks, at most one per key. Single-threaded.
// Block contents change only through `applyEdit` after a chunk is loaded.
class CUBELAND_API ChunkStore {
public:
	ChunkStore(Generator generator, uint64_t seed);
	ChunkStore(ChunkStore &&) = delete;
	ChunkStore(const ChunkStore &) = delete;
	ChunkStore &operator=(ChunkStore &&) = delete;
	ChunkStore &operator=(const ChunkStore &) = delete;
	~ChunkStore();

	const Generator &generator() const noexcept { return m_generator; }
	uint64_t seed() const noexcept { return m_seed; }

	// Null if the chunk is not loaded
	const Chunk *get(ChunkKey key) const noexcept;

	// Generate the chunk and mark it and all its loaded neighbors dirty.
	// Returns false (and does nothing) if it is already loaded.
	bool load(ChunkKey key);
	// Drop the chunk with its mesh. Neighbors keep their meshes.
	// Returns false if it was not loaded.
	bool unload(ChunkKey key);

	// Set block at world coordinate `block` to `id`. Rejected edits change nothing
	// and return `UnknownBlock` or `ChunkNotLoaded`. Writing the ID already present
	// succeeds without marking anything dirty.
	std::error_condition applyEdit(glm::ivec3 block, BlockId id);

	// Rebuild meshes of all dirty chunks, returns the number of rebuilt meshes
	size_t remeshDirtyChunks(ChunkMesher &mesher);

	// Block ID at world coordinate, empty if its chunk is not loaded
	std::optional<BlockId> blockAt(glm::ivec3 block) const noexcept;
	// Whether world-space point is inside a solid block. Unloaded space is not solid.
	bool isSolidAt(const glm::dvec3 &pos) const noexcept;
	bool isSolidBlock(glm::ivec3 block) const noexcept;

	// The chunk with its loaded neighbors, it must be loaded itself
	ChunkAdjacencyRef adjacency(const Chunk &chunk) const noexcept;

	void forEachChunk(const std::function<void(const Chunk &)> &fn) const;

	size_t size() const noexcept { return m_chunks.size(); }
	size_t numDirty() const noexcept { return m_dirty_keys.size(); }

private:
	Generator m_generator;
	uint64_t m_seed;
	std::unordered_map<ChunkKey, std::unique_ptr<Chunk>> m_chunks;
	// May contain keys of already unloaded or remeshed chunks, they are skipped
	std::vector<ChunkKey> m_dirty_keys;

	Chunk *find(ChunkKey key) noexcept;
	void markDirty(Chunk &chunk);
};

} // namespace cubeland::land
