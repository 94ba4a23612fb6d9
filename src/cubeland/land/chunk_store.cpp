#include <cubeland/land/chunk_store.hpp>

#include <cubeland/land/chunk_mesher.hpp>
#include <cubeland/land/land_utils.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/log.hpp>

namespace cubeland::land
{

ChunkStore::ChunkStore(Generator generator, uint64_t seed) : m_generator(generator), m_seed(seed) {}

ChunkStore::~ChunkStore() = default;

const Chunk *ChunkStore::get(ChunkKey key) const noexcept
{
	auto iter = m_chunks.find(key);
	return iter != m_chunks.end() ? iter->second.get() : nullptr;
}

Chunk *ChunkStore::find(ChunkKey key) noexcept
{
	auto iter = m_chunks.find(key);
	return iter != m_chunks.end() ? iter->second.get() : nullptr;
}

bool ChunkStore::load(ChunkKey key)
{
	if (m_chunks.contains(key)) {
		return false;
	}

	auto chunk = std::make_unique<Chunk>(key);
	chunk->setState(ChunkState::Generating);
	m_generator.generateChunk(key, m_seed, *chunk);
	chunk->setState(ChunkState::Ready);

	Chunk &ref = *chunk;
	m_chunks.emplace(key, std::move(chunk));
	Log::trace("Loaded chunk ({}, {}, {})", key.x, key.y, key.z);

	markDirty(ref);
	// Neighbors have hidden their faces towards us while we were missing
	for (uint32_t i = 0; i < NUM_BLOCK_FACES; i++) {
		if (Chunk *adj = find(key.adjacent(BlockFace(i))); adj) {
			markDirty(*adj);
		}
	}

	return true;
}

bool ChunkStore::unload(ChunkKey key)
{
	auto iter = m_chunks.find(key);
	if (iter == m_chunks.end()) {
		return false;
	}

	iter->second->setState(ChunkState::Unloaded);
	m_chunks.erase(iter);
	Log::trace("Unloaded chunk ({}, {}, {})", key.x, key.y, key.z);
	return true;
}

std::error_condition ChunkStore::applyEdit(glm::ivec3 block, BlockId id)
{
	if (!BlockRegistry::isValid(id)) {
		Log::warn("Rejected edit at ({}, {}, {}): unknown block ID {}", block.x, block.y, block.z, id);
		return CubelandErrc::UnknownBlock;
	}

	const ChunkKey key = ChunkKey::fromBlock(block);
	Chunk *chunk = find(key);
	if (!chunk) {
		Log::warn("Rejected edit at ({}, {}, {}): chunk is not loaded", block.x, block.y, block.z);
		return CubelandErrc::ChunkNotLoaded;
	}

	const glm::uvec3 local = Utils::localBlock(block);
	if (chunk->blockAt(local) == id) {
		return {};
	}

	chunk->setBlock(local, id);
	markDirty(*chunk);

	// Neighbors see the edited block through their border layer
	constexpr uint32_t LAST = Consts::CHUNK_SIZE_BLOCKS - 1;
	for (int axis = 0; axis < 3; axis++) {
		BlockFace face = BlockFace::EnumSize;
		if (local[axis] == LAST) {
			face = BlockFace(2 * axis);
		} else if (local[axis] == 0) {
			face = BlockFace(2 * axis + 1);
		} else {
			continue;
		}

		if (Chunk *adj = find(key.adjacent(face)); adj) {
			markDirty(*adj);
		}
	}

	return {};
}

size_t ChunkStore::remeshDirtyChunks(ChunkMesher &mesher)
{
	size_t remeshed = 0;

	for (ChunkKey key : m_dirty_keys) {
		Chunk *chunk = find(key);
		if (!chunk || chunk->state() != ChunkState::Dirty) {
			continue;
		}

		chunk->setState(ChunkState::Remeshing);
		chunk->setMesh(std::make_shared<const ChunkMesh>(mesher.mesh(adjacency(*chunk))));
		chunk->setState(ChunkState::Ready);
		remeshed++;
	}

	m_dirty_keys.clear();
	return remeshed;
}

std::optional<BlockId> ChunkStore::blockAt(glm::ivec3 block) const noexcept
{
	const Chunk *chunk = get(ChunkKey::fromBlock(block));
	if (!chunk) {
		return std::nullopt;
	}

	return chunk->blockAt(Utils::localBlock(block));
}

bool ChunkStore::isSolidBlock(glm::ivec3 block) const noexcept
{
	std::optional<BlockId> id = blockAt(block);
	return id.has_value() && BlockRegistry::isSolid(*id);
}

bool ChunkStore::isSolidAt(const glm::dvec3 &pos) const noexcept
{
	return isSolidBlock(Utils::blockAt(pos));
}

ChunkAdjacencyRef ChunkStore::adjacency(const Chunk &chunk) const noexcept
{
	ChunkAdjacencyRef adj { .chunk = chunk, .adjacent = {} };
	for (uint32_t i = 0; i < NUM_BLOCK_FACES; i++) {
		adj.adjacent[i] = get(chunk.key().adjacent(BlockFace(i)));
	}
	return adj;
}

void ChunkStore::forEachChunk(const std::function<void(const Chunk &)> &fn) const
{
	for (const auto &[key, chunk] : m_chunks) {
		fn(*chunk);
	}
}

void ChunkStore::markDirty(Chunk &chunk)
{
	if (chunk.state() == ChunkState::Dirty) {
		return;
	}

	chunk.setState(ChunkState::Dirty);
	m_dirty_keys.emplace_back(chunk.key());
}

} // namespace cubeland::land
