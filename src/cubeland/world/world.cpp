#include <cubeland/world/world.hpp>

#include <cubeland/land/land_utils.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/log.hpp>

#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace cubeland::world
{

using land::BlockId;
using land::BlockRegistry;
using land::ChunkKey;

namespace
{

Aabb characterBox(const glm::dvec3 &feet) noexcept
{
	constexpr double HALF_WIDTH = World::CHARACTER_WIDTH * 0.5;
	return Aabb(feet - glm::dvec3(HALF_WIDTH, 0.0, HALF_WIDTH),
		feet + glm::dvec3(HALF_WIDTH, World::CHARACTER_HEIGHT, HALF_WIDTH));
}

Aabb blockBox(glm::ivec3 block) noexcept
{
	return Aabb(glm::dvec3(block), glm::dvec3(block) + 1.0);
}

void logRejectedEdit(std::string_view action, glm::ivec3 block, std::error_condition error)
{
	Log::debug("Rejected {} at ({}, {}, {}): {}", action, block.x, block.y, block.z, error.message());
}

} // namespace

World::World(WorldSettings settings)
	: m_settings(settings)
	, m_store(land::Generator(settings.generator), settings.seed)
	, m_resolver(settings.gravity, settings.max_fall_speed)
	, m_inventory(settings.creative ? Inventory::creativePreset() : Inventory::survivalPreset())
{
	Log::info("Creating {} world with seed {}", settings.creative ? "creative" : "survival", settings.seed);

	// Load the spawn area first, spawn height depends on loaded blocks
	m_character.box = characterBox(glm::dvec3(0.5, 0.0, 0.5));
	updateLoadedArea();
	m_character.box = characterBox(glm::dvec3(0.5, spawnHeight(0, 0), 0.5));

	const glm::dvec3 feet = m_character.feetPosition();
	Log::info("Character spawned at ({}, {}, {}), {} chunks loaded", feet.x, feet.y, feet.z, m_store.size());
}

World::~World() = default;

void World::setCharacterInput(const glm::dvec3 &desired_velocity, Gait gait, bool fly) noexcept
{
	m_desired_velocity = desired_velocity;
	m_gait = gait;
	m_fly_requested = fly;
}

void World::teleportCharacter(const glm::dvec3 &feet) noexcept
{
	m_character.box = characterBox(feet);
	m_character.velocity = glm::dvec3(0.0);
	m_character.on_ground = false;
}

void World::setAim(const glm::dvec3 &origin, const glm::dvec3 &direction) noexcept
{
	m_aim_origin = origin;
	m_aim_direction = direction;
}

void World::requestPlace(glm::ivec3 block, BlockId id)
{
	m_pending_edits.emplace_back(PlaceCommand { block, id });
}

void World::requestPlaceSelected(glm::ivec3 block)
{
	m_pending_edits.emplace_back(PlaceSelectedCommand { block });
}

void World::requestBreak(glm::ivec3 block)
{
	m_pending_edits.emplace_back(BreakCommand { block });
}

std::optional<BlockId> World::requestPick(glm::ivec3 block)
{
	if (!m_settings.creative) {
		logRejectedEdit("pick", block, CubelandErrc::CreativeOnly);
		return std::nullopt;
	}

	std::optional<BlockId> id = m_store.blockAt(block);
	if (!id.has_value()) {
		logRejectedEdit("pick", block, CubelandErrc::ChunkNotLoaded);
		return std::nullopt;
	}

	if (*id == BlockRegistry::BlockAir) {
		return std::nullopt;
	}

	const uint32_t slot = m_inventory.absorbCreative(*id);
	Log::debug("Picked '{}' into slot {}", BlockRegistry::name(*id), slot);
	return id;
}

void World::step(double dt)
{
	m_last_stats = {};

	updateLoadedArea();
	applyPendingEdits();
	m_last_stats.chunks_remeshed = m_store.remeshDirtyChunks(m_mesher);
	moveCharacter(dt);
	updateAimTarget();

	const StepStats &s = m_last_stats;
	if (s.chunks_loaded + s.chunks_unloaded + s.edits_applied + s.edits_rejected + s.chunks_remeshed > 0) {
		Log::debug("Step: {} loaded, {} unloaded, {} edits ({} rejected), {} remeshed", s.chunks_loaded,
			s.chunks_unloaded, s.edits_applied, s.edits_rejected, s.chunks_remeshed);
	}
}

void World::forEachReadyMesh(const std::function<void(const land::Chunk &, const land::ChunkMesh &)> &fn) const
{
	m_store.forEachChunk([&](const land::Chunk &chunk) {
		if (chunk.state() == land::ChunkState::Ready && chunk.mesh()) {
			fn(chunk, *chunk.mesh());
		}
	});
}

bool World::isInLoadArea(ChunkKey key) const noexcept
{
	const ChunkKey center = characterChunk();
	const int32_t r = m_settings.load_radius;

	return std::abs(key.x - center.x) <= r && std::abs(key.z - center.z) <= r && key.y >= land::Consts::MIN_WORLD_Y_CHUNK
		&& key.y < land::Consts::MIN_WORLD_Y_CHUNK + m_settings.height_chunks;
}

void World::updateLoadedArea()
{
	std::vector<ChunkKey> to_unload;
	m_store.forEachChunk([&](const land::Chunk &chunk) {
		if (!isInLoadArea(chunk.key())) {
			to_unload.emplace_back(chunk.key());
		}
	});

	for (ChunkKey key : to_unload) {
		if (m_store.unload(key)) {
			m_last_stats.chunks_unloaded++;
		}
	}

	const ChunkKey center = characterChunk();
	const int32_t r = m_settings.load_radius;

	for (int32_t y = 0; y < m_settings.height_chunks; y++) {
		for (int32_t x = center.x - r; x <= center.x + r; x++) {
			for (int32_t z = center.z - r; z <= center.z + r; z++) {
				if (m_store.load(ChunkKey(x, land::Consts::MIN_WORLD_Y_CHUNK + y, z))) {
					m_last_stats.chunks_loaded++;
				}
			}
		}
	}
}

void World::applyPendingEdits()
{
	// Edits can't enqueue more edits, but keep the queue valid anyway
	std::vector<EditCommand> edits = std::move(m_pending_edits);
	m_pending_edits.clear();

	for (const EditCommand &cmd : edits) {
		std::error_condition result;

		if (auto *place = std::get_if<PlaceCommand>(&cmd); place) {
			result = applyPlace(place->block, place->id);
		} else if (auto *place_sel = std::get_if<PlaceSelectedCommand>(&cmd); place_sel) {
			result = applyPlaceSelected(place_sel->block);
		} else if (auto *brk = std::get_if<BreakCommand>(&cmd); brk) {
			result = applyBreak(brk->block);
		}

		if (result) {
			m_last_stats.edits_rejected++;
		} else {
			m_last_stats.edits_applied++;
		}
	}
}

void World::moveCharacter(double dt)
{
	m_character.flying = m_fly_requested && m_settings.creative;

	glm::dvec3 velocity = m_character.velocity;
	velocity.x = m_desired_velocity.x;
	velocity.z = m_desired_velocity.z;

	if (m_character.flying) {
		velocity.y = m_desired_velocity.y;
	} else if (m_desired_velocity.y > 0.0 && m_character.on_ground) {
		velocity.y = m_desired_velocity.y;
	}

	MovementFlags flags;
	flags.fly = m_character.flying;
	switch (m_gait) {
	case Gait::Walk:
		flags.speed_modifier = 1.0;
		break;
	case Gait::Sprint:
		flags.speed_modifier = m_settings.sprint_factor;
		break;
	case Gait::Sneak:
		flags.speed_modifier = m_settings.sneak_factor;
		break;
	}

	if (!(dt > 0.0)) {
		return;
	}

	MovementResult result = m_resolver.resolve(m_character.box, velocity, dt, m_store, flags);
	m_character.box = result.box;
	m_character.velocity = result.velocity;
	m_character.on_ground = result.on_ground;
}

void World::updateAimTarget()
{
	m_aim_target = VoxelRaycaster::cast(m_aim_origin, m_aim_direction, m_settings.max_reach, m_store);
}

std::error_condition World::validatePlace(glm::ivec3 block, BlockId id) const noexcept
{
	if (!BlockRegistry::isValid(id) || id == BlockRegistry::BlockAir) {
		return CubelandErrc::UnknownBlock;
	}

	if (block.y < land::Consts::WORLD_FLOOR_Y) {
		return CubelandErrc::OutOfWorld;
	}

	std::optional<BlockId> current = m_store.blockAt(block);
	if (!current.has_value()) {
		return CubelandErrc::ChunkNotLoaded;
	}

	if (BlockRegistry::isSolid(*current)) {
		return CubelandErrc::TargetOccupied;
	}

	if (BlockRegistry::isSolid(id) && blockBox(block).overlaps(m_character.box)) {
		return CubelandErrc::TargetOccupied;
	}

	return {};
}

std::error_condition World::applyPlace(glm::ivec3 block, BlockId id)
{
	std::error_condition error = validatePlace(block, id);
	if (!error) {
		error = m_store.applyEdit(block, id);
	}

	if (error) {
		logRejectedEdit("place", block, error);
	}
	return error;
}

std::error_condition World::applyPlaceSelected(glm::ivec3 block)
{
	std::optional<BlockId> id = m_inventory.selectedItem();
	if (!id.has_value()) {
		Log::debug("Rejected place at ({}, {}, {}): selected slot {} is empty", block.x, block.y, block.z,
			m_inventory.selectedSlot());
		return CubelandErrc::OutOfResource;
	}

	std::error_condition error = applyPlace(block, *id);
	if (!error) {
		(void) m_inventory.consumeSelected();
	}
	return error;
}

std::error_condition World::applyBreak(glm::ivec3 block)
{
	std::optional<BlockId> current = m_store.blockAt(block);
	if (!current.has_value()) {
		const CubelandErrc errc = block.y < land::Consts::WORLD_FLOOR_Y ? CubelandErrc::OutOfWorld
																		: CubelandErrc::ChunkNotLoaded;
		logRejectedEdit("break", block, errc);
		return errc;
	}

	if (!BlockRegistry::isBreakable(*current, m_settings.breakable_bedrock)) {
		logRejectedEdit("break", block, CubelandErrc::BlockUnbreakable);
		return CubelandErrc::BlockUnbreakable;
	}

	std::error_condition error = m_store.applyEdit(block, BlockRegistry::BlockAir);
	if (error) {
		logRejectedEdit("break", block, error);
		return error;
	}

	if (!m_settings.creative) {
		std::optional<uint32_t> slot = m_inventory.absorb(*current);
		if (!slot.has_value()) {
			Log::debug("Inventory is full, '{}' is lost", BlockRegistry::name(*current));
		}
	}

	return {};
}

ChunkKey World::characterChunk() const noexcept
{
	return ChunkKey::fromBlock(land::Utils::blockAt(m_character.box.center()));
}

double World::spawnHeight(int32_t x, int32_t z) const noexcept
{
	const int32_t top = land::Consts::MIN_WORLD_Y_CHUNK * land::Consts::CHUNK_SIZE_BLOCKS
		+ m_settings.height_chunks * land::Consts::CHUNK_SIZE_BLOCKS;

	// Start from the terrain surface and climb over trees if needed
	int32_t y = std::max(m_store.generator().columnHeight(x, z, m_settings.seed), land::Consts::WORLD_FLOOR_Y + 1);
	while (y + 1 < top
		&& (m_store.isSolidBlock(glm::ivec3(x, y, z)) || m_store.isSolidBlock(glm::ivec3(x, y + 1, z)))) {
		y++;
	}

	return double(y);
}

} // namespace cubeland::world
