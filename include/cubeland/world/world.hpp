#pragma once

#include <cubeland/land/chunk_mesher.hpp>
#include <cubeland/land/chunk_store.hpp>
#include <cubeland/util/aabb.hpp>
#include <cubeland/visibility.hpp>
#include <cubeland/world/collision_resolver.hpp>
#include <cubeland/world/inventory.hpp>
#include <cubeland/world/voxel_raycast.hpp>
#include <cubeland/world/world_settings.hpp>

#include <glm/vec3.hpp>

#include <functional>
#include <optional>
#include <system_error>
#include <variant>
#include <vector>

namespace cubeland::world
{

enum class Gait : uint8_t {
	Walk,
	Sprint,
	Sneak,
};

struct Character {
	Aabb box;
	glm::dvec3 velocity { 0.0 };
	bool on_ground = false;
	bool flying = false;

	glm::dvec3 feetPosition() const noexcept { return glm::dvec3(box.center().x, box.min().y, box.center().z); }
};

// Counters of the latest `World::step`
struct StepStats {
	size_t chunks_loaded = 0;
	size_t chunks_unloaded = 0;
	size_t edits_applied = 0;
	size_t edits_rejected = 0;
	size_t chunks_remeshed = 0;
};

// Owns the chunk store and everything living in it. Single-threaded, all
// block changes requested between steps are applied during the next `step`.
//
// Step stages, in order:
// 1. load chunks entering and unload chunks leaving the load area
// 2. apply pending edits
// 3. remesh dirty chunks
// 4. move the character
// 5. update the aim target
class CUBELAND_API World {
public:
	constexpr static double CHARACTER_WIDTH = 0.6;
	constexpr static double CHARACTER_HEIGHT = 1.8;

	explicit World(WorldSettings settings);
	World(World &&) = delete;
	World(const World &) = delete;
	World &operator=(World &&) = delete;
	World &operator=(const World &) = delete;
	~World();

	const WorldSettings &settings() const noexcept { return m_settings; }

	// Horizontal components of `desired_velocity` are taken as is. Vertical component
	// is taken as is when flying, otherwise a positive value starts a jump from the ground.
	// Flying is ignored outside of creative mode.
	void setCharacterInput(const glm::dvec3 &desired_velocity, Gait gait = Gait::Walk, bool fly = false) noexcept;
	// Place character feet at `feet`, resets velocity. Loaded area follows on the next step.
	void teleportCharacter(const glm::dvec3 &feet) noexcept;
	void setAim(const glm::dvec3 &origin, const glm::dvec3 &direction) noexcept;

	// Queue placing `id` at world block coordinate `block`
	void requestPlace(glm::ivec3 block, land::BlockId id);
	// Queue placing the block of the selected inventory slot, consuming it
	void requestPlaceSelected(glm::ivec3 block);
	// Queue breaking the block, it always becomes air
	void requestBreak(glm::ivec3 block);
	// Put the block at `block` into the selected inventory slot as an infinite stack.
	// Creative mode only. Returns the picked block ID.
	std::optional<land::BlockId> requestPick(glm::ivec3 block);

	// Run all stages once. `dt` is in seconds, zero is valid and skips movement.
	void step(double dt);

	const std::optional<RaycastHit> &aimTarget() const noexcept { return m_aim_target; }
	const Character &character() const noexcept { return m_character; }
	const land::ChunkStore &store() const noexcept { return m_store; }
	Inventory &inventory() noexcept { return m_inventory; }
	const Inventory &inventory() const noexcept { return m_inventory; }
	const StepStats &lastStepStats() const noexcept { return m_last_stats; }

	bool isSolidAt(const glm::dvec3 &pos) const noexcept { return m_store.isSolidAt(pos); }

	// Visit every chunk in `Ready` state that has a mesh
	void forEachReadyMesh(const std::function<void(const land::Chunk &, const land::ChunkMesh &)> &fn) const;

	// Whether a chunk at `key` belongs to the load area around the character
	bool isInLoadArea(land::ChunkKey key) const noexcept;

private:
	struct PlaceCommand {
		glm::ivec3 block;
		land::BlockId id;
	};

	struct PlaceSelectedCommand {
		glm::ivec3 block;
	};

	struct BreakCommand {
		glm::ivec3 block;
	};

	using EditCommand = std::variant<PlaceCommand, PlaceSelectedCommand, BreakCommand>;

	WorldSettings m_settings;
	land::ChunkStore m_store;
	land::ChunkMesher m_mesher;
	CollisionResolver m_resolver;
	Inventory m_inventory;

	Character m_character;
	glm::dvec3 m_desired_velocity { 0.0 };
	Gait m_gait = Gait::Walk;
	bool m_fly_requested = false;

	glm::dvec3 m_aim_origin { 0.0 };
	glm::dvec3 m_aim_direction { 0.0 };
	std::optional<RaycastHit> m_aim_target;

	std::vector<EditCommand> m_pending_edits;
	StepStats m_last_stats;

	void updateLoadedArea();
	void applyPendingEdits();
	void moveCharacter(double dt);
	void updateAimTarget();

	std::error_condition validatePlace(glm::ivec3 block, land::BlockId id) const noexcept;
	std::error_condition applyPlace(glm::ivec3 block, land::BlockId id);
	std::error_condition applyPlaceSelected(glm::ivec3 block);
	std::error_condition applyBreak(glm::ivec3 block);

	land::ChunkKey characterChunk() const noexcept;
	double spawnHeight(int32_t x, int32_t z) const noexcept;
};

} // namespace cubeland::world
