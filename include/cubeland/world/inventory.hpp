#pragma once

#include <cubeland/land/block_registry.hpp>
#include <cubeland/visibility.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace cubeland::world
{

// Hotbar of block stacks, fed by breaking and picking, drained by placing
class CUBELAND_API Inventory {
public:
	constexpr static uint32_t NUM_SLOTS = 9;

	enum class SlotKind : uint8_t {
		Empty,
		// `count` blocks, never zero
		Finite,
		// Never runs out, creative mode
		Infinite,
	};

	struct Slot {
		SlotKind kind = SlotKind::Empty;
		land::BlockId block = land::BlockRegistry::BlockAir;
		uint32_t count = 0;

		bool operator==(const Slot &other) const = default;
	};

	Inventory() = default;

	// All slots are empty
	static Inventory survivalPreset() noexcept;
	// Infinite stacks of common building blocks
	static Inventory creativePreset() noexcept;

	// Returns false and keeps the selection if `slot` is out of range
	bool select(uint32_t slot) noexcept;
	uint32_t selectedSlot() const noexcept { return m_selected; }

	// Block of a non-empty slot. Empty result for empty or out-of-range slot.
	std::optional<land::BlockId> item(uint32_t slot) const noexcept;
	std::optional<land::BlockId> selectedItem() const noexcept { return item(m_selected); }
	const Slot &slot(uint32_t slot) const noexcept { return m_slots[slot]; }

	// Take one block from the slot. Finite slot becomes empty after its last block.
	std::optional<land::BlockId> consume(uint32_t slot) noexcept;
	std::optional<land::BlockId> consumeSelected() noexcept { return consume(m_selected); }

	// Put `count` blocks into a slot already holding `block` (infinite slot
	// takes them without change) or else into the first empty slot.
	// Returns the slot index, empty result if the inventory is full.
	std::optional<uint32_t> absorb(land::BlockId block, uint32_t count = 1) noexcept;
	// Replace the selected slot with an infinite stack of `block`
	uint32_t absorbCreative(land::BlockId block) noexcept;

private:
	std::array<Slot, NUM_SLOTS> m_slots = {};
	uint32_t m_selected = 0;
};

} // namespace cubeland::world
