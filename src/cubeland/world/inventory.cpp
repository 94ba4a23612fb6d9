#include <cubeland/world/inventory.hpp>

namespace cubeland::world
{

using land::BlockId;
using land::BlockRegistry;

Inventory Inventory::survivalPreset() noexcept
{
	return Inventory();
}

Inventory Inventory::creativePreset() noexcept
{
	constexpr BlockId BLOCKS[NUM_SLOTS] = {
		BlockRegistry::BlockDirt,
		BlockRegistry::BlockCobble,
		BlockRegistry::BlockPlanks,
		BlockRegistry::BlockWood,
		BlockRegistry::BlockBricks,
		BlockRegistry::BlockGravel,
		BlockRegistry::BlockSand,
		BlockRegistry::BlockGrass,
		BlockRegistry::BlockLeaves,
	};

	Inventory inv;
	for (uint32_t i = 0; i < NUM_SLOTS; i++) {
		inv.m_slots[i] = Slot { .kind = SlotKind::Infinite, .block = BLOCKS[i], .count = 0 };
	}
	return inv;
}

bool Inventory::select(uint32_t slot) noexcept
{
	if (slot >= NUM_SLOTS) {
		return false;
	}

	m_selected = slot;
	return true;
}

std::optional<BlockId> Inventory::item(uint32_t slot) const noexcept
{
	if (slot >= NUM_SLOTS || m_slots[slot].kind == SlotKind::Empty) {
		return std::nullopt;
	}

	return m_slots[slot].block;
}

std::optional<BlockId> Inventory::consume(uint32_t slot) noexcept
{
	if (slot >= NUM_SLOTS) {
		return std::nullopt;
	}

	Slot &s = m_slots[slot];
	switch (s.kind) {
	case SlotKind::Empty:
		return std::nullopt;
	case SlotKind::Finite: {
		const BlockId block = s.block;
		if (--s.count == 0) {
			s = Slot {};
		}
		return block;
	}
	case SlotKind::Infinite:
		return s.block;
	}

	return std::nullopt;
}

std::optional<uint32_t> Inventory::absorb(BlockId block, uint32_t count) noexcept
{
	if (count == 0) {
		return std::nullopt;
	}

	for (uint32_t i = 0; i < NUM_SLOTS; i++) {
		Slot &s = m_slots[i];
		if (s.kind == SlotKind::Empty || s.block != block) {
			continue;
		}

		if (s.kind == SlotKind::Finite) {
			s.count += count;
		}
		return i;
	}

	for (uint32_t i = 0; i < NUM_SLOTS; i++) {
		if (m_slots[i].kind == SlotKind::Empty) {
			m_slots[i] = Slot { .kind = SlotKind::Finite, .block = block, .count = count };
			return i;
		}
	}

	return std::nullopt;
}

uint32_t Inventory::absorbCreative(BlockId block) noexcept
{
	m_slots[m_selected] = Slot { .kind = SlotKind::Infinite, .block = block, .count = 0 };
	return m_selected;
}

} // namespace cubeland::world
