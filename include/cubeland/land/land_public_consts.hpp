#pragma once

#include <cstdint>

// Publicly accessible constants of Land subsystem
namespace cubeland::land::Consts
{

// How many blocks fit in one chunk, per axis. Must be a power of two.
constexpr int32_t CHUNK_SIZE_BLOCKS = 32;
// log2(CHUNK_SIZE_BLOCKS), used for block->chunk coordinate conversions
constexpr int32_t CHUNK_SIZE_LOG2 = 5;
static_assert((1 << CHUNK_SIZE_LOG2) == CHUNK_SIZE_BLOCKS);

// World Y coordinate of the bottom bedrock layer. Nothing is generated below it.
constexpr int32_t WORLD_FLOOR_Y = 0;
// The lowest chunk Y coordinate that can be loaded
constexpr int32_t MIN_WORLD_Y_CHUNK = 0;

// Number of layers in block texture array, layer 0 is never referenced
constexpr uint32_t NUM_TEXTURE_LAYERS = 16;

} // namespace cubeland::land::Consts
