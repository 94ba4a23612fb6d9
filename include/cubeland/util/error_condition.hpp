#pragma once

#include <cubeland/visibility.hpp>

#include <system_error>

namespace cubeland
{

// Error conditions of the engine. Recoverable outcomes (rejected edits)
// are returned as `std::error_condition` values directly, exceptional
// ones are carried inside `cubeland::Exception`.
enum class CubelandErrc : int {
	// Input data is invalid/corrupt and can't be used
	InvalidData = 1,
	// A config object has no requested option but user assumes it exists
	OptionMissing = 2,
	// Target block belongs to a chunk which is not loaded
	ChunkNotLoaded = 4,
	// Block ID is not known to the block registry
	UnknownBlock = 5,
	// Target block can't be broken with the current world settings
	BlockUnbreakable = 6,
	// Target block space is already occupied by something solid
	TargetOccupied = 7,
	// Operation is available only in creative mode
	CreativeOnly = 8,
	// Target position is outside of the world vertical bounds
	OutOfWorld = 9,
	// A finite resource was exhausted
	OutOfResource = 10,
};

// ADL-accessible factory for `std::error_condition { CubelandErrc }`
CUBELAND_API std::error_condition make_error_condition(CubelandErrc errc) noexcept;

} // namespace cubeland

namespace std
{

// Mark `CubelandErrc` as eligible for `std::error_condition`
template<>
struct is_error_condition_enum<cubeland::CubelandErrc> : true_type {};

} // namespace std
