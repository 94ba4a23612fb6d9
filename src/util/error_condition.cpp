#include <cubeland/util/error_condition.hpp>

namespace cubeland
{

namespace
{

struct CubelandErrorCategory : std::error_category {
	const char *name() const noexcept override { return "Cubeland error"; }

	std::string message(int code) const override
	{
		switch (static_cast<CubelandErrc>(code)) {
		case CubelandErrc::InvalidData: return "Input data is invalid/corrupt and can't be used";
		case CubelandErrc::OptionMissing: return "A config object has no requested option but user assumes it exists";
		case CubelandErrc::ChunkNotLoaded: return "Target block belongs to a chunk which is not loaded";
		case CubelandErrc::UnknownBlock: return "Block ID is not known to the block registry";
		case CubelandErrc::BlockUnbreakable: return "Target block can't be broken with the current world settings";
		case CubelandErrc::TargetOccupied: return "Target block space is already occupied";
		case CubelandErrc::CreativeOnly: return "Operation is available only in creative mode";
		case CubelandErrc::OutOfWorld: return "Target position is outside of the world vertical bounds";
		case CubelandErrc::OutOfResource: return "A finite resource was exhausted";
		// No `default` to make `-Werror -Wswitch` protection work
		}

		return "Unknown error";
	}
};

const CubelandErrorCategory g_category;

} // anonymous namespace

std::error_condition make_error_condition(CubelandErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace cubeland
