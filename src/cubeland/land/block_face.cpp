#include <cubeland/land/block_face.hpp>

namespace extras
{

using cubeland::land::BlockFace;

template<>
std::string_view enum_name(BlockFace value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case BlockFace::XPos:
		return "X+"sv;
	case BlockFace::XNeg:
		return "X-"sv;
	case BlockFace::YPos:
		return "Y+"sv;
	case BlockFace::YNeg:
		return "Y-"sv;
	case BlockFace::ZPos:
		return "Z+"sv;
	case BlockFace::ZNeg:
		return "Z-"sv;
	case BlockFace::EnumSize:
		break;
	}

	return "Invalid"sv;
}

} // namespace extras
