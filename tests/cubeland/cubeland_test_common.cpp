#include "../cubeland_test_common.hpp"

#include <fmt/format.h>

namespace Catch
{

std::string StringMaker<cubeland::land::ChunkKey>::convert(cubeland::land::ChunkKey key)
{
	return fmt::format("({}, {}, {})", key.x, key.y, key.z);
}

} // namespace Catch
