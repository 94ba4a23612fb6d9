#include <cubeland/util/aabb.hpp>

#include <glm/vector_relational.hpp>

namespace cubeland
{

bool Aabb::overlaps(const Aabb &other) const noexcept
{
	return glm::all(glm::lessThan(m_min, other.m_max)) && glm::all(glm::lessThan(other.m_min, m_max));
}

} // namespace cubeland
