#pragma once

#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

namespace cubeland
{

// 3D axis-aligned bounding box in world space (block units)
class CUBELAND_API Aabb {
public:
	// Degenerate box at the origin
	Aabb() noexcept : m_min(0.0), m_max(0.0) {}
	Aabb(const glm::dvec3 &min, const glm::dvec3 &max) noexcept : m_min(min), m_max(max) {}
	Aabb(Aabb &&) = default;
	Aabb(const Aabb &) = default;
	Aabb &operator=(Aabb &&) = default;
	Aabb &operator=(const Aabb &) = default;
	~Aabb() = default;

	// Check whether interiors intersect. Boxes only touching each other don't overlap.
	bool overlaps(const Aabb &other) const noexcept;

	Aabb translated(const glm::dvec3 &offset) const noexcept { return Aabb(m_min + offset, m_max + offset); }

	const glm::dvec3 &min() const noexcept { return m_min; }
	const glm::dvec3 &max() const noexcept { return m_max; }
	glm::dvec3 center() const noexcept { return (m_min + m_max) * 0.5; }

private:
	glm::dvec3 m_min;
	glm::dvec3 m_max;
};

} // namespace cubeland
