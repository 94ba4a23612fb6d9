#pragma once

#include <glm/vec3.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace cubeland::land
{

// YXZ-ordered POD 3D array with equal dimensions.
// Used to store chunk block grids and their "expanded" (padded) copies.
template<typename T, uint32_t N>
struct CubeArray {
	static_assert(std::is_trivial_v<T>, "CubeArray supports only trivial types");

	constexpr static uint32_t SIZE = N;

	T data[N][N][N];

	bool operator==(const CubeArray &other) const noexcept = default;

	T operator[](glm::ivec3 c) const noexcept { return data[c.y][c.x][c.z]; }
	T operator[](glm::uvec3 c) const noexcept { return data[c.y][c.x][c.z]; }
	T &operator[](glm::ivec3 c) noexcept { return data[c.y][c.x][c.z]; }
	T &operator[](glm::uvec3 c) noexcept { return data[c.y][c.x][c.z]; }

	T load(int32_t x, int32_t y, int32_t z) const noexcept { return data[y][x][z]; }
	T load(uint32_t x, uint32_t y, uint32_t z) const noexcept { return data[y][x][z]; }
	void store(int32_t x, int32_t y, int32_t z, T value) noexcept { data[y][x][z] = value; }
	void store(uint32_t x, uint32_t y, uint32_t z, T value) noexcept { data[y][x][z] = value; }

	T *begin() noexcept { return &data[0][0][0]; }
	T *end() noexcept { return &data[0][0][0] + N * N * N; }
	const T *begin() const noexcept { return &data[0][0][0]; }
	const T *end() const noexcept { return &data[0][0][0] + N * N * N; }
	size_t size() const noexcept { return N * N * N; }

	void fill(T value) noexcept { std::fill_n(&data[0][0][0], N * N * N, value); }

	void fill(glm::uvec3 begin, glm::uvec3 size, T value) noexcept
	{
		for (uint32_t y = begin.y; y < begin.y + size.y; y++) {
			for (uint32_t x = begin.x; x < begin.x + size.x; x++) {
				std::fill_n(data[y][x] + begin.z, size.z, value);
			}
		}
	}

	// Copy the whole smaller array `in` into this one starting at `base`
	template<uint32_t M>
	void insertFrom(glm::uvec3 base, const CubeArray<T, M> &in) noexcept
	{
		static_assert(M <= N);
		for (uint32_t y = 0; y < M; y++) {
			for (uint32_t x = 0; x < M; x++) {
				std::copy_n(in.data[y][x], M, data[base.y + y][base.x + x] + base.z);
			}
		}
	}
};

} // namespace cubeland::land
