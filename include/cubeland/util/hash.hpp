#pragma once

#include <cubeland/visibility.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace cubeland
{

// Collection of hash/checksum utilities
namespace Hash
{

// Fixed-size (64-bit input) XXH64 with zero seed, can be useful to make
// well-distributed bits out of anything. XXH64 is bijective for 64-bit inputs
// so you can even directly compare hashes instead of keys <= 8 bytes.
CUBELAND_API uint64_t xxh64Fixed(uint64_t data) noexcept;

// Mix several 64-bit values into one well-distributed value.
// Order matters, `combine(a, b) != combine(b, a)` in general.
CUBELAND_API uint64_t combine(uint64_t a, uint64_t b) noexcept;
CUBELAND_API uint64_t combine(uint64_t a, uint64_t b, uint64_t c) noexcept;

} // namespace Hash

// Compute fast non-cryptographic CRC32 checksum
CUBELAND_API uint32_t checksumCrc32(std::span<const std::byte> data) noexcept;

} // namespace cubeland
