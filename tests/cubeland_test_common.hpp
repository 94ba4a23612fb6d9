#pragma once

#include "test_common.hpp"

#include <cubeland/land/chunk_key.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>

namespace cubeland::test
{

// Usage: `CHECK_THROWS_MATCHES(<expr>, Exception, errcExceptionMatcher(CubelandErrc::<code>))`
inline auto errcExceptionMatcher(CubelandErrc ec)
{
	return Catch::Predicate<Exception>([ec](const Exception& ex) { return ex.error() == ec; });
}

} // namespace cubeland::test

namespace Catch
{

template<>
struct StringMaker<cubeland::land::ChunkKey> {
	static std::string convert(cubeland::land::ChunkKey key);
};

} // namespace Catch
