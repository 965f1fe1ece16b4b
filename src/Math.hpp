#pragma once
#include "Assert.hpp"
#include <cstdint>

namespace ChunkVault
{

// Assumes y is positive.
inline int32_t EuclidianRemainder(const int32_t x, const int32_t y)
{
	CV_ASSERT(y > 0);
	const int32_t r= x % y;
	const int32_t r_corrected= r >= 0 ? r : r + y;
	CV_ASSERT(r_corrected >= 0 && r_corrected < y);
	return r_corrected;
}

// Rounds toward negative infinity. Assumes y is positive.
inline int32_t EuclidianDiv(const int32_t x, const int32_t y)
{
	CV_ASSERT(y > 0);
	const int32_t mod= x % y;
	int32_t div= x / y;
	if(mod < 0)
		--div;
	return div;
}

// Assumes y is positive.
constexpr uint64_t CeilDiv(const uint64_t x, const uint64_t y)
{
	return (x + y - 1) / y;
}

} // namespace ChunkVault
