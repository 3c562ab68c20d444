#pragma once

//system headers:
#include <cmath>
#include <cstdint>
#include <limits>

#if !defined(_MSC_VER)
#define __forceinline __attribute__((always_inline)) inline
#endif

//On some platforms, std::isnan creates a costly function call.  This is correct and at least as fast or faster.
template<typename T>
constexpr bool FastIsNaN(const T n)
{
	return n != n;
}

//returns true if both are equal, also counting both being NaN
template<typename T>
constexpr bool EqualIncludingNaN(const T a, const T b)
{
	return (a == b) || (FastIsNaN(a) && FastIsNaN(b));
}

//returns true if value has no fractional part and fits in an int64_t
inline bool IsWholeNumberInInt64Range(double value)
{
	if(FastIsNaN(value))
		return false;

	//2^63 is exactly representable as a double
	constexpr double int64_limit = 9223372036854775808.0;
	if(value < -int64_limit || value >= int64_limit)
		return false;

	return std::trunc(value) == value;
}
