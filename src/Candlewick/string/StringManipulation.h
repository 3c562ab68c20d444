#pragma once

//system headers:
#include <cstdint>
#include <string>

namespace StringManipulation
{
	//converts a number into a string quickly and accurately (moreso than built-in C++ libraries)
	std::string NumberToString(double value);
	std::string NumberToString(size_t value);
	std::string NumberToString(int64_t value);

	//returns s with ascii letters converted to lower case
	std::string ToLowerAscii(std::string s);

	//replaces every occurrence of from in s with to, returns the result
	std::string ReplaceAll(std::string s, const std::string &from, const std::string &to);
};
