//project headers:
#include "StringManipulation.h"

#include "FastMath.h"

//3rd party headers:
#include "swiftdtoa/SwiftDtoa.h"

//system headers:
#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

std::string StringManipulation::NumberToString(double value)
{
	//first check for unusual values
	if(FastIsNaN(value))
		return "NaN";
	if(value == std::numeric_limits<double>::infinity())
		return "Infinity";
	if(value == -std::numeric_limits<double>::infinity())
		return "-Infinity";

	char char_buffer[128];
	size_t num_chars_written = swift_dtoa_optimal_double(value, &char_buffer[0], sizeof(char_buffer));
	return std::string(&char_buffer[0], num_chars_written);
}

std::string StringManipulation::NumberToString(size_t value)
{
	//do this our own way because regular string manipulation libraries are slow
	constexpr size_t max_num_digits = std::numeric_limits<size_t>::digits / 3; //max of binary digits per character
	constexpr size_t buffer_size = max_num_digits + 2;
	char buffer[buffer_size];
	char *p = &buffer[0];

	if(value == 0) //check for zero because it's a very common case for integers
		*p++ = '0';
	else //convert each character
	{
		//peel off digits and put them in the next position for the string (reverse when done)
		char *buffer_start = &buffer[0];
		while(value != 0)
		{
			//pull off the least significant digit and convert it to a number character
			*p++ = ('0' + (value % 10));
			value /= 10;
		}

		//put back in original order
		std::reverse(buffer_start, p);
	}
	*p = '\0';	//terminate string
	return std::string(&buffer[0]);
}

std::string StringManipulation::NumberToString(int64_t value)
{
	if(value >= 0)
		return NumberToString(static_cast<size_t>(value));

	//negate in unsigned space so the most negative value does not overflow
	size_t magnitude = static_cast<size_t>(0) - static_cast<size_t>(value);
	return "-" + NumberToString(magnitude);
}

std::string StringManipulation::ToLowerAscii(std::string s)
{
	for(auto &c : s)
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	return s;
}

std::string StringManipulation::ReplaceAll(std::string s, const std::string &from, const std::string &to)
{
	if(from.empty())
		return s;

	size_t position = 0;
	while((position = s.find(from, position)) != std::string::npos)
	{
		s.replace(position, from.size(), to);
		position += to.size();
	}
	return s;
}
