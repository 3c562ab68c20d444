#pragma once

//project headers:
#include "HashMaps.h"
#include "ScriptValue.h"

//system headers:
#include <array>
#include <cstdint>
#include <string>
#include <vector>

//arguments of one call, as produced by a call node
struct ScriptArguments
{
	ScriptArguments()
	{	}

	ScriptArguments(std::vector<ScriptValue> _positional, SmallMap<std::string, ScriptValue> _named = SmallMap<std::string, ScriptValue>())
		: positional(std::move(_positional)), named(std::move(_named))
	{	}

	std::vector<ScriptValue> positional;
	SmallMap<std::string, ScriptValue> named;
};

//kinds of values a host function parameter accepts
enum ArgumentKind : uint8_t
{
	AK_ANY,
	AK_BOOL,
	AK_INTEGER,
	//accepts integers as well, converting them to float
	AK_FLOAT,
	AK_STRING,
	//accepts color tokens and strings
	AK_COLOR,
	//accepts both computed and market series
	AK_SERIES,
	AK_DRAW_COMMAND,
	AK_LIST
};

//describes one parameter of a host function
struct ArgumentSpec
{
	const char *name;
	ArgumentKind kind;
	bool required;
};

//binds args to the parameters described by specs, first positionally and then by name, into out
//parameters not supplied, or supplied as na, are left as na
//throws ScriptArgumentError if there are too many positional arguments, if a named argument does not match
// a parameter or duplicates a positional one, if a required parameter is missing, or if a value is of the wrong kind
void ExpandArguments(const ScriptArguments &args, const ArgumentSpec *specs, size_t num_specs, ScriptValue *out);

template<size_t N>
inline std::array<ScriptValue, N> ExpandArguments(const ScriptArguments &args, const std::array<ArgumentSpec, N> &specs)
{
	std::array<ScriptValue, N> out;
	ExpandArguments(args, specs.data(), N, out.data());
	return out;
}

//parsed arguments of the input parameter declaration call
struct InputArguments
{
	ScriptValue defaultValue;
	//empty when no title was given
	std::string title;
	//empty when no type was given
	std::string type;
	ScriptValue minValue;
	ScriptValue maxValue;
	ScriptValue confirm;
	ScriptValue step;
	ScriptValue options;
};

//parses (defval, title, type, minval, maxval, confirm, step, options) of an input declaration
//throws ScriptArgumentError on malformed arguments
InputArguments ParseInputArguments(const ScriptArguments &args);

//returns the input type implied by the kind of default_value:
// "bool", "integer", "float", "source" for market series, and otherwise "string" if fallback_to_string,
// or an empty string if not
std::string InferInputType(const ScriptValue &default_value, bool fallback_to_string);
