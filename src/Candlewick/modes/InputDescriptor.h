#pragma once

//project headers:
#include "HashMaps.h"
#include "ScriptValue.h"

//system headers:
#include <string>
#include <vector>

//schema of one user configurable parameter, as declared by an input call
struct InputDescriptor
{
	//for source inputs, the name of the market series
	ScriptValue defaultValue;
	std::string title;
	//bool, integer, float, source, string, symbol, resolution or session
	std::string type;
	ScriptValue minValue;
	ScriptValue maxValue;
	ScriptValue options;
};

//stored parameter values by input title
using InputValues = FastHashMap<std::string, ScriptValue>;

//returns the default value of each input by its title
inline InputValues GetDefaultInputValues(const std::vector<InputDescriptor> &inputs)
{
	InputValues values;
	for(auto &input : inputs)
		values[input.title] = input.defaultValue;
	return values;
}
