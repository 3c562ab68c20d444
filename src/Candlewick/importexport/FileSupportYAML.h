#pragma once

//project headers:
#include "InputDescriptor.h"

//system headers:
#include <string>
#include <utility>

namespace ScriptValueYAMLTranslation
{
	//converts a YAML map of input titles to values into InputValues
	//plain scalars that are integers become integers, other numbers floats, true and false booleans,
	// null becomes na, sequences become lists and everything else strings
	//returns false if the top element is not a map or a value is a map
	std::pair<InputValues, bool> YamlToInputValues(std::string &yaml_str);

	//converts values to a YAML map. Returns false if a value cannot be converted to YAML
	// if sort_keys is true, it will sort the titles
	std::pair<std::string, bool> InputValuesToYaml(const InputValues &values, bool sort_keys = false);

	//loads input values from a yaml file
	std::pair<InputValues, bool> Load(const std::string &resource_path);

	//stores input values to a yaml file
	bool Store(const InputValues &values, const std::string &resource_path, bool sort_keys);
};
