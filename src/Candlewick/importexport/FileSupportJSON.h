#pragma once

//project headers:
#include "DrawCommand.h"
#include "InputDescriptor.h"

//system headers:
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ScriptValueJSONTranslation
{
	//converts a JSON object of input titles to values into InputValues
	//integers stay integers, null becomes na and arrays become lists
	//returns false if the JSON is malformed or the top element is not an object
	std::pair<InputValues, bool> JsonToInputValues(std::string_view json_str);

	//converts value to a JSON string; series become arrays of their samples, and na and NaN become null
	//returns false if value cannot be converted
	std::pair<std::string, bool> ScriptValueToJson(const ScriptValue &value, bool sort_keys = false);

	//converts values to a JSON object. Returns false if a value cannot be converted to JSON
	// if sort_keys is true, it will sort the titles
	std::pair<std::string, bool> InputValuesToJson(const InputValues &values, bool sort_keys = false);

	//converts descriptors to a JSON array of objects with the keys defval, title, type, minval, maxval and options
	std::pair<std::string, bool> InputDescriptorsToJson(const std::vector<InputDescriptor> &descriptors, bool sort_keys = false);

	//converts draw commands to a JSON array of objects, omitting unset fields
	std::pair<std::string, bool> DrawCommandsToJson(const std::vector<DrawCommandPtr> &draw_commands, bool sort_keys = false);

	//loads input values from a json file
	std::pair<InputValues, bool> Load(const std::string &resource_path);

	//stores input values to a json file
	bool Store(const InputValues &values, const std::string &resource_path, bool sort_keys);

	//stores input descriptors to a json file
	bool StoreInputDescriptors(const std::vector<InputDescriptor> &descriptors, const std::string &resource_path, bool sort_keys);
};
