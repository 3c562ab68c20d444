//project headers:
#include "FileSupportYAML.h"

#include "FastMath.h"
#include "PlatformSpecific.h"
#include "StringManipulation.h"

//3rd party headers:
#include <ryml.hpp>
#include <ryml_std.hpp>

//system headers:
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>

//transform yaml to a value.  Only sequences and scalars are supported
static std::pair<ScriptValue, bool> YamlToScriptValueRecurse(ryml::ConstNodeRef &element)
{
	if(element.is_seq())
	{
		ScriptValueList list;
		for(auto e : element.children())
		{
			auto [child, success] = YamlToScriptValueRecurse(e);
			if(!success)
				return std::make_pair(ScriptValue(), false);
			list.emplace_back(std::move(child));
		}

		return std::make_pair(ScriptValue(std::move(list)), true);
	}

	if(element.is_map())
		return std::make_pair(ScriptValue(), false);

	if(element.val_is_null())
		return std::make_pair(ScriptValue(), true);

	auto value = element.val();
	std::string value_string(value.begin(), value.end());

	//quoted scalars are always strings
	if(element.is_val_quoted())
		return std::make_pair(ScriptValue(value_string), true);

	if(value_string == "true")
		return std::make_pair(ScriptValue(true), true);
	if(value_string == "false")
		return std::make_pair(ScriptValue(false), true);

	if(value.is_number())
	{
		auto [num, success] = Platform_StringToNumber(value_string);
		if(!success)
			return std::make_pair(ScriptValue(value_string), true);

		if(value_string.find_first_of(".eE") == std::string::npos && IsWholeNumberInInt64Range(num))
			return std::make_pair(ScriptValue(static_cast<int64_t>(std::strtoll(value_string.c_str(), nullptr, 10))), true);

		return std::make_pair(ScriptValue(num), true);
	}

	//must be a string
	return std::make_pair(ScriptValue(value_string), true);
}

//transform value to a rapidyaml tree
//returns true if it was able to create a yaml correctly, false if there was problematic data
static bool ScriptValueToYamlRecurse(const ScriptValue &value, ryml::NodeRef &built_element)
{
	switch(value.GetType())
	{
	case SVT_NA:
		//don't set anything
		return true;

	case SVT_BOOL:
		built_element << (value.GetBool() ? "true" : "false");
		return true;

	case SVT_INTEGER:
		built_element << StringManipulation::NumberToString(value.GetInteger());
		return true;

	case SVT_FLOAT:
		built_element << StringManipulation::NumberToString(value.GetFloat());
		return true;

	case SVT_STRING:
		built_element << value.GetString();
		return true;

	case SVT_COLOR:
		built_element << value.GetColor().GetHex();
		return true;

	case SVT_LIST:
	{
		built_element |= ryml::SEQ;
		for(auto &element : value.GetList())
		{
			auto new_element = built_element.append_child();
			if(!ScriptValueToYamlRecurse(element, new_element))
				return false;
		}
		return true;
	}

	default:
		//series and draw commands are never stored as input values
		return false;
	}
}

std::pair<InputValues, bool> ScriptValueYAMLTranslation::YamlToInputValues(std::string &yaml_str)
{
	ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(yaml_str));

	ryml::ConstNodeRef yaml_top_element = tree.rootref();
	if(!yaml_top_element.is_map())
		return std::make_pair(InputValues(), false);

	InputValues values;
	for(auto e : yaml_top_element.children())
	{
		auto key_value = e.key();
		std::string key(key_value.begin(), key_value.end());

		auto [value, success] = YamlToScriptValueRecurse(e);
		if(!success)
			return std::make_pair(InputValues(), false);

		values[key] = std::move(value);
	}

	return std::make_pair(std::move(values), true);
}

std::pair<std::string, bool> ScriptValueYAMLTranslation::InputValuesToYaml(const InputValues &values, bool sort_keys)
{
	std::vector<std::string> titles;
	titles.reserve(values.size());
	for(auto &[title, _] : values)
		titles.push_back(title);

	if(sort_keys)
		std::sort(begin(titles), end(titles));

	ryml::Tree tree;
	auto top_node = tree.rootref();
	top_node |= ryml::MAP;

	for(auto &title : titles)
	{
		auto new_element = top_node.append_child();
		new_element << ryml::key(title);
		if(!ScriptValueToYamlRecurse(values.find(title)->second, new_element))
			return std::make_pair("", false);
	}

	return std::make_pair(ryml::emitrs_yaml<std::string>(tree), true);
}

std::pair<InputValues, bool> ScriptValueYAMLTranslation::Load(const std::string &resource_path)
{
	auto [data, data_success] = Platform_OpenFileAsString(resource_path);
	if(!data_success)
	{
		std::cerr << data << std::endl;
		return std::make_pair(InputValues(), false);
	}

	auto [values, success] = YamlToInputValues(data);
	if(!success)
	{
		std::cerr << "Error loading YAML, cannot convert " << resource_path << " to input values" << std::endl;
		return std::make_pair(InputValues(), false);
	}

	return std::make_pair(std::move(values), true);
}

bool ScriptValueYAMLTranslation::Store(const InputValues &values, const std::string &resource_path, bool sort_keys)
{
	std::string error_string;
	if(!Platform_IsResourcePathAccessible(resource_path, false, error_string))
	{
		std::cerr << "Error storing YAML: " << error_string << std::endl;
		return false;
	}

	auto [result, converted] = InputValuesToYaml(values, sort_keys);
	if(!converted)
	{
		std::cerr << "Error storing YAML: cannot convert input values to YAML" << std::endl;
		return false;
	}

	std::ofstream file(resource_path, std::ios::binary);
	if(!file.good())
	{
		std::cerr << "Error storing YAML: cannot open " << resource_path << std::endl;
		return false;
	}

	file << result;
	file.close();
	if(!file.good())
	{
		std::cerr << "Error storing YAML: cannot write " << resource_path << std::endl;
		return false;
	}

	return true;
}
