//project headers:
#include "FileSupportJSON.h"

#include "FastMath.h"
#include "PlatformSpecific.h"
#include "Series.h"
#include "StringManipulation.h"

//3rd party headers:
#include <simdjson.h>

//system headers:
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>

//per simdjson documentation, there should be one parser per thread; evaluation is single threaded
simdjson::ondemand::parser json_parser;

//transform json to a value.  Only lists and immediates are supported; objects cannot be input values
static std::pair<ScriptValue, bool> JsonToScriptValueRecurse(simdjson::ondemand::value element)
{
	switch(element.type())
	{
	case simdjson::ondemand::json_type::array:
	{
		ScriptValueList list;
		for(auto e : element.get_array())
		{
			auto [child, success] = JsonToScriptValueRecurse(e.value());
			if(!success)
				return std::make_pair(ScriptValue(), false);
			list.emplace_back(std::move(child));
		}

		return std::make_pair(ScriptValue(std::move(list)), true);
	}

	case simdjson::ondemand::json_type::number:
	{
		simdjson::ondemand::number_type number_type = element.get_number_type();
		if(number_type == simdjson::ondemand::number_type::signed_integer)
			return std::make_pair(ScriptValue(static_cast<int64_t>(element.get_int64())), true);
		return std::make_pair(ScriptValue(static_cast<double>(element.get_double())), true);
	}

	case simdjson::ondemand::json_type::string:
	{
		std::string_view str_view = element.get_string();
		return std::make_pair(ScriptValue(std::string(str_view)), true);
	}

	case simdjson::ondemand::json_type::boolean:
		return std::make_pair(ScriptValue(static_cast<bool>(element.get_bool())), true);

	case simdjson::ondemand::json_type::null:
		return std::make_pair(ScriptValue(), true);

	default:
		return std::make_pair(ScriptValue(), false);
	}
}

//escapes str with json standards and appends to json_str
static inline void EscapeAndAppendStringToJsonString(const std::string &str, std::string &json_str)
{
	json_str += '"';

	for(size_t i = 0; i < str.size(); i++)
	{
		auto c = str[i];
		switch(c)
		{
			case '"':	json_str += "\\\"";	break;
			case '\\':	json_str += "\\\\";	break;
			case '\b':	json_str += "\\b";	break;
			case '\f':	json_str += "\\f";	break;
			case '\n':	json_str += "\\n";	break;
			case '\r':	json_str += "\\r";	break;
			case '\t':	json_str += "\\t";	break;
			default:
			{
				if(static_cast<uint8_t>(c) <= 0x1f)
				{
					//escape control characters
					char buffer[8];
					snprintf(&buffer[0], sizeof(buffer), "\\u%04x", c);
					json_str += &buffer[0];
					break;
				}

				json_str += c;
			}
		}
	}

	json_str += '"';
}

//appends number to json_str; NaN becomes null and infinities are clamped to the largest finite values
static inline void AppendNumberToJsonString(double number, std::string &json_str)
{
	if(number == std::numeric_limits<double>::infinity())
		json_str += StringManipulation::NumberToString(std::numeric_limits<double>::max());
	else if(number == -std::numeric_limits<double>::infinity())
		json_str += StringManipulation::NumberToString(std::numeric_limits<double>::lowest());
	else if(FastIsNaN(number))
		json_str += "null";
	else
		json_str += StringManipulation::NumberToString(number);
}

//appends an object built from members, whose values are already json, to json_str
//if sort_keys is true, members are written sorted by key, otherwise in the order given
static void AppendJsonObject(std::vector<std::pair<std::string, std::string>> &members, bool sort_keys, std::string &json_str)
{
	if(sort_keys)
		std::sort(begin(members), end(members),
			[](const auto &a, const auto &b) {	return a.first < b.first;	});

	json_str += '{';
	for(size_t i = 0; i < members.size(); i++)
	{
		if(i > 0)
			json_str += ',';
		EscapeAndAppendStringToJsonString(members[i].first, json_str);
		json_str += ':';
		json_str += members[i].second;
	}
	json_str += '}';
}

static bool DrawCommandToJsonString(const DrawCommand &command, std::string &json_str, bool sort_keys);

//transform value to a json string
//returns true if it was able to create a json correctly, false if there was problematic data
static bool ScriptValueToJsonStringRecurse(const ScriptValue &value, std::string &json_str, bool sort_keys)
{
	switch(value.GetType())
	{
	case SVT_NA:
		json_str += "null";
		return true;

	case SVT_BOOL:
		json_str += (value.GetBool() ? "true" : "false");
		return true;

	case SVT_INTEGER:
		json_str += StringManipulation::NumberToString(value.GetInteger());
		return true;

	case SVT_FLOAT:
		AppendNumberToJsonString(value.GetFloat(), json_str);
		return true;

	case SVT_STRING:
		EscapeAndAppendStringToJsonString(value.GetString(), json_str);
		return true;

	case SVT_COLOR:
		EscapeAndAppendStringToJsonString(value.GetColor().GetHex(), json_str);
		return true;

	case SVT_LIST:
	{
		json_str += '[';
		bool first_element = true;
		for(auto &element : value.GetList())
		{
			if(!first_element)
				json_str += ',';
			else
				first_element = false;

			if(!ScriptValueToJsonStringRecurse(element, json_str, sort_keys))
				return false;
		}
		json_str += ']';
		return true;
	}

	case SVT_SERIES:
	case SVT_MARKET_SERIES:
	{
		auto series = value.GetSeries();
		json_str += '[';
		for(size_t i = 0; i < series->Size(); i++)
		{
			if(i > 0)
				json_str += ',';

			auto sample = series->GetSample(i);
			//a series cannot contain itself, but samples that are series are not representable
			if(sample.IsSeries())
				return false;
			if(!ScriptValueToJsonStringRecurse(sample, json_str, sort_keys))
				return false;
		}
		json_str += ']';
		return true;
	}

	case SVT_DRAW_COMMAND:
		return DrawCommandToJsonString(*value.GetDrawCommand(), json_str, sort_keys);

	default:
		return false;
	}
}

//returns value as a json string, and false if it could not be converted
static std::pair<std::string, bool> ToJsonMember(const ScriptValue &value, bool sort_keys)
{
	std::string json_str;
	bool converted = ScriptValueToJsonStringRecurse(value, json_str, sort_keys);
	return std::make_pair(json_str, converted);
}

static std::string StringToJson(const std::string &str)
{
	std::string json_str;
	EscapeAndAppendStringToJsonString(str, json_str);
	return json_str;
}

static bool DrawCommandToJsonString(const DrawCommand &command, std::string &json_str, bool sort_keys)
{
	std::vector<std::pair<std::string, std::string>> members;
	members.emplace_back("type", StringToJson(DrawCommand::GetTypeName(command.type)));

	if(command.title.has_value())
		members.emplace_back("title", StringToJson(*command.title));

	auto [series_json, series_converted] = ToJsonMember(command.series, sort_keys);
	if(!series_converted)
		return false;
	members.emplace_back("series", std::move(series_json));

	if(!command.series2.IsNA())
	{
		auto [series2_json, series2_converted] = ToJsonMember(command.series2, sort_keys);
		if(!series2_converted)
			return false;
		members.emplace_back("series2", std::move(series2_json));
	}

	if(command.mark != '\0')
		members.emplace_back("mark", StringToJson(std::string(1, command.mark)));

	if(!command.color.IsNA())
	{
		auto [color_json, color_converted] = ToJsonMember(command.color, sort_keys);
		if(!color_converted)
			return false;
		members.emplace_back("color", std::move(color_json));
	}

	if(command.width.has_value())
		members.emplace_back("width", StringManipulation::NumberToString(*command.width));

	if(command.opacity.has_value())
	{
		std::string opacity_json;
		AppendNumberToJsonString(*command.opacity, opacity_json);
		members.emplace_back("opacity", std::move(opacity_json));
	}

	AppendJsonObject(members, sort_keys, json_str);
	return true;
}

std::pair<InputValues, bool> ScriptValueJSONTranslation::JsonToInputValues(std::string_view json_str)
{
	InputValues values;
	auto json_padded = simdjson::padded_string(json_str);

	try
	{
		simdjson::ondemand::document json_top_element = json_parser.iterate(json_padded);
		simdjson::ondemand::object json_object = json_top_element.get_object();
		for(auto e : json_object)
		{
			std::string_view key_view = e.unescaped_key();
			std::string key(key_view);

			auto [value, success] = JsonToScriptValueRecurse(e.value());
			if(!success)
				return std::make_pair(InputValues(), false);

			values[key] = std::move(value);
		}
	}
	catch(simdjson::simdjson_error &e)
	{
		//get rid of unused variable warning
		(void)e;
		return std::make_pair(InputValues(), false);
	}

	return std::make_pair(std::move(values), true);
}

std::pair<std::string, bool> ScriptValueJSONTranslation::ScriptValueToJson(const ScriptValue &value, bool sort_keys)
{
	std::string json_str;
	if(ScriptValueToJsonStringRecurse(value, json_str, sort_keys))
		return std::make_pair(json_str, true);
	else
		return std::make_pair("", false);
}

std::pair<std::string, bool> ScriptValueJSONTranslation::InputValuesToJson(const InputValues &values, bool sort_keys)
{
	std::vector<std::pair<std::string, std::string>> members;
	members.reserve(values.size());
	for(auto &[title, value] : values)
	{
		auto [value_json, converted] = ToJsonMember(value, sort_keys);
		if(!converted)
			return std::make_pair("", false);
		members.emplace_back(title, std::move(value_json));
	}

	std::string json_str;
	AppendJsonObject(members, sort_keys, json_str);
	return std::make_pair(json_str, true);
}

std::pair<std::string, bool> ScriptValueJSONTranslation::InputDescriptorsToJson(const std::vector<InputDescriptor> &descriptors, bool sort_keys)
{
	std::string json_str = "[";
	for(size_t i = 0; i < descriptors.size(); i++)
	{
		auto &descriptor = descriptors[i];
		if(i > 0)
			json_str += ',';

		std::vector<std::pair<std::string, std::string>> members;
		bool converted = true;
		auto append_member = [&members, &converted, sort_keys](const char *key, const ScriptValue &value)
		{
			auto [value_json, value_converted] = ToJsonMember(value, sort_keys);
			converted = converted && value_converted;
			members.emplace_back(key, std::move(value_json));
		};

		append_member("defval", descriptor.defaultValue);
		members.emplace_back("title", StringToJson(descriptor.title));
		members.emplace_back("type", StringToJson(descriptor.type));
		append_member("minval", descriptor.minValue);
		append_member("maxval", descriptor.maxValue);
		append_member("options", descriptor.options);

		if(!converted)
			return std::make_pair("", false);

		AppendJsonObject(members, sort_keys, json_str);
	}
	json_str += ']';

	return std::make_pair(json_str, true);
}

std::pair<std::string, bool> ScriptValueJSONTranslation::DrawCommandsToJson(const std::vector<DrawCommandPtr> &draw_commands, bool sort_keys)
{
	std::string json_str = "[";
	for(size_t i = 0; i < draw_commands.size(); i++)
	{
		if(i > 0)
			json_str += ',';
		if(!DrawCommandToJsonString(*draw_commands[i], json_str, sort_keys))
			return std::make_pair("", false);
	}
	json_str += ']';

	return std::make_pair(json_str, true);
}

std::pair<InputValues, bool> ScriptValueJSONTranslation::Load(const std::string &resource_path)
{
	std::string error_string;
	if(!Platform_IsResourcePathAccessible(resource_path, true, error_string))
	{
		std::cerr << "Error loading JSON: " << error_string << std::endl;
		return std::make_pair(InputValues(), false);
	}

	auto [data, data_success] = Platform_OpenFileAsString(resource_path);
	if(!data_success)
	{
		std::cerr << data << std::endl;
		return std::make_pair(InputValues(), false);
	}

	auto [values, success] = JsonToInputValues(data);
	if(!success)
	{
		std::cerr << "Error loading JSON, malformatted file " << resource_path << std::endl;
		return std::make_pair(InputValues(), false);
	}

	return std::make_pair(std::move(values), true);
}

//writes json_str to resource_path
static bool StoreJsonString(const std::string &json_str, const std::string &resource_path)
{
	std::ofstream file(resource_path, std::ios::binary);
	if(!file.good())
	{
		std::cerr << "Error storing JSON: cannot open " << resource_path << std::endl;
		return false;
	}

	file << json_str;
	file.close();
	if(!file.good())
	{
		std::cerr << "Error storing JSON: cannot write " << resource_path << std::endl;
		return false;
	}

	return true;
}

bool ScriptValueJSONTranslation::Store(const InputValues &values, const std::string &resource_path, bool sort_keys)
{
	std::string error_string;
	if(!Platform_IsResourcePathAccessible(resource_path, false, error_string))
	{
		std::cerr << "Error storing JSON: " << error_string << std::endl;
		return false;
	}

	auto [result, converted] = InputValuesToJson(values, sort_keys);
	if(!converted)
	{
		std::cerr << "Error storing JSON: cannot convert input values to JSON" << std::endl;
		return false;
	}

	return StoreJsonString(result, resource_path);
}

bool ScriptValueJSONTranslation::StoreInputDescriptors(const std::vector<InputDescriptor> &descriptors, const std::string &resource_path, bool sort_keys)
{
	std::string error_string;
	if(!Platform_IsResourcePathAccessible(resource_path, false, error_string))
	{
		std::cerr << "Error storing JSON: " << error_string << std::endl;
		return false;
	}

	auto [result, converted] = InputDescriptorsToJson(descriptors, sort_keys);
	if(!converted)
	{
		std::cerr << "Error storing JSON: cannot convert input descriptors to JSON" << std::endl;
		return false;
	}

	return StoreJsonString(result, resource_path);
}
