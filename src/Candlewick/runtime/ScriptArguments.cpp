//project headers:
#include "ScriptArguments.h"

#include "ScriptError.h"

//returns true if value is acceptable for kind, converting it in place where the kind allows
static bool CoerceArgument(ScriptValue &value, ArgumentKind kind)
{
	switch(kind)
	{
	case AK_ANY:
		return true;
	case AK_BOOL:
		return value.GetType() == SVT_BOOL;
	case AK_INTEGER:
		return value.GetType() == SVT_INTEGER;
	case AK_FLOAT:
		if(value.GetType() == SVT_INTEGER)
		{
			value = ScriptValue(static_cast<double>(value.GetInteger()));
			return true;
		}
		return value.GetType() == SVT_FLOAT;
	case AK_STRING:
		return value.GetType() == SVT_STRING;
	case AK_COLOR:
		return value.GetType() == SVT_COLOR || value.GetType() == SVT_STRING;
	case AK_SERIES:
		return value.IsSeries();
	case AK_DRAW_COMMAND:
		return value.GetType() == SVT_DRAW_COMMAND;
	case AK_LIST:
		return value.GetType() == SVT_LIST;
	default:
		return false;
	}
}

void ExpandArguments(const ScriptArguments &args, const ArgumentSpec *specs, size_t num_specs, ScriptValue *out)
{
	if(args.positional.size() > num_specs)
		throw ScriptArgumentError("too many arguments");

	std::vector<bool> supplied(num_specs, false);
	for(size_t i = 0; i < args.positional.size(); i++)
	{
		out[i] = args.positional[i];
		supplied[i] = true;
	}

	for(auto &[name, value] : args.named)
	{
		size_t index = num_specs;
		for(size_t i = 0; i < num_specs; i++)
		{
			if(name == specs[i].name)
			{
				index = i;
				break;
			}
		}

		if(index == num_specs)
			throw ScriptArgumentError("unexpected argument " + name);
		if(supplied[index])
			throw ScriptArgumentError("duplicate argument " + name);

		out[index] = value;
		supplied[index] = true;
	}

	for(size_t i = 0; i < num_specs; i++)
	{
		const ArgumentSpec &spec = specs[i];
		if(out[i].IsNA())
		{
			if(spec.required)
				throw ScriptArgumentError(std::string("missing argument ") + spec.name);
			continue;
		}

		if(!CoerceArgument(out[i], spec.kind))
			throw ScriptArgumentError(std::string("invalid type for argument ") + spec.name
				+ ", got " + ScriptValue::GetTypeName(out[i].GetType()));
	}
}

InputArguments ParseInputArguments(const ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 8> input_specs = { {
		{ "defval",		AK_ANY,		true },
		{ "title",		AK_STRING,	false },
		{ "type",		AK_STRING,	false },
		{ "minval",		AK_ANY,		false },
		{ "maxval",		AK_ANY,		false },
		{ "confirm",	AK_BOOL,	false },
		{ "step",		AK_ANY,		false },
		{ "options",	AK_LIST,	false }
	} };

	auto values = ExpandArguments(args, input_specs);

	InputArguments input;
	input.defaultValue = std::move(values[0]);
	if(!values[1].IsNA())
		input.title = values[1].GetString();
	if(!values[2].IsNA())
		input.type = values[2].GetString();
	input.minValue = std::move(values[3]);
	input.maxValue = std::move(values[4]);
	input.confirm = std::move(values[5]);
	input.step = std::move(values[6]);
	input.options = std::move(values[7]);
	return input;
}

std::string InferInputType(const ScriptValue &default_value, bool fallback_to_string)
{
	switch(default_value.GetType())
	{
	case SVT_BOOL:				return "bool";
	case SVT_INTEGER:			return "integer";
	case SVT_FLOAT:				return "float";
	case SVT_MARKET_SERIES:		return "source";
	default:
		if(fallback_to_string)
			return "string";
		return std::string();
	}
}
