//project headers:
#include "ScriptError.h"

const char *ScriptError::GetTypeName(ScriptErrorType type)
{
	switch(type)
	{
	case SET_UNBOUND_VARIABLE:			return "UnboundVariable";
	case SET_UNKNOWN_FUNCTION:			return "UnknownFunction";
	case SET_TYPE_MISMATCH:				return "TypeMismatch";
	case SET_MISSING_ARGUMENT:			return "MissingArgument";
	case SET_ARGUMENT_SHAPE:			return "ArgumentShapeError";
	case SET_UNIMPLEMENTED_VARIABLE:	return "UnimplementedVariable";
	case SET_UNIMPLEMENTED_FUNCTION:	return "UnimplementedFunction";
	case SET_UNKNOWN_INPUT:				return "UnknownInput";
	default:							return "";
	}
}

ScriptError ScriptError::UnboundVariable(const std::string &name)
{
	return ScriptError(SET_UNBOUND_VARIABLE, name, "variable not found: " + name);
}

ScriptError ScriptError::UnboundVariableToAssign(const std::string &name)
{
	return ScriptError(SET_UNBOUND_VARIABLE, name, "variable not found to assign: " + name);
}

ScriptError ScriptError::UnknownFunction(const std::string &name)
{
	return ScriptError(SET_UNKNOWN_FUNCTION, name, "function is not found: " + name);
}

ScriptError ScriptError::TypeMismatch(const std::string &name, const char *new_type, const char *current_type)
{
	return ScriptError(SET_TYPE_MISMATCH, name,
		"invalid type to assign: " + name + ": " + new_type + " for " + current_type);
}

ScriptError ScriptError::MissingArgument(const std::string &name)
{
	return ScriptError(SET_MISSING_ARGUMENT, name, "missing argument: " + name);
}

ScriptError ScriptError::ArgumentShape(const std::string &function_name, const std::string &detail)
{
	return ScriptError(SET_ARGUMENT_SHAPE, function_name, detail + ": " + function_name);
}

ScriptError ScriptError::UnimplementedVariable(const std::string &name)
{
	return ScriptError(SET_UNIMPLEMENTED_VARIABLE, name, "variable is not implemented: " + name);
}

ScriptError ScriptError::UnimplementedFunction(const std::string &name)
{
	return ScriptError(SET_UNIMPLEMENTED_FUNCTION, name, "function is not implemented: " + name);
}

ScriptError ScriptError::UnknownInput(const std::string &title)
{
	return ScriptError(SET_UNKNOWN_INPUT, title, "no value for input: " + title);
}
