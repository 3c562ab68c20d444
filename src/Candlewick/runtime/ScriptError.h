#pragma once

//system headers:
#include <cstdint>
#include <stdexcept>
#include <string>

//kinds of failures that abort an evaluation pass
enum ScriptErrorType : uint8_t
{
	SET_UNBOUND_VARIABLE,
	SET_UNKNOWN_FUNCTION,
	SET_TYPE_MISMATCH,
	SET_MISSING_ARGUMENT,
	SET_ARGUMENT_SHAPE,
	SET_UNIMPLEMENTED_VARIABLE,
	SET_UNIMPLEMENTED_FUNCTION,
	SET_UNKNOWN_INPUT
};

//failure raised by the runtime; carries its kind and the name of the variable, function or input involved
//there is no local recovery, the error aborts the whole pass
class ScriptError : public std::runtime_error
{
public:
	ScriptError(ScriptErrorType _type, std::string _name, const std::string &message)
		: std::runtime_error(message), type(_type), name(std::move(_name))
	{	}

	inline ScriptErrorType GetType() const
	{
		return type;
	}

	inline const std::string &GetName() const
	{
		return name;
	}

	static const char *GetTypeName(ScriptErrorType type);

	//helpers that build each kind with its canonical message
	static ScriptError UnboundVariable(const std::string &name);
	static ScriptError UnboundVariableToAssign(const std::string &name);
	static ScriptError UnknownFunction(const std::string &name);
	static ScriptError TypeMismatch(const std::string &name, const char *new_type, const char *current_type);
	static ScriptError MissingArgument(const std::string &name);
	static ScriptError ArgumentShape(const std::string &function_name, const std::string &detail);
	static ScriptError UnimplementedVariable(const std::string &name);
	static ScriptError UnimplementedFunction(const std::string &name);
	static ScriptError UnknownInput(const std::string &title);

protected:
	ScriptErrorType type;
	std::string name;
};

//thrown by host functions when their arguments are not of the expected shape
//the runtime rethrows it as a ScriptError of type SET_ARGUMENT_SHAPE carrying the function name
class ScriptArgumentError : public std::runtime_error
{
public:
	explicit ScriptArgumentError(const std::string &message)
		: std::runtime_error(message)
	{	}
};

//thrown by host functions and builtin variable accessors that are registered but not implemented
class ScriptNotImplemented : public std::logic_error
{
public:
	ScriptNotImplemented()
		: std::logic_error("not implemented")
	{	}
};
