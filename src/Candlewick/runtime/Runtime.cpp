//project headers:
#include "Runtime.h"

#include "BuiltinRegistration.h"
#include "ScriptError.h"

//system headers:
#include <algorithm>

Runtime::Runtime(const MarketData *_market, PrintListener *_print_listener)
	: market(_market), printListener(_print_listener), title("No Title")
{
	//global scope
	scopes.emplace_back();

	RegisterBuiltinFunctions(*this, GetBuiltinFunctionTable());
	DefineBuiltinVariables(*this, GetBuiltinVariableTable());
}

void Runtime::Define(const std::string &name, ScriptValue value)
{
	scopes.back()[name] = ScopeBinding(std::move(value));
}

ScriptValue Runtime::Assign(const std::string &name, ScriptValue value)
{
	ScopeBinding *binding = FindBinding(name);
	if(binding == nullptr)
		throw ScriptError::UnboundVariableToAssign(name);

	if(std::holds_alternative<VariableAccessor>(*binding))
		throw ScriptError::TypeMismatch(name, ScriptValue::GetTypeName(value.GetType()), "builtin variable");

	auto &current = std::get<ScriptValue>(*binding);
	if(!ScriptValue::IsAssignmentCompatible(current, value))
		throw ScriptError::TypeMismatch(name, ScriptValue::GetTypeName(value.GetType()),
			ScriptValue::GetTypeName(current.GetType()));

	current = value;
	return value;
}

ScriptValue Runtime::Lookup(const std::string &name)
{
	ScopeBinding *binding = FindBinding(name);
	if(binding == nullptr)
		throw ScriptError::UnboundVariable(name);

	if(std::holds_alternative<ScriptValue>(*binding))
		return std::get<ScriptValue>(*binding);

	VariableAccessor accessor = std::get<VariableAccessor>(*binding);
	try
	{
		return accessor(*this);
	}
	catch(ScriptNotImplemented &)
	{
		throw ScriptError::UnimplementedVariable(name);
	}
}

ScriptValue Runtime::Call(const std::string &name, ScriptArguments &args)
{
	auto overlay = overlayFunctionTable.find(name);
	if(overlay != end(overlayFunctionTable))
	{
		//copy, since the function may alter the tables
		HostFunction function = overlay->second;
		return CallHostFunction(name, function, args);
	}

	auto found = functionTable.find(name);
	if(found == end(functionTable))
		throw ScriptError::UnknownFunction(name);

	FunctionEntry entry = found->second;
	if(std::holds_alternative<HostFunction>(entry))
		return CallHostFunction(name, std::get<HostFunction>(entry), args);
	return CallUserDefinedFunction(std::get<UserDefinedFunction>(entry), args);
}

ScriptValue Runtime::EvaluateTopLevel(const ScriptNode &node)
{
	auto saver = CreateScopeStackStateSaver();
	return node.Evaluate(*this);
}

void Runtime::RegisterFunction(const std::string &name, std::vector<std::string> parameter_names, ScriptNodePtr body)
{
	overlayFunctionTable.erase(name);
	functionTable[name] = FunctionEntry(UserDefinedFunction{ std::move(parameter_names), std::move(body) });
}

void Runtime::RegisterHostFunction(const std::string &name, HostFunction function)
{
	overlayFunctionTable.erase(name);
	functionTable[name] = FunctionEntry(std::move(function));
}

void Runtime::SetOverlayFunction(const std::string &name, HostFunction function)
{
	overlayFunctionTable[name] = std::move(function);
}

void Runtime::DefineBuiltinVariable(const std::string &name, ScopeBinding binding)
{
	scopes.front()[name] = std::move(binding);
}

bool Runtime::HasFunction(const std::string &name) const
{
	return overlayFunctionTable.find(name) != end(overlayFunctionTable)
		|| functionTable.find(name) != end(functionTable);
}

ScriptValue Runtime::CallHostFunction(const std::string &name, const HostFunction &function, ScriptArguments &args)
{
	try
	{
		return function(*this, args);
	}
	catch(ScriptArgumentError &e)
	{
		throw ScriptError::ArgumentShape(name, e.what());
	}
	catch(ScriptNotImplemented &)
	{
		throw ScriptError::UnimplementedFunction(name);
	}
}

ScriptValue Runtime::CallUserDefinedFunction(const UserDefinedFunction &function, ScriptArguments &args)
{
	auto saver = CreateScopeStackStateSaver();

	//extra positional arguments are ignored
	size_t num_positional = std::min(function.parameterNames.size(), args.positional.size());
	for(size_t i = 0; i < num_positional; i++)
		Define(function.parameterNames[i], args.positional[i]);

	for(auto &[arg_name, value] : args.named)
		Define(arg_name, value);

	auto &scope = scopes.back();
	for(auto &parameter_name : function.parameterNames)
	{
		if(scope.find(parameter_name) == end(scope))
			throw ScriptError::MissingArgument(parameter_name);
	}

	if(function.body == nullptr)
		return ScriptValue();
	return function.body->Evaluate(*this);
}

ScopeBinding *Runtime::FindBinding(const std::string &name)
{
	for(auto scope = rbegin(scopes); scope != rend(scopes); ++scope)
	{
		auto found = scope->find(name);
		if(found != end(*scope))
			return &found->second;
	}
	return nullptr;
}
