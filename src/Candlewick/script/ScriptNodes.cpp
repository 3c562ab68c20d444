//project headers:
#include "ScriptNodes.h"

#include "Runtime.h"
#include "ScriptError.h"
#include "Series.h"

ScriptValue LiteralNode::Evaluate(Runtime &) const
{
	return value;
}

ScriptValue IdentifierNode::Evaluate(Runtime &runtime) const
{
	return runtime.Lookup(name);
}

ScriptValue VariableDefinitionNode::Evaluate(Runtime &runtime) const
{
	ScriptValue new_value = value->Evaluate(runtime);
	runtime.Define(name, new_value);
	return new_value;
}

ScriptValue AssignmentNode::Evaluate(Runtime &runtime) const
{
	return runtime.Assign(name, value->Evaluate(runtime));
}

ScriptValue FunctionCallNode::Evaluate(Runtime &runtime) const
{
	ScriptArguments args;
	args.positional.reserve(positional.size());
	for(auto &arg : positional)
		args.positional.emplace_back(arg->Evaluate(runtime));

	for(auto &[arg_name, arg] : named)
		args.named.emplace(arg_name, arg->Evaluate(runtime));

	return runtime.Call(name, args);
}

ScriptValue FunctionDefinitionNode::Evaluate(Runtime &runtime) const
{
	runtime.RegisterFunction(name, parameterNames, body);
	return ScriptValue();
}

ScriptValue BlockNode::Evaluate(Runtime &runtime) const
{
	if(newScope)
	{
		auto saver = runtime.CreateScopeStackStateSaver();
		ScriptValue result;
		for(auto &statement : statements)
			result = statement->Evaluate(runtime);
		return result;
	}

	ScriptValue result;
	for(auto &statement : statements)
		result = statement->Evaluate(runtime);
	return result;
}

ScriptValue HistoryIndexNode::Evaluate(Runtime &runtime) const
{
	ScriptValue source_value = source->Evaluate(runtime);
	ScriptValue offset_value = offset->Evaluate(runtime);

	if(offset_value.GetType() != SVT_INTEGER || offset_value.GetInteger() < 0)
		throw ScriptError::ArgumentShape("[]", "history offset must be a non-negative integer");

	int64_t back = offset_value.GetInteger();
	if(source_value.IsSeries())
		return source_value.GetSeries()->GetRelative(-back);

	if(back == 0)
		return source_value;
	return ScriptValue();
}
