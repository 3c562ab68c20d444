#pragma once

//project headers:
#include "ScriptNode.h"

//system headers:
#include <string>
#include <utility>
#include <vector>

////////////////////
// Reference set of script nodes, enough to express scripts programmatically
// A parser may produce these or supply its own ScriptNode implementations

//evaluates to a fixed value
class LiteralNode : public ScriptNode
{
public:
	LiteralNode(ScriptValue _value)
		: value(std::move(_value))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	ScriptValue value;
};

//evaluates to the value bound to a name
class IdentifierNode : public ScriptNode
{
public:
	IdentifierNode(std::string _name)
		: name(std::move(_name))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::string name;
};

//declares a variable in the innermost scope, e.g., x = 1, and evaluates to its value
class VariableDefinitionNode : public ScriptNode
{
public:
	VariableDefinitionNode(std::string _name, ScriptNodePtr _value)
		: name(std::move(_name)), value(std::move(_value))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::string name;
	ScriptNodePtr value;
};

//reassigns an already declared variable, e.g., x := 2, and evaluates to the new value
class AssignmentNode : public ScriptNode
{
public:
	AssignmentNode(std::string _name, ScriptNodePtr _value)
		: name(std::move(_name)), value(std::move(_value))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::string name;
	ScriptNodePtr value;
};

//calls a function with positional arguments followed by named arguments
class FunctionCallNode : public ScriptNode
{
public:
	FunctionCallNode(std::string _name, std::vector<ScriptNodePtr> _positional,
		std::vector<std::pair<std::string, ScriptNodePtr>> _named = std::vector<std::pair<std::string, ScriptNodePtr>>())
		: name(std::move(_name)), positional(std::move(_positional)), named(std::move(_named))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::string name;
	std::vector<ScriptNodePtr> positional;
	std::vector<std::pair<std::string, ScriptNodePtr>> named;
};

//registers a user defined function when evaluated; evaluates to na
class FunctionDefinitionNode : public ScriptNode
{
public:
	FunctionDefinitionNode(std::string _name, std::vector<std::string> _parameter_names, ScriptNodePtr _body)
		: name(std::move(_name)), parameterNames(std::move(_parameter_names)), body(std::move(_body))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::string name;
	std::vector<std::string> parameterNames;
	ScriptNodePtr body;
};

//evaluates statements in order, evaluating to the value of the last one, or na if there are none
//if newScope is true, the statements are evaluated in their own scope
class BlockNode : public ScriptNode
{
public:
	BlockNode(std::vector<ScriptNodePtr> _statements, bool _new_scope = false)
		: statements(std::move(_statements)), newScope(_new_scope)
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	std::vector<ScriptNodePtr> statements;
	bool newScope;
};

//evaluates to a past sample of a series, e.g., close[1]
//offset 0 of a scalar is the scalar itself; any other offset of a scalar is na
class HistoryIndexNode : public ScriptNode
{
public:
	HistoryIndexNode(ScriptNodePtr _source, ScriptNodePtr _offset)
		: source(std::move(_source)), offset(std::move(_offset))
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const override;

protected:
	ScriptNodePtr source;
	ScriptNodePtr offset;
};
