#pragma once

//project headers:
#include "FastMath.h"
#include "HashMaps.h"
#include "ScriptArguments.h"
#include "ScriptNode.h"
#include "ScriptValue.h"

//system headers:
#include <functional>
#include <string>
#include <variant>
#include <vector>

//forward declarations:
class MarketData;
class PrintListener;
class Runtime;

//callable registered as a host builtin or installed by an execution mode
using HostFunction = std::function<ScriptValue(Runtime &, ScriptArguments &)>;
using HostFunctionPointer = ScriptValue(*)(Runtime &, ScriptArguments &);

//zero-argument accessor bound in a scope; invoked on every lookup of its name
//accessors may read runtime state but must not modify the scope stack
using VariableAccessor = ScriptValue(*)(Runtime &);

//function defined by a script, evaluated by binding its parameters in a new scope
struct UserDefinedFunction
{
	std::vector<std::string> parameterNames;
	ScriptNodePtr body;
};

using FunctionEntry = std::variant<HostFunction, UserDefinedFunction>;
using ScopeBinding = std::variant<ScriptValue, VariableAccessor>;
using Scope = FastHashMap<std::string, ScopeBinding>;

//when the saver is destroyed, the scope stack is restored to the size it had when the saver was created,
// so scopes are released even when evaluation within them throws
class ScopeStackStateSaver
{
public:
	__forceinline ScopeStackStateSaver(std::vector<Scope> *_stack)
	{
		stack = _stack;
		originalStackSize = stack->size();
	}

	//constructor that pushes one new scope
	__forceinline ScopeStackStateSaver(std::vector<Scope> *_stack, bool push_scope)
	{
		stack = _stack;
		originalStackSize = stack->size();
		if(push_scope)
			stack->emplace_back();
	}

	ScopeStackStateSaver(const ScopeStackStateSaver &) = delete;
	ScopeStackStateSaver &operator =(const ScopeStackStateSaver &) = delete;

	__forceinline ~ScopeStackStateSaver()
	{
		//never release the global scope
		if(originalStackSize > 0)
			stack->resize(originalStackSize);
	}

protected:
	std::vector<Scope> *stack;
	size_t originalStackSize;
};

//evaluation engine: a stack of lexical scopes and a function registry
//builtin functions and variables are registered at construction
//execution modes change the meaning of specific calls by installing overlay functions,
// which are consulted before the registry
class Runtime
{
public:
	//market and print_listener may be null and must outlive the runtime
	Runtime(const MarketData *_market = nullptr, PrintListener *_print_listener = nullptr);

	//binds name to value in the innermost scope, replacing any binding of name in that scope only
	void Define(const std::string &name, ScriptValue value);

	//finds the innermost scope that binds name and replaces its value, returning value
	//throws ScriptError SET_UNBOUND_VARIABLE if name is not bound,
	// SET_TYPE_MISMATCH if the kind of value is not compatible with the current value
	ScriptValue Assign(const std::string &name, ScriptValue value);

	//returns the value bound to name in the innermost scope that binds it, invoking accessors
	//throws ScriptError SET_UNBOUND_VARIABLE if not bound, SET_UNIMPLEMENTED_VARIABLE if the accessor is not implemented
	ScriptValue Lookup(const std::string &name);

	inline void PushScope()
	{
		scopes.emplace_back();
	}

	//removes the innermost scope; the global scope is never removed
	inline void PopScope()
	{
		if(scopes.size() > 1)
			scopes.pop_back();
	}

	inline size_t GetScopeStackDepth() const
	{
		return scopes.size();
	}

	//pushes a new scope and returns a saver that pops it, and anything pushed after it, when destroyed
	__forceinline ScopeStackStateSaver CreateScopeStackStateSaver()
	{
		return ScopeStackStateSaver(&scopes, true);
	}

	//calls the function registered as name with args
	//throws ScriptError SET_UNKNOWN_FUNCTION if nothing is registered under name,
	// SET_ARGUMENT_SHAPE or SET_UNIMPLEMENTED_FUNCTION for host functions that reject their arguments or are not implemented,
	// SET_MISSING_ARGUMENT if a parameter of a user defined function is left unbound,
	// and propagates any error from evaluating the function
	ScriptValue Call(const std::string &name, ScriptArguments &args);

	inline ScriptValue Call(const std::string &name, std::vector<ScriptValue> positional,
		SmallMap<std::string, ScriptValue> named = SmallMap<std::string, ScriptValue>())
	{
		ScriptArguments args(std::move(positional), std::move(named));
		return Call(name, args);
	}

	//evaluates node as a whole script in its own scope so that its locals do not leak into the global scope
	ScriptValue EvaluateTopLevel(const ScriptNode &node);

	//registers a user defined function, replacing any function or overlay of the same name
	void RegisterFunction(const std::string &name, std::vector<std::string> parameter_names, ScriptNodePtr body);

	//registers a host function, replacing any function or overlay of the same name
	void RegisterHostFunction(const std::string &name, HostFunction function);

	//installs function to be called for name instead of what is registered
	void SetOverlayFunction(const std::string &name, HostFunction function);

	//binds name in the global scope
	void DefineBuiltinVariable(const std::string &name, ScopeBinding binding);

	bool HasFunction(const std::string &name) const;

	inline const MarketData *GetMarket() const
	{
		return market;
	}

	inline PrintListener *GetPrintListener() const
	{
		return printListener;
	}

	inline const std::string &GetTitle() const
	{
		return title;
	}

	inline void SetTitle(std::string new_title)
	{
		title = std::move(new_title);
	}

protected:
	ScriptValue CallHostFunction(const std::string &name, const HostFunction &function, ScriptArguments &args);

	ScriptValue CallUserDefinedFunction(const UserDefinedFunction &function, ScriptArguments &args);

	//returns the binding of name in the innermost scope that has it, nullptr if none
	ScopeBinding *FindBinding(const std::string &name);

	//scopes, the first of which is the global scope
	std::vector<Scope> scopes;

	CompactHashMap<std::string, FunctionEntry> functionTable;

	//functions installed by an execution mode, consulted before functionTable
	FastHashMap<std::string, HostFunction> overlayFunctionTable;

	const MarketData *market;
	PrintListener *printListener;

	std::string title;
};
