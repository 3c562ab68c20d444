#pragma once

//project headers:
#include "Runtime.h"

//system headers:
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//entry of a builtin function table
//source names use a double underscore where the registered name has a namespacing dot, e.g., math__max is math.max
struct BuiltinFunctionEntry
{
	const char *sourceName;
	HostFunctionPointer function;
};

//entry of a builtin variable table, either a plain value or an accessor
struct BuiltinVariableEntry
{
	const char *sourceName;
	ScopeBinding binding;
};

//returns the name source_name registers under and true,
// or an empty string and false if source_name is never registered (names starting with an underscore)
std::pair<std::string, bool> GetRegisteredName(std::string_view source_name);

//registers every eligible entry of table as a host function of runtime
void RegisterBuiltinFunctions(Runtime &runtime, const std::vector<BuiltinFunctionEntry> &table);

//binds every eligible entry of table in the global scope of runtime
void DefineBuiltinVariables(Runtime &runtime, const std::vector<BuiltinVariableEntry> &table);

//the host builtin libraries every runtime is constructed with
const std::vector<BuiltinFunctionEntry> &GetBuiltinFunctionTable();
const std::vector<BuiltinVariableEntry> &GetBuiltinVariableTable();
