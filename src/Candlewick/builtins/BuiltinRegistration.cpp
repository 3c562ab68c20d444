//project headers:
#include "BuiltinRegistration.h"

#include "StringManipulation.h"

std::pair<std::string, bool> GetRegisteredName(std::string_view source_name)
{
	if(source_name.empty() || source_name[0] == '_')
		return std::make_pair(std::string(), false);

	return std::make_pair(StringManipulation::ReplaceAll(std::string(source_name), "__", "."), true);
}

void RegisterBuiltinFunctions(Runtime &runtime, const std::vector<BuiltinFunctionEntry> &table)
{
	for(auto &entry : table)
	{
		auto [name, registered] = GetRegisteredName(entry.sourceName);
		if(!registered || entry.function == nullptr)
			continue;

		runtime.RegisterHostFunction(name, entry.function);
	}
}

void DefineBuiltinVariables(Runtime &runtime, const std::vector<BuiltinVariableEntry> &table)
{
	for(auto &entry : table)
	{
		auto [name, registered] = GetRegisteredName(entry.sourceName);
		if(!registered)
			continue;

		runtime.DefineBuiltinVariable(name, entry.binding);
	}
}
