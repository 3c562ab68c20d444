#pragma once

//project headers:
#include "InputDescriptor.h"
#include "Runtime.h"

//system headers:
#include <vector>

//evaluates a script to discover the parameters it declares
//each input call records a descriptor and evaluates to its default, so the rest of the script runs on defaults
class InputScanner
{
public:
	InputScanner(const MarketData *market = nullptr, PrintListener *print_listener = nullptr);

	//the overlay refers to this object
	InputScanner(const InputScanner &) = delete;
	InputScanner &operator =(const InputScanner &) = delete;

	//evaluates script, returning its value
	//throws ScriptError on failure
	ScriptValue Run(const ScriptNode &script);

	//the descriptors in declaration order
	inline const std::vector<InputDescriptor> &GetInputs() const
	{
		return inputs;
	}

	inline Runtime &GetRuntime()
	{
		return runtime;
	}

protected:
	ScriptValue Input(ScriptArguments &args);

	Runtime runtime;
	std::vector<InputDescriptor> inputs;
};
