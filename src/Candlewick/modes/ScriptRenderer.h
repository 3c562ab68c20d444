#pragma once

//project headers:
#include "DrawCommand.h"
#include "InputDescriptor.h"
#include "Runtime.h"

//system headers:
#include <string>
#include <vector>

//evaluates a script with stored parameter values, accumulating the chart overlays it draws
//input calls are correlated with stored values by title; untitled inputs are numbered input1, input2, ...
// in call order, the same way the input scanner numbers them
class ScriptRenderer
{
public:
	ScriptRenderer(const MarketData *market, InputValues input_values, PrintListener *print_listener = nullptr);

	//the overlays refer to this object
	ScriptRenderer(const ScriptRenderer &) = delete;
	ScriptRenderer &operator =(const ScriptRenderer &) = delete;

	//evaluates script, returning its value
	//throws ScriptError on failure
	ScriptValue Run(const ScriptNode &script);

	//the draw commands in the order they were drawn
	inline const std::vector<DrawCommandPtr> &GetDrawCommands() const
	{
		return drawCommands;
	}

	inline Runtime &GetRuntime()
	{
		return runtime;
	}

protected:
	ScriptValue Input(ScriptArguments &args);
	ScriptValue Plot(ScriptArguments &args);
	ScriptValue HorizontalLine(ScriptArguments &args);
	ScriptValue Fill(ScriptArguments &args);

	//converts stored to type, throwing ScriptArgumentError if it cannot be converted
	ScriptValue CoerceInputValue(const ScriptValue &stored, const std::string &type, const std::string &title);

	//appends the command and returns it as a value
	ScriptValue AppendDrawCommand(DrawCommand &&command);

	Runtime runtime;
	InputValues inputValues;
	std::vector<DrawCommandPtr> drawCommands;

	//number of input calls so far
	size_t inputIndex;
};
