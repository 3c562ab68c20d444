#pragma once

//project headers:
#include "DrawCommand.h"
#include "InputDescriptor.h"
#include "ScriptNode.h"

//system headers:
#include <string>
#include <vector>

//forward declarations:
class MarketData;
class PrintListener;

//result of ScanScriptInputs
struct InputScanResult
{
	bool success;
	//error message if not successful
	std::string message;
	std::string title;
	std::vector<InputDescriptor> inputs;
};

//result of RenderScript
struct RenderResult
{
	bool success;
	//error message if not successful
	std::string message;
	std::string title;
	std::vector<DrawCommandPtr> drawCommands;
	ScriptValue returnValue;
};

//evaluates script against market to collect the parameters it declares
//failures are logged to print_listener, or to stderr if print_listener is null, and reported in the result
InputScanResult ScanScriptInputs(const ScriptNode &script, const MarketData *market, PrintListener *print_listener = nullptr);

//evaluates script against market with the stored parameter values input_values to collect its draw commands
//failures are logged to print_listener, or to stderr if print_listener is null, and reported in the result
RenderResult RenderScript(const ScriptNode &script, const MarketData *market, const InputValues &input_values,
	PrintListener *print_listener = nullptr);
