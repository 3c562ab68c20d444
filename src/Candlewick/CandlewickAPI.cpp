//project headers:
#include "Candlewick.h"

#include "InputScanner.h"
#include "PrintListener.h"
#include "ScriptError.h"
#include "ScriptRenderer.h"

//system headers:
#include <iostream>

//logs a failed pass
static void LogPassError(PrintListener *print_listener, const std::string &message)
{
	if(print_listener != nullptr)
		print_listener->LogError(message);
	else
		std::cerr << "Error: " << message << std::endl;
}

InputScanResult ScanScriptInputs(const ScriptNode &script, const MarketData *market, PrintListener *print_listener)
{
	InputScanner scanner(market, print_listener);

	InputScanResult result;
	try
	{
		scanner.Run(script);
		result.success = true;
	}
	catch(ScriptError &e)
	{
		LogPassError(print_listener, e.what());
		result.success = false;
		result.message = e.what();
		return result;
	}

	result.title = scanner.GetRuntime().GetTitle();
	result.inputs = scanner.GetInputs();
	return result;
}

RenderResult RenderScript(const ScriptNode &script, const MarketData *market, const InputValues &input_values,
	PrintListener *print_listener)
{
	ScriptRenderer renderer(market, input_values, print_listener);

	RenderResult result;
	try
	{
		result.returnValue = renderer.Run(script);
		result.success = true;
	}
	catch(ScriptError &e)
	{
		LogPassError(print_listener, e.what());
		result.success = false;
		result.message = e.what();
		return result;
	}

	result.title = renderer.GetRuntime().GetTitle();
	result.drawCommands = renderer.GetDrawCommands();
	return result;
}
