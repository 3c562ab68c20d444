//project headers:
#include "InputScanner.h"

#include "Series.h"
#include "StringManipulation.h"

InputScanner::InputScanner(const MarketData *market, PrintListener *print_listener)
	: runtime(market, print_listener)
{
	runtime.SetOverlayFunction("input", [this](Runtime &, ScriptArguments &args)
		{	return Input(args);	});
}

ScriptValue InputScanner::Run(const ScriptNode &script)
{
	return runtime.EvaluateTopLevel(script);
}

ScriptValue InputScanner::Input(ScriptArguments &args)
{
	InputArguments input = ParseInputArguments(args);

	InputDescriptor descriptor;
	descriptor.type = input.type;
	if(descriptor.type.empty())
		descriptor.type = InferInputType(input.defaultValue, true);

	//market series are recorded by name
	if(input.defaultValue.GetType() == SVT_MARKET_SERIES)
		descriptor.defaultValue = ScriptValue(input.defaultValue.GetMarketSeries()->GetName());
	else
		descriptor.defaultValue = input.defaultValue;

	descriptor.title = input.title;
	if(descriptor.title.empty())
		descriptor.title = "input" + StringManipulation::NumberToString(inputs.size() + 1);

	descriptor.minValue = input.minValue;
	descriptor.maxValue = input.maxValue;
	descriptor.options = input.options;

	inputs.emplace_back(std::move(descriptor));
	return input.defaultValue;
}
