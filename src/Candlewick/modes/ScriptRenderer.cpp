//project headers:
#include "ScriptRenderer.h"

#include "BuiltinVariables.h"
#include "FastMath.h"
#include "PlatformSpecific.h"
#include "ScriptError.h"
#include "Series.h"
#include "StringManipulation.h"

//system headers:
#include <array>
#include <cmath>
#include <memory>
#include <optional>

ScriptRenderer::ScriptRenderer(const MarketData *market, InputValues input_values, PrintListener *print_listener)
	: runtime(market, print_listener), inputValues(std::move(input_values)), inputIndex(0)
{
	runtime.SetOverlayFunction("input", [this](Runtime &, ScriptArguments &args)
		{	return Input(args);	});
	runtime.SetOverlayFunction("plot", [this](Runtime &, ScriptArguments &args)
		{	return Plot(args);	});
	runtime.SetOverlayFunction("hline", [this](Runtime &, ScriptArguments &args)
		{	return HorizontalLine(args);	});
	runtime.SetOverlayFunction("fill", [this](Runtime &, ScriptArguments &args)
		{	return Fill(args);	});
}

ScriptValue ScriptRenderer::Run(const ScriptNode &script)
{
	return runtime.EvaluateTopLevel(script);
}

ScriptValue ScriptRenderer::Input(ScriptArguments &args)
{
	InputArguments input = ParseInputArguments(args);

	inputIndex++;
	std::string title = input.title;
	if(title.empty())
		title = "input" + StringManipulation::NumberToString(inputIndex);

	auto found = inputValues.find(title);
	if(found == end(inputValues))
		throw ScriptError::UnknownInput(title);

	std::string type = input.type;
	if(type.empty())
		type = InferInputType(input.defaultValue, false);

	return CoerceInputValue(found->second, type, title);
}

ScriptValue ScriptRenderer::CoerceInputValue(const ScriptValue &stored, const std::string &type, const std::string &title)
{
	std::string conversion_error = "cannot convert input " + title + " to " + type;

	if(type == "bool")
	{
		if(stored.GetType() == SVT_STRING)
		{
			if(stored.GetString() == "true")
				return ScriptValue(true);
			if(stored.GetString() == "false")
				return ScriptValue(false);
			throw ScriptArgumentError(conversion_error);
		}
		if(stored.GetType() == SVT_BOOL || stored.IsNumber())
			return ScriptValue(stored.GetValueAsBoolean());
		throw ScriptArgumentError(conversion_error);
	}

	if(type == "integer" || type == "float")
	{
		double number;
		if(stored.GetType() == SVT_INTEGER)
		{
			if(type == "integer")
				return stored;
			number = static_cast<double>(stored.GetInteger());
		}
		else if(stored.GetType() == SVT_FLOAT || stored.GetType() == SVT_BOOL)
		{
			number = stored.GetValueAsNumber();
		}
		else if(stored.GetType() == SVT_STRING)
		{
			auto [parsed, success] = Platform_StringToNumber(stored.GetString());
			if(!success)
				throw ScriptArgumentError(conversion_error);
			number = parsed;
		}
		else
		{
			throw ScriptArgumentError(conversion_error);
		}

		if(type == "float")
			return ScriptValue(number);

		number = std::trunc(number);
		if(!IsWholeNumberInInt64Range(number))
			throw ScriptArgumentError(conversion_error);
		return ScriptValue(static_cast<int64_t>(number));
	}

	if(type == "source")
	{
		if(stored.IsSeries())
			return stored;
		if(stored.GetType() != SVT_STRING)
			throw ScriptArgumentError(conversion_error);
		return runtime.Lookup(stored.GetString());
	}

	//string, symbol, resolution and session inputs are used as stored
	return stored;
}

ScriptValue ScriptRenderer::AppendDrawCommand(DrawCommand &&command)
{
	DrawCommandPtr draw_command = std::make_shared<DrawCommand>(std::move(command));
	drawCommands.push_back(draw_command);
	return ScriptValue(draw_command);
}

//returns the opacity for a transparency percent; an absent or zero transp leaves the opacity unset
static std::optional<double> TransparencyToOpacity(const ScriptValue &transp)
{
	if(transp.IsNA())
		return std::nullopt;

	int64_t percent = transp.GetInteger();
	if(percent < 0 || percent > 100)
		throw ScriptArgumentError("transp must be between 0 and 100");
	if(percent == 0)
		return std::nullopt;
	return percent / 100.0;
}

//returns the line width; an absent or zero width leaves it unset
static std::optional<int64_t> LineWidth(const ScriptValue &linewidth)
{
	if(linewidth.IsNA() || linewidth.GetInteger() == 0)
		return std::nullopt;
	return linewidth.GetInteger();
}

//returns the color to draw with; series colors resolve to their most recent sample
static ScriptValue ResolveColor(const ScriptValue &color)
{
	if(color.IsSeries())
		return color.GetSeries()->GetCurrent();
	return color;
}

ScriptValue ScriptRenderer::Plot(ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 12> plot_specs = { {
		{ "series",			AK_SERIES,	true },
		{ "title",			AK_STRING,	true },
		{ "color",			AK_ANY,		false },
		{ "linewidth",		AK_INTEGER,	false },
		{ "style",			AK_INTEGER,	false },
		{ "trackprice",		AK_BOOL,	false },
		{ "transp",			AK_INTEGER,	false },
		{ "histbase",		AK_FLOAT,	false },
		{ "offset",			AK_INTEGER,	false },
		{ "join",			AK_BOOL,	false },
		{ "editable",		AK_BOOL,	false },
		{ "show_last",		AK_INTEGER,	false }
	} };

	auto values = ExpandArguments(args, plot_specs);
	const ScriptValue &style = values[4];
	const ScriptValue &transp = values[6];

	DrawCommand command;
	command.series = values[0];
	command.title = values[1].GetString();

	if(!style.IsNA())
	{
		switch(style.GetInteger())
		{
		case PS_HISTOGRAM:
		case PS_COLUMNS:
			command.type = DCT_BAR;
			break;
		case PS_CROSS:
			command.type = DCT_MARKER;
			command.mark = '+';
			break;
		case PS_CIRCLES:
			command.type = DCT_MARKER;
			command.mark = 'o';
			break;
		case PS_AREA:
			command.type = DCT_BAND;
			break;
		default:
			command.type = DCT_LINE;
			break;
		}
	}

	command.color = ResolveColor(values[2]);
	command.width = LineWidth(values[3]);
	command.opacity = TransparencyToOpacity(transp);

	return AppendDrawCommand(std::move(command));
}

ScriptValue ScriptRenderer::HorizontalLine(ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 6> hline_specs = { {
		{ "price",			AK_FLOAT,	true },
		{ "title",			AK_STRING,	false },
		{ "color",			AK_COLOR,	false },
		{ "linestyle",		AK_INTEGER,	false },
		{ "linewidth",		AK_INTEGER,	false },
		{ "editable",		AK_BOOL,	false }
	} };

	auto values = ExpandArguments(args, hline_specs);

	DrawCommand command;
	command.type = DCT_HORIZONTAL_LINE;
	command.series = values[0];
	if(!values[1].IsNA())
		command.title = values[1].GetString();
	if(!(values[2].GetType() == SVT_STRING && values[2].GetString().empty()))
		command.color = values[2];
	command.width = LineWidth(values[4]);

	return AppendDrawCommand(std::move(command));
}

ScriptValue ScriptRenderer::Fill(ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 7> fill_specs = { {
		{ "series1",		AK_DRAW_COMMAND,	true },
		{ "series2",		AK_DRAW_COMMAND,	true },
		{ "color",			AK_ANY,				false },
		{ "transp",			AK_INTEGER,			false },
		{ "title",			AK_STRING,			false },
		{ "editable",		AK_BOOL,			false },
		{ "show_last",		AK_INTEGER,			false }
	} };

	auto values = ExpandArguments(args, fill_specs);

	DrawCommand command;
	command.type = DCT_FILL;
	command.series = values[0].GetDrawCommand()->series;
	command.series2 = values[1].GetDrawCommand()->series;
	command.color = ResolveColor(values[2]);
	command.opacity = TransparencyToOpacity(values[3]);
	if(!values[4].IsNA())
		command.title = values[4].GetString();

	return AppendDrawCommand(std::move(command));
}
