#pragma once

//project headers:
#include "ScriptValue.h"

//system headers:
#include <cstdint>
#include <optional>
#include <string>

//visual type of a draw command
enum DrawCommandType : uint8_t
{
	DCT_LINE,
	DCT_BAR,
	DCT_MARKER,
	DCT_BAND,
	DCT_FILL,
	DCT_HORIZONTAL_LINE
};

//one chart overlay produced by plot, hline or fill
//draw commands are never modified once they have been appended to a renderer's command list
struct DrawCommand
{
	DrawCommandType type = DCT_LINE;

	//series drawn, or the price for a horizontal line
	ScriptValue series;

	//second series of a fill, na otherwise
	ScriptValue series2;

	std::optional<std::string> title;

	//'+' or 'o' for markers, '\0' when unset
	char mark = '\0';

	//color token or string, na when unset
	ScriptValue color;

	std::optional<int64_t> width;

	//transparency percent divided by 100
	std::optional<double> opacity;

	static inline const char *GetTypeName(DrawCommandType type)
	{
		switch(type)
		{
		case DCT_LINE:				return "line";
		case DCT_BAR:				return "bar";
		case DCT_MARKER:			return "marker";
		case DCT_BAND:				return "band";
		case DCT_FILL:				return "fill";
		case DCT_HORIZONTAL_LINE:	return "horizontal-line";
		default:					return "";
		}
	}
};
