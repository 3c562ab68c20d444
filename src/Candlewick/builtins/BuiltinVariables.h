#pragma once

//system headers:
#include <cstdint>

//values of the plot style constants, e.g., plot.style_histogram
enum PlotStyle : int64_t
{
	PS_LINE = 1,
	PS_STEPLINE,
	PS_HISTOGRAM,
	PS_CROSS,
	PS_AREA,
	PS_COLUMNS,
	PS_CIRCLES
};

//values of the horizontal line style constants, e.g., hline.style_dashed
enum HorizontalLineStyle : int64_t
{
	HLS_SOLID,
	HLS_DOTTED,
	HLS_DASHED
};
