//project headers:
#include "BuiltinRegistration.h"
#include "BuiltinVariables.h"
#include "MarketData.h"
#include "ScriptError.h"
#include "Series.h"

//3rd party headers:
#include <date/date.h>

//system headers:
#include <chrono>
#include <memory>

//returns a series bound to field of the runtime's market
template<MarketField field>
static ScriptValue BuiltinVariable_MarketField(Runtime &runtime)
{
	return ScriptValue(std::make_shared<MarketSeries>(runtime.GetMarket(), field));
}

//builds a series of integers by applying get_value to each bar of the runtime's market, oldest first
template<typename BarFunction>
static ScriptValue BuildBarSeries(Runtime &runtime, BarFunction get_value)
{
	auto series = std::make_shared<ComputedSeries>();
	const MarketData *market = runtime.GetMarket();
	if(market != nullptr)
	{
		for(size_t i = 0; i < market->GetNumBars(); i++)
			series->Append(ScriptValue(get_value(i, market->GetBar(i))));
	}
	return ScriptValue(SeriesPtr(series));
}

static ScriptValue BuiltinVariable_bar_index(Runtime &runtime)
{
	return BuildBarSeries(runtime, [](size_t index, const MarketBar &)
		{	return static_cast<int64_t>(index);	});
}

//bar open time in milliseconds
static ScriptValue BuiltinVariable_time(Runtime &runtime)
{
	return BuildBarSeries(runtime, [](size_t, const MarketBar &bar)
		{	return static_cast<int64_t>(bar.time * 1000);	});
}

//fields of the UTC calendar time of a bar
enum BarTimePart
{
	BTP_YEAR,
	BTP_MONTH,
	BTP_DAY_OF_MONTH,
	BTP_DAY_OF_WEEK,
	BTP_HOUR,
	BTP_MINUTE
};

static int64_t GetBarTimePart(int64_t bar_time, BarTimePart part)
{
	auto tp = date::sys_seconds{ std::chrono::seconds{ bar_time } };
	auto day = date::floor<date::days>(tp);

	switch(part)
	{
	case BTP_YEAR:
		return static_cast<int>(date::year_month_day{ day }.year());
	case BTP_MONTH:
		return static_cast<unsigned>(date::year_month_day{ day }.month());
	case BTP_DAY_OF_MONTH:
		return static_cast<unsigned>(date::year_month_day{ day }.day());
	case BTP_DAY_OF_WEEK:
		//1 is Sunday
		return static_cast<int64_t>(date::weekday{ day }.c_encoding()) + 1;
	case BTP_HOUR:
		return date::make_time(tp - day).hours().count();
	case BTP_MINUTE:
		return date::make_time(tp - day).minutes().count();
	default:
		return 0;
	}
}

template<BarTimePart part>
static ScriptValue BuiltinVariable_BarTimePart(Runtime &runtime)
{
	return BuildBarSeries(runtime, [](size_t, const MarketBar &bar)
		{	return GetBarTimePart(bar.time, part);	});
}

static ScriptValue BuiltinVariable_syminfo__ticker(Runtime &runtime)
{
	if(runtime.GetMarket() == nullptr)
		return ScriptValue(std::string());
	return ScriptValue(runtime.GetMarket()->GetSymbol());
}

static ScriptValue BuiltinVariable_timeframe__period(Runtime &runtime)
{
	if(runtime.GetMarket() == nullptr)
		return ScriptValue(std::string());
	return ScriptValue(runtime.GetMarket()->GetTimeframe());
}

static ScriptValue BuiltinVariable_NotImplemented(Runtime &)
{
	throw ScriptNotImplemented();
}

static ScriptValue Color(const char *hex)
{
	return ScriptValue(ColorToken(hex));
}

static ScriptValue Constant(int64_t value)
{
	return ScriptValue(value);
}

const std::vector<BuiltinVariableEntry> &GetBuiltinVariableTable()
{
	static const std::vector<BuiltinVariableEntry> builtin_variables = {

		//market series
		{ "open",					&BuiltinVariable_MarketField<MF_OPEN> },
		{ "high",					&BuiltinVariable_MarketField<MF_HIGH> },
		{ "low",					&BuiltinVariable_MarketField<MF_LOW> },
		{ "close",					&BuiltinVariable_MarketField<MF_CLOSE> },
		{ "volume",					&BuiltinVariable_MarketField<MF_VOLUME> },
		{ "hl2",					&BuiltinVariable_MarketField<MF_HL2> },
		{ "hlc3",					&BuiltinVariable_MarketField<MF_HLC3> },
		{ "ohlc4",					&BuiltinVariable_MarketField<MF_OHLC4> },

		//bar position and time
		{ "bar_index",				&BuiltinVariable_bar_index },
		{ "n",						&BuiltinVariable_bar_index },
		{ "time",					&BuiltinVariable_time },
		{ "year",					&BuiltinVariable_BarTimePart<BTP_YEAR> },
		{ "month",					&BuiltinVariable_BarTimePart<BTP_MONTH> },
		{ "dayofmonth",				&BuiltinVariable_BarTimePart<BTP_DAY_OF_MONTH> },
		{ "dayofweek",				&BuiltinVariable_BarTimePart<BTP_DAY_OF_WEEK> },
		{ "hour",					&BuiltinVariable_BarTimePart<BTP_HOUR> },
		{ "minute",					&BuiltinVariable_BarTimePart<BTP_MINUTE> },
		{ "timenow",				&BuiltinVariable_NotImplemented },

		//symbol information
		{ "syminfo__ticker",		&BuiltinVariable_syminfo__ticker },
		{ "syminfo__mintick",		&BuiltinVariable_NotImplemented },
		{ "timeframe__period",		&BuiltinVariable_timeframe__period },

		{ "na",						ScriptValue() },

		//colors
		{ "color__aqua",			Color("#00BCD4") },
		{ "color__black",			Color("#363A45") },
		{ "color__blue",			Color("#2196F3") },
		{ "color__fuchsia",			Color("#E040FB") },
		{ "color__gray",			Color("#787B86") },
		{ "color__green",			Color("#4CAF50") },
		{ "color__lime",			Color("#00E676") },
		{ "color__maroon",			Color("#880E4F") },
		{ "color__navy",			Color("#311B92") },
		{ "color__olive",			Color("#808000") },
		{ "color__orange",			Color("#FF9800") },
		{ "color__purple",			Color("#9C27B0") },
		{ "color__red",				Color("#FF5252") },
		{ "color__silver",			Color("#B2B5BE") },
		{ "color__teal",			Color("#00897B") },
		{ "color__white",			Color("#FFFFFF") },
		{ "color__yellow",			Color("#FFEB3B") },

		//plot styles
		{ "line",					Constant(PS_LINE) },
		{ "stepline",				Constant(PS_STEPLINE) },
		{ "histogram",				Constant(PS_HISTOGRAM) },
		{ "cross",					Constant(PS_CROSS) },
		{ "area",					Constant(PS_AREA) },
		{ "columns",				Constant(PS_COLUMNS) },
		{ "circles",				Constant(PS_CIRCLES) },
		{ "plot__style_line",		Constant(PS_LINE) },
		{ "plot__style_stepline",	Constant(PS_STEPLINE) },
		{ "plot__style_histogram",	Constant(PS_HISTOGRAM) },
		{ "plot__style_cross",		Constant(PS_CROSS) },
		{ "plot__style_area",		Constant(PS_AREA) },
		{ "plot__style_columns",	Constant(PS_COLUMNS) },
		{ "plot__style_circles",	Constant(PS_CIRCLES) },

		//horizontal line styles
		{ "hline__style_solid",		Constant(HLS_SOLID) },
		{ "hline__style_dotted",	Constant(HLS_DOTTED) },
		{ "hline__style_dashed",	Constant(HLS_DASHED) },

		//input types
		{ "input__bool",			ScriptValue("bool") },
		{ "input__integer",			ScriptValue("integer") },
		{ "input__float",			ScriptValue("float") },
		{ "input__string",			ScriptValue("string") },
		{ "input__source",			ScriptValue("source") },
		{ "input__symbol",			ScriptValue("symbol") },
		{ "input__resolution",		ScriptValue("resolution") },
		{ "input__session",			ScriptValue("session") }
	};

	return builtin_variables;
}
