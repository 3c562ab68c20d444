#pragma once

//system headers:
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <variant>
#include <vector>

//forward declarations:
class Series;
class MarketSeries;
struct DrawCommand;
class ScriptValue;

//kinds of values a script can hold
//the order must match the alternatives of ScriptValue::ValueVariant
enum ScriptValueType : uint8_t
{
	SVT_NA,
	SVT_BOOL,
	SVT_INTEGER,
	SVT_FLOAT,
	SVT_STRING,
	SVT_COLOR,
	SVT_LIST,
	SVT_SERIES,
	SVT_MARKET_SERIES,
	SVT_DRAW_COMMAND
};

//opaque color token, such as "#ff0000" or "#ff000080"
class ColorToken
{
public:
	ColorToken()
	{	}

	explicit ColorToken(std::string _hex)
		: hex(std::move(_hex))
	{	}

	inline const std::string &GetHex() const
	{
		return hex;
	}

	inline bool operator ==(const ColorToken &other) const
	{
		return hex == other.hex;
	}

	inline bool operator !=(const ColorToken &other) const
	{
		return hex != other.hex;
	}

protected:
	std::string hex;
};

using ScriptValueList = std::vector<ScriptValue>;
using ScriptValueListPtr = std::shared_ptr<const ScriptValueList>;
using SeriesPtr = std::shared_ptr<Series>;
using MarketSeriesPtr = std::shared_ptr<MarketSeries>;
using DrawCommandPtr = std::shared_ptr<const DrawCommand>;

//a single runtime value, one of the kinds in ScriptValueType
class ScriptValue
{
public:
	using ValueVariant = std::variant<std::monostate, bool, int64_t, double, std::string,
		ColorToken, ScriptValueListPtr, SeriesPtr, MarketSeriesPtr, DrawCommandPtr>;

	//constructs na
	ScriptValue()
	{	}

	ScriptValue(bool value)
		: value(std::in_place_index<SVT_BOOL>, value)
	{	}

	ScriptValue(int value)
		: value(std::in_place_index<SVT_INTEGER>, static_cast<int64_t>(value))
	{	}

	ScriptValue(int64_t value)
		: value(std::in_place_index<SVT_INTEGER>, value)
	{	}

	ScriptValue(double value)
		: value(std::in_place_index<SVT_FLOAT>, value)
	{	}

	ScriptValue(std::string value)
		: value(std::in_place_index<SVT_STRING>, std::move(value))
	{	}

	ScriptValue(const char *value)
		: value(std::in_place_index<SVT_STRING>, value)
	{	}

	ScriptValue(ColorToken value)
		: value(std::in_place_index<SVT_COLOR>, std::move(value))
	{	}

	ScriptValue(ScriptValueList list)
		: value(std::in_place_index<SVT_LIST>, ScriptValueListPtr(std::make_shared<ScriptValueList>(std::move(list))))
	{	}

	//series that are bound to market data are stored as SVT_MARKET_SERIES
	ScriptValue(SeriesPtr series);

	ScriptValue(MarketSeriesPtr series);

	ScriptValue(DrawCommandPtr draw_command)
		: value(std::in_place_index<SVT_DRAW_COMMAND>, std::move(draw_command))
	{	}

	inline ScriptValueType GetType() const
	{
		return static_cast<ScriptValueType>(value.index());
	}

	inline bool IsNA() const
	{
		return value.index() == SVT_NA;
	}

	//true for both computed and market series
	inline bool IsSeries() const
	{
		return value.index() == SVT_SERIES || value.index() == SVT_MARKET_SERIES;
	}

	inline bool IsNumber() const
	{
		return value.index() == SVT_INTEGER || value.index() == SVT_FLOAT;
	}

	//accessors for when the type is already known; the type must match
	inline bool GetBool() const
	{
		return std::get<bool>(value);
	}

	inline int64_t GetInteger() const
	{
		return std::get<int64_t>(value);
	}

	inline double GetFloat() const
	{
		return std::get<double>(value);
	}

	inline const std::string &GetString() const
	{
		return std::get<std::string>(value);
	}

	inline const ColorToken &GetColor() const
	{
		return std::get<ColorToken>(value);
	}

	inline const ScriptValueList &GetList() const
	{
		return *std::get<ScriptValueListPtr>(value);
	}

	inline const MarketSeriesPtr &GetMarketSeries() const
	{
		return std::get<MarketSeriesPtr>(value);
	}

	inline const DrawCommandPtr &GetDrawCommand() const
	{
		return std::get<DrawCommandPtr>(value);
	}

	//returns the series for both SVT_SERIES and SVT_MARKET_SERIES, nullptr otherwise
	SeriesPtr GetSeries() const;

	//returns the value as a number; series yield their current sample
	//na and values that have no numeric meaning return value_if_na
	double GetValueAsNumber(double value_if_na = std::numeric_limits<double>::quiet_NaN()) const;

	//returns the truthiness of the value; series yield the truthiness of their current sample
	bool GetValueAsBoolean() const;

	//returns a human readable representation, as printed by scripts
	std::string ToString() const;

	//returns true if a variable currently holding current may be reassigned to new_value
	//kinds must match exactly, except that any series may replace any other series
	// and a variable currently holding na may take any kind
	static bool IsAssignmentCompatible(const ScriptValue &current, const ScriptValue &new_value);

	//returns true if a and b are the same kind and equal; series and draw commands compare by identity
	static bool AreEqual(const ScriptValue &a, const ScriptValue &b);

	static const char *GetTypeName(ScriptValueType type);

protected:
	ValueVariant value;
};
