//project headers:
#include "ScriptValue.h"

#include "DrawCommand.h"
#include "FastMath.h"
#include "Series.h"
#include "StringManipulation.h"

ScriptValue::ScriptValue(SeriesPtr series)
{
	auto market_series = std::dynamic_pointer_cast<MarketSeries>(series);
	if(market_series != nullptr)
		value.emplace<SVT_MARKET_SERIES>(std::move(market_series));
	else
		value.emplace<SVT_SERIES>(std::move(series));
}

ScriptValue::ScriptValue(MarketSeriesPtr series)
	: value(std::in_place_index<SVT_MARKET_SERIES>, std::move(series))
{	}

SeriesPtr ScriptValue::GetSeries() const
{
	switch(GetType())
	{
	case SVT_SERIES:
		return std::get<SVT_SERIES>(value);
	case SVT_MARKET_SERIES:
		return std::get<SVT_MARKET_SERIES>(value);
	default:
		return nullptr;
	}
}

double ScriptValue::GetValueAsNumber(double value_if_na) const
{
	switch(GetType())
	{
	case SVT_BOOL:
		return GetBool() ? 1.0 : 0.0;
	case SVT_INTEGER:
		return static_cast<double>(GetInteger());
	case SVT_FLOAT:
		return GetFloat();
	case SVT_SERIES:
	case SVT_MARKET_SERIES:
	{
		auto series = GetSeries();
		if(series == nullptr)
			return value_if_na;
		auto current = series->GetCurrent();
		//series of series are not built by anything, but don't recurse if one shows up
		if(current.IsSeries())
			return value_if_na;
		return current.GetValueAsNumber(value_if_na);
	}
	default:
		return value_if_na;
	}
}

bool ScriptValue::GetValueAsBoolean() const
{
	switch(GetType())
	{
	case SVT_NA:
		return false;
	case SVT_BOOL:
		return GetBool();
	case SVT_INTEGER:
		return GetInteger() != 0;
	case SVT_FLOAT:
	{
		double number = GetFloat();
		return number != 0.0 && !FastIsNaN(number);
	}
	case SVT_STRING:
		return !GetString().empty();
	case SVT_LIST:
		return !GetList().empty();
	case SVT_SERIES:
	case SVT_MARKET_SERIES:
	{
		auto series = GetSeries();
		if(series == nullptr)
			return false;
		auto current = series->GetCurrent();
		if(current.IsSeries())
			return false;
		return current.GetValueAsBoolean();
	}
	default:
		return true;
	}
}

std::string ScriptValue::ToString() const
{
	switch(GetType())
	{
	case SVT_NA:
		return "NaN";
	case SVT_BOOL:
		return GetBool() ? "true" : "false";
	case SVT_INTEGER:
		return StringManipulation::NumberToString(GetInteger());
	case SVT_FLOAT:
		return StringManipulation::NumberToString(GetFloat());
	case SVT_STRING:
		return GetString();
	case SVT_COLOR:
		return GetColor().GetHex();
	case SVT_LIST:
	{
		std::string s = "[";
		bool first = true;
		for(auto &element : GetList())
		{
			if(!first)
				s += ", ";
			first = false;
			s += element.ToString();
		}
		s += "]";
		return s;
	}
	case SVT_SERIES:
	{
		auto series = GetSeries();
		size_t size = (series != nullptr ? series->Size() : 0);
		return "series(" + StringManipulation::NumberToString(size) + ")";
	}
	case SVT_MARKET_SERIES:
		return GetMarketSeries()->GetName();
	case SVT_DRAW_COMMAND:
		return std::string(DrawCommand::GetTypeName(GetDrawCommand()->type));
	default:
		return "";
	}
}

bool ScriptValue::IsAssignmentCompatible(const ScriptValue &current, const ScriptValue &new_value)
{
	//a variable declared as na may take a value of any kind
	if(current.IsNA())
		return true;
	if(current.IsSeries() && new_value.IsSeries())
		return true;
	return current.GetType() == new_value.GetType();
}

bool ScriptValue::AreEqual(const ScriptValue &a, const ScriptValue &b)
{
	if(a.GetType() != b.GetType())
		return false;

	switch(a.GetType())
	{
	case SVT_NA:
		return true;
	case SVT_BOOL:
		return a.GetBool() == b.GetBool();
	case SVT_INTEGER:
		return a.GetInteger() == b.GetInteger();
	case SVT_FLOAT:
		return EqualIncludingNaN(a.GetFloat(), b.GetFloat());
	case SVT_STRING:
		return a.GetString() == b.GetString();
	case SVT_COLOR:
		return a.GetColor() == b.GetColor();
	case SVT_LIST:
	{
		auto &a_list = a.GetList();
		auto &b_list = b.GetList();
		if(a_list.size() != b_list.size())
			return false;
		for(size_t i = 0; i < a_list.size(); i++)
		{
			if(!AreEqual(a_list[i], b_list[i]))
				return false;
		}
		return true;
	}
	case SVT_SERIES:
	case SVT_MARKET_SERIES:
		return a.GetSeries() == b.GetSeries();
	case SVT_DRAW_COMMAND:
		return a.GetDrawCommand() == b.GetDrawCommand();
	default:
		return false;
	}
}

const char *ScriptValue::GetTypeName(ScriptValueType type)
{
	switch(type)
	{
	case SVT_NA:				return "na";
	case SVT_BOOL:				return "bool";
	case SVT_INTEGER:			return "integer";
	case SVT_FLOAT:				return "float";
	case SVT_STRING:			return "string";
	case SVT_COLOR:				return "color";
	case SVT_LIST:				return "list";
	case SVT_SERIES:			return "series";
	case SVT_MARKET_SERIES:		return "market series";
	case SVT_DRAW_COMMAND:		return "draw command";
	default:					return "";
	}
}
