//project headers:
#include "MarketData.h"

//system headers:
#include <array>
#include <limits>

static const std::array<const char *, MF_NUM_FIELDS> _market_field_names = {
	"open",			// MF_OPEN
	"high",			// MF_HIGH
	"low",			// MF_LOW
	"close",		// MF_CLOSE
	"volume",		// MF_VOLUME
	"hl2",			// MF_HL2
	"hlc3",			// MF_HLC3
	"ohlc4"			// MF_OHLC4
};

MarketData::MarketData(std::string symbol, std::string timeframe)
	: symbol(std::move(symbol)), timeframe(std::move(timeframe))
{	}

void MarketData::AppendBar(const MarketBar &bar)
{
	bars.push_back(bar);
}

double MarketData::GetFieldValue(size_t index, MarketField field) const
{
	if(index >= bars.size())
		return std::numeric_limits<double>::quiet_NaN();

	const auto &bar = bars[index];
	switch(field)
	{
	case MF_OPEN:	return bar.open;
	case MF_HIGH:	return bar.high;
	case MF_LOW:	return bar.low;
	case MF_CLOSE:	return bar.close;
	case MF_VOLUME:	return bar.volume;
	case MF_HL2:	return (bar.high + bar.low) / 2;
	case MF_HLC3:	return (bar.high + bar.low + bar.close) / 3;
	case MF_OHLC4:	return (bar.open + bar.high + bar.low + bar.close) / 4;
	default:		return std::numeric_limits<double>::quiet_NaN();
	}
}

const char *MarketData::GetFieldName(MarketField field)
{
	if(field >= MF_NUM_FIELDS)
		return "";
	return _market_field_names[field];
}

std::pair<MarketField, bool> MarketData::GetFieldFromName(std::string_view name)
{
	for(size_t i = 0; i < _market_field_names.size(); i++)
	{
		if(name == _market_field_names[i])
			return std::make_pair(static_cast<MarketField>(i), true);
	}
	return std::make_pair(MF_NUM_FIELDS, false);
}
