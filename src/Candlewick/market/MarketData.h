#pragma once

//system headers:
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//one bar of market data
struct MarketBar
{
	//number of seconds since the epoch (January 1, 1970 UTC) at the open of the bar
	int64_t time;
	double open;
	double high;
	double low;
	double close;
	double volume;
};

//fields of a bar that can be bound to a market series, including the derived price channels
enum MarketField : uint8_t
{
	MF_OPEN,
	MF_HIGH,
	MF_LOW,
	MF_CLOSE,
	MF_VOLUME,
	MF_HL2,
	MF_HLC3,
	MF_OHLC4,

	MF_NUM_FIELDS
};

//market context a script is evaluated against
//the runtime never calls into it; it is handed through to builtin variables and functions
class MarketData
{
public:
	MarketData(std::string symbol = std::string(), std::string timeframe = std::string());

	//bars must be appended oldest first
	void AppendBar(const MarketBar &bar);

	inline size_t GetNumBars() const
	{
		return bars.size();
	}

	inline const MarketBar &GetBar(size_t index) const
	{
		return bars[index];
	}

	//returns the value of field for the bar at index
	double GetFieldValue(size_t index, MarketField field) const;

	inline const std::string &GetSymbol() const
	{
		return symbol;
	}

	inline const std::string &GetTimeframe() const
	{
		return timeframe;
	}

	//returns the name scripts use for field, e.g., "close"
	static const char *GetFieldName(MarketField field);

	//returns the field for the name and true if found, MF_NUM_FIELDS and false if not
	static std::pair<MarketField, bool> GetFieldFromName(std::string_view name);

protected:
	std::string symbol;
	std::string timeframe;
	std::vector<MarketBar> bars;
};
