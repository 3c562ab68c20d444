#pragma once

//project headers:
#include "MarketData.h"
#include "ScriptValue.h"

//system headers:
#include <cstdint>
#include <string>
#include <vector>

//ordered, append-only sequence of samples
//samples are addressed either by absolute index, where 0 is the oldest,
// or by a non-positive offset relative to the most recent sample
class Series
{
public:
	virtual ~Series()
	{	}

	virtual size_t Size() const = 0;

	//returns the sample at index, where 0 is the oldest sample
	//the index must be less than Size()
	virtual ScriptValue GetSample(size_t index) const = 0;

	//returns the sample at offset relative to the most recent sample, where 0 is the most recent
	// and -1 is the one before it
	//offsets beyond the available history, and positive offsets, yield na
	ScriptValue GetRelative(int64_t offset) const;

	//returns the most recent sample, na if the series is empty
	inline ScriptValue GetCurrent() const
	{
		return GetRelative(0);
	}

	//returns the samples converted to numbers, oldest first; samples that are not numbers become NaN
	std::vector<double> GetSamplesAsNumbers() const;
};

//series of values computed by the script or by builtins
class ComputedSeries : public Series
{
public:
	ComputedSeries()
	{	}

	ComputedSeries(std::vector<ScriptValue> _samples)
		: samples(std::move(_samples))
	{	}

	//builds a series of floats from values, oldest first
	ComputedSeries(const std::vector<double> &values);

	inline void Append(ScriptValue value)
	{
		samples.emplace_back(std::move(value));
	}

	virtual size_t Size() const override
	{
		return samples.size();
	}

	virtual ScriptValue GetSample(size_t index) const override
	{
		return samples[index];
	}

protected:
	std::vector<ScriptValue> samples;
};

//series bound to one field of the bars of a market context, carrying its symbolic name
//the market context must outlive the series
class MarketSeries : public Series
{
public:
	MarketSeries(const MarketData *_market, MarketField _field)
		: market(_market), field(_field)
	{	}

	virtual size_t Size() const override;

	virtual ScriptValue GetSample(size_t index) const override;

	//symbolic name of the bound field, e.g., "close"
	inline std::string GetName() const
	{
		return MarketData::GetFieldName(field);
	}

	inline MarketField GetField() const
	{
		return field;
	}

protected:
	const MarketData *market;
	MarketField field;
};
