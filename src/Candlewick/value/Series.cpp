//project headers:
#include "Series.h"

//system headers:
#include <limits>

ScriptValue Series::GetRelative(int64_t offset) const
{
	if(offset > 0)
		return ScriptValue();

	size_t num_samples = Size();
	size_t back = static_cast<size_t>(-offset);
	if(back >= num_samples)
		return ScriptValue();

	return GetSample(num_samples - 1 - back);
}

std::vector<double> Series::GetSamplesAsNumbers() const
{
	size_t num_samples = Size();
	std::vector<double> numbers;
	numbers.reserve(num_samples);
	for(size_t i = 0; i < num_samples; i++)
		numbers.push_back(GetSample(i).GetValueAsNumber());
	return numbers;
}

ComputedSeries::ComputedSeries(const std::vector<double> &values)
{
	samples.reserve(values.size());
	for(double v : values)
		samples.emplace_back(v);
}

size_t MarketSeries::Size() const
{
	if(market == nullptr)
		return 0;
	return market->GetNumBars();
}

ScriptValue MarketSeries::GetSample(size_t index) const
{
	if(market == nullptr)
		return ScriptValue();
	return ScriptValue(market->GetFieldValue(index, field));
}
