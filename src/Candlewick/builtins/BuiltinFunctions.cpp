//project headers:
#include "BuiltinRegistration.h"
#include "FastMath.h"
#include "PrintListener.h"
#include "ScriptError.h"
#include "Series.h"
#include "StringManipulation.h"

//system headers:
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <limits>
#include <memory>

//returns true if value is na or a float that is NaN
static inline bool IsNAValue(const ScriptValue &value)
{
	if(value.IsNA())
		return true;
	return value.GetType() == SVT_FLOAT && FastIsNaN(value.GetFloat());
}

//applies function to value, or to each sample of value if it is a series, producing a series
template<typename Function>
static ScriptValue MapElementwise(const ScriptValue &value, Function function)
{
	if(!value.IsSeries())
		return function(value);

	auto series = value.GetSeries();
	auto result = std::make_shared<ComputedSeries>();
	for(size_t i = 0; i < series->Size(); i++)
		result->Append(function(series->GetSample(i)));
	return ScriptValue(SeriesPtr(result));
}

//applies function to a and b, pairing samples of series by their offset from the most recent sample
//scalars are paired with every sample, and the result is as long as the longer series
template<typename Function>
static ScriptValue MapElementwise(const ScriptValue &a, const ScriptValue &b, Function function)
{
	if(!a.IsSeries() && !b.IsSeries())
		return function(a, b);

	size_t a_size = (a.IsSeries() ? a.GetSeries()->Size() : 0);
	size_t b_size = (b.IsSeries() ? b.GetSeries()->Size() : 0);
	size_t size = std::max(a_size, b_size);

	auto result = std::make_shared<ComputedSeries>();
	for(size_t i = 0; i < size; i++)
	{
		int64_t offset = static_cast<int64_t>(i) - static_cast<int64_t>(size - 1);
		ScriptValue a_sample = (a.IsSeries() ? a.GetSeries()->GetRelative(offset) : a);
		ScriptValue b_sample = (b.IsSeries() ? b.GetSeries()->GetRelative(offset) : b);
		result->Append(function(a_sample, b_sample));
	}
	return ScriptValue(SeriesPtr(result));
}

//throws ScriptArgumentError unless value is a number or na
static void RequireNumber(const ScriptValue &value)
{
	if(!value.IsNumber() && !value.IsNA())
		throw ScriptArgumentError(std::string("number expected, got ") + ScriptValue::GetTypeName(value.GetType()));
}

//returns the result of comparing a and b, keeping integers when both are integers
template<typename Compare>
static ScriptValue SelectNumber(const ScriptValue &a, const ScriptValue &b, Compare compare)
{
	RequireNumber(a);
	RequireNumber(b);
	if(IsNAValue(a) || IsNAValue(b))
		return ScriptValue(std::numeric_limits<double>::quiet_NaN());

	if(a.GetType() == SVT_INTEGER && b.GetType() == SVT_INTEGER)
		return ScriptValue(compare(a.GetInteger(), b.GetInteger()) ? a.GetInteger() : b.GetInteger());

	double a_number = a.GetValueAsNumber();
	double b_number = b.GetValueAsNumber();
	return ScriptValue(compare(a_number, b_number) ? a_number : b_number);
}

//returns the length argument, which must be positive
static size_t GetLengthArgument(const ScriptValue &length)
{
	if(length.GetInteger() <= 0)
		throw ScriptArgumentError("length must be positive");
	return static_cast<size_t>(length.GetInteger());
}

static ScriptValue BuiltinFunction_input(Runtime &, ScriptArguments &args)
{
	return ParseInputArguments(args).defaultValue;
}

//drawing calls do nothing unless an execution mode overlays them
static ScriptValue BuiltinFunction_DrawingNoOp(Runtime &, ScriptArguments &)
{
	return ScriptValue();
}

static ScriptValue BuiltinFunction_study(Runtime &runtime, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 4> study_specs = { {
		{ "title",			AK_STRING,	true },
		{ "shorttitle",		AK_STRING,	false },
		{ "overlay",		AK_BOOL,	false },
		{ "precision",		AK_INTEGER,	false }
	} };

	auto values = ExpandArguments(args, study_specs);
	runtime.SetTitle(values[0].GetString());
	return ScriptValue();
}

static ScriptValue BuiltinFunction_print(Runtime &runtime, ScriptArguments &args)
{
	if(!args.named.empty())
		throw ScriptArgumentError("unexpected argument " + args.named.front().first);

	std::string line;
	for(size_t i = 0; i < args.positional.size(); i++)
	{
		if(i > 0)
			line += " ";
		line += args.positional[i].ToString();
	}
	line += "\n";

	if(runtime.GetPrintListener() != nullptr)
		runtime.GetPrintListener()->LogPrint(line);

	return ScriptValue();
}

static ScriptValue BuiltinFunction_na(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 1> na_specs = { {
		{ "x",	AK_ANY,	false }
	} };

	auto [x] = ExpandArguments(args, na_specs);
	return MapElementwise(x, [](const ScriptValue &v)
		{	return ScriptValue(IsNAValue(v));	});
}

static ScriptValue BuiltinFunction_nz(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 2> nz_specs = { {
		{ "x",			AK_ANY,	false },
		{ "y",			AK_ANY,	false }
	} };

	auto values = ExpandArguments(args, nz_specs);
	const ScriptValue &replacement = values[1];
	return MapElementwise(values[0], [&replacement](const ScriptValue &v)
		{
			if(!IsNAValue(v))
				return v;
			if(!replacement.IsNA())
				return replacement;
			if(v.GetType() == SVT_FLOAT)
				return ScriptValue(0.0);
			return ScriptValue(0);
		});
}

static ScriptValue BuiltinFunction_abs(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 1> abs_specs = { {
		{ "x",	AK_ANY,	true }
	} };

	auto [x] = ExpandArguments(args, abs_specs);
	return MapElementwise(x, [](const ScriptValue &v)
		{
			RequireNumber(v);
			if(v.GetType() == SVT_INTEGER)
			{
				int64_t value = v.GetInteger();
				if(value == std::numeric_limits<int64_t>::min())
					throw ScriptArgumentError("absolute value of " + StringManipulation::NumberToString(value) + " does not fit in an integer");
				return ScriptValue(value < 0 ? -value : value);
			}
			return ScriptValue(std::fabs(v.GetValueAsNumber()));
		});
}

//folds all positional arguments with compare
template<typename Compare>
static ScriptValue FoldNumbers(ScriptArguments &args, Compare compare)
{
	if(!args.named.empty())
		throw ScriptArgumentError("unexpected argument " + args.named.front().first);
	if(args.positional.empty())
		throw ScriptArgumentError("missing argument x");

	ScriptValue result = args.positional[0];
	if(!result.IsSeries())
		RequireNumber(result);

	for(size_t i = 1; i < args.positional.size(); i++)
	{
		result = MapElementwise(result, args.positional[i], [&compare](const ScriptValue &a, const ScriptValue &b)
			{	return SelectNumber(a, b, compare);	});
	}
	return result;
}

static ScriptValue BuiltinFunction_max(Runtime &, ScriptArguments &args)
{
	return FoldNumbers(args, [](auto a, auto b) {	return a >= b;	});
}

static ScriptValue BuiltinFunction_min(Runtime &, ScriptArguments &args)
{
	return FoldNumbers(args, [](auto a, auto b) {	return a <= b;	});
}

//simple moving average; the first length - 1 samples are NaN
static ScriptValue BuiltinFunction_sma(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 2> sma_specs = { {
		{ "source",		AK_SERIES,	true },
		{ "length",		AK_INTEGER,	true }
	} };

	auto [source, length_arg] = ExpandArguments(args, sma_specs);
	size_t length = GetLengthArgument(length_arg);

	auto values = source.GetSeries()->GetSamplesAsNumbers();
	std::vector<double> averages(values.size(), std::numeric_limits<double>::quiet_NaN());
	double window_sum = 0.0;
	for(size_t i = 0; i < values.size(); i++)
	{
		window_sum += values[i];
		if(i >= length)
			window_sum -= values[i - length];
		if(i + 1 >= length)
			averages[i] = window_sum / length;
	}

	//a NaN in the window makes the running sum NaN from then on, so recompute those windows directly
	for(size_t i = length - 1; i < values.size(); i++)
	{
		if(!FastIsNaN(averages[i]))
			continue;

		double sum = 0.0;
		for(size_t j = i + 1 - length; j <= i; j++)
			sum += values[j];
		averages[i] = sum / length;
	}

	return ScriptValue(SeriesPtr(std::make_shared<ComputedSeries>(averages)));
}

//exponential moving average seeded with the simple moving average of the first length samples
static ScriptValue BuiltinFunction_ema(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 2> ema_specs = { {
		{ "source",		AK_SERIES,	true },
		{ "length",		AK_INTEGER,	true }
	} };

	auto [source, length_arg] = ExpandArguments(args, ema_specs);
	size_t length = GetLengthArgument(length_arg);

	auto values = source.GetSeries()->GetSamplesAsNumbers();
	std::vector<double> averages(values.size(), std::numeric_limits<double>::quiet_NaN());
	if(values.size() >= length)
	{
		double seed = 0.0;
		for(size_t i = 0; i < length; i++)
			seed += values[i];
		averages[length - 1] = seed / length;

		double alpha = 2.0 / (length + 1);
		for(size_t i = length; i < values.size(); i++)
			averages[i] = alpha * values[i] + (1 - alpha) * averages[i - 1];
	}

	return ScriptValue(SeriesPtr(std::make_shared<ComputedSeries>(averages)));
}

//returns color with its alpha channel set from transp, a transparency percent
static ScriptValue BuiltinFunction_color__new(Runtime &, ScriptArguments &args)
{
	static const std::array<ArgumentSpec, 2> color_new_specs = { {
		{ "color",		AK_COLOR,	true },
		{ "transp",		AK_FLOAT,	false }
	} };

	auto [color, transp] = ExpandArguments(args, color_new_specs);

	std::string hex = (color.GetType() == SVT_COLOR ? color.GetColor().GetHex() : color.GetString());
	if(hex.size() != 7 && hex.size() != 9)
		throw ScriptArgumentError("invalid color " + hex);
	hex.resize(7);

	double transparency = (transp.IsNA() ? 0.0 : transp.GetFloat());
	if(FastIsNaN(transparency) || transparency < 0 || transparency > 100)
		throw ScriptArgumentError("transp must be between 0 and 100");

	int alpha = static_cast<int>(std::lround(255 * (100 - transparency) / 100));
	char alpha_hex[3];
	std::snprintf(alpha_hex, sizeof(alpha_hex), "%02X", alpha);
	return ScriptValue(ColorToken(hex + alpha_hex));
}

static ScriptValue BuiltinFunction_NotImplemented(Runtime &, ScriptArguments &)
{
	throw ScriptNotImplemented();
}

const std::vector<BuiltinFunctionEntry> &GetBuiltinFunctionTable()
{
	static const std::vector<BuiltinFunctionEntry> builtin_functions = {

		//script declaration
		{ "study",				&BuiltinFunction_study },
		{ "indicator",			&BuiltinFunction_study },

		//inputs and drawing, given their meaning by the execution modes
		{ "input",				&BuiltinFunction_input },
		{ "plot",				&BuiltinFunction_DrawingNoOp },
		{ "hline",				&BuiltinFunction_DrawingNoOp },
		{ "fill",				&BuiltinFunction_DrawingNoOp },

		//output
		{ "print",				&BuiltinFunction_print },

		//values
		{ "na",					&BuiltinFunction_na },
		{ "nz",					&BuiltinFunction_nz },

		//math
		{ "abs",				&BuiltinFunction_abs },
		{ "max",				&BuiltinFunction_max },
		{ "min",				&BuiltinFunction_min },
		{ "math__abs",			&BuiltinFunction_abs },
		{ "math__max",			&BuiltinFunction_max },
		{ "math__min",			&BuiltinFunction_min },

		//moving averages
		{ "sma",				&BuiltinFunction_sma },
		{ "ema",				&BuiltinFunction_ema },
		{ "ta__sma",			&BuiltinFunction_sma },
		{ "ta__ema",			&BuiltinFunction_ema },

		{ "color__new",			&BuiltinFunction_color__new },

		//not implemented
		{ "security",			&BuiltinFunction_NotImplemented },
		{ "alertcondition",		&BuiltinFunction_NotImplemented }
	};

	return builtin_functions;
}
