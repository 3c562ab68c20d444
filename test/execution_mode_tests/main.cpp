//
// Tests for input scanning, rendering, the pass facade and input value files
//

//project headers:
#include "Candlewick.h"
#include "FileSupportJSON.h"
#include "FileSupportYAML.h"
#include "InputScanner.h"
#include "InputValuesFile.h"
#include "MarketData.h"
#include "PrintListener.h"
#include "ScriptError.h"
#include "ScriptNodes.h"
#include "ScriptRenderer.h"
#include "Series.h"
#include "TestSuite.h"

//system headers:
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using NamedNodes = std::vector<std::pair<std::string, ScriptNodePtr>>;

static ScriptNodePtr Literal(ScriptValue value)
{
	return std::make_shared<LiteralNode>(std::move(value));
}

static ScriptNodePtr Identifier(const std::string &name)
{
	return std::make_shared<IdentifierNode>(name);
}

static ScriptNodePtr CallNode(const std::string &name, std::vector<ScriptNodePtr> positional, NamedNodes named = NamedNodes())
{
	return std::make_shared<FunctionCallNode>(name, std::move(positional), std::move(named));
}

static ScriptNodePtr Define(const std::string &name, ScriptNodePtr value)
{
	return std::make_shared<VariableDefinitionNode>(name, std::move(value));
}

static ScriptNodePtr Script(std::vector<ScriptNodePtr> statements)
{
	return std::make_shared<BlockNode>(std::move(statements));
}

//five hourly bars closing at 10, 11, 12, 13 and 14
static MarketData MakeMarket()
{
	MarketData market("BTCUSD", "60");
	for(int i = 0; i < 5; i++)
	{
		double close = 10.0 + i;
		market.AppendBar(MarketBar{ 1609632000 + i * 3600, close - 0.5, close + 1, close - 1, close, 100.0 });
	}
	return market;
}

static std::string ReadFile(const std::string &filename)
{
	std::ifstream file(filename);
	std::stringstream contents;
	contents << file.rdbuf();
	return contents.str();
}

static void ScanAssignsSequentialTitles(TestResult &test_result)
{
	MarketData market = MakeMarket();
	InputScanner scanner(&market);
	scanner.Run(*Script({
		Define("length", CallNode("input", { Literal(ScriptValue(5)) })),
		Define("show", CallNode("input", { Literal(ScriptValue(true)) }))
	}));

	auto &inputs = scanner.GetInputs();
	test_result.Require("two inputs declared", inputs.size() == 2);
	if(!test_result)
		return;

	test_result.Check("first title", inputs[0].title, "input1");
	test_result.Check("second title", inputs[1].title, "input2");
	test_result.Check("integer type inferred", inputs[0].type, "integer");
	test_result.Check("bool type inferred", inputs[1].type, "bool");
	test_result.Check("default recorded", inputs[0].defaultValue.ToString(), "5");
	test_result.Require("unset bounds are na", inputs[0].minValue.IsNA() && inputs[0].maxValue.IsNA() && inputs[0].options.IsNA());
}

static void ScanRecordsSourceByName(TestResult &test_result)
{
	MarketData market = MakeMarket();
	InputScanner scanner(&market);
	ScriptValue result = scanner.Run(*Script({
		Define("src", CallNode("input", { Identifier("close") })),
		Identifier("src")
	}));

	auto &inputs = scanner.GetInputs();
	test_result.Require("one input declared", inputs.size() == 1);
	if(!test_result)
		return;

	test_result.Check("source type inferred", inputs[0].type, "source");
	test_result.Require("source default is recorded as a name", inputs[0].defaultValue.GetType() == SVT_STRING);
	test_result.Check("source default name", inputs[0].defaultValue.ToString(), "close");
	test_result.Require("the live series is returned to the script", result.GetType() == SVT_MARKET_SERIES);
}

static void ScanRecordsExplicitArguments(TestResult &test_result)
{
	InputScanner scanner;
	ScriptValue result = scanner.Run(*Script({
		CallNode("input", {}, {
			{ "defval", Literal(ScriptValue(1.5)) },
			{ "title", Literal(ScriptValue("Factor")) },
			{ "minval", Literal(ScriptValue(0.5)) },
			{ "options", Literal(ScriptValue(ScriptValueList{ ScriptValue(1.5), ScriptValue(2.5) })) }
		}),
		CallNode("input", { Literal(ScriptValue("D")), Literal(ScriptValue("Resolution")), Identifier("input.resolution") })
	}));

	auto &inputs = scanner.GetInputs();
	test_result.Require("two inputs declared", inputs.size() == 2);
	if(!test_result)
		return;

	test_result.Check("explicit title", inputs[0].title, "Factor");
	test_result.Check("float type inferred", inputs[0].type, "float");
	test_result.Require("minval recorded", inputs[0].minValue.GetFloat() == 0.5);
	test_result.Check("options recorded", inputs[0].options.ToString(), "[1.5, 2.5]");
	test_result.Check("explicit type", inputs[1].type, "resolution");
	test_result.Check("default returned", result.ToString(), "D");
}

static void ScanTreatsDrawingAsNoOps(TestResult &test_result)
{
	MarketData market = MakeMarket();
	InputScanner scanner(&market);
	ScriptValue result = scanner.Run(*Script({
		Define("p", CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("Close")) } })),
		CallNode("hline", { Literal(ScriptValue(100)) }),
		CallNode("fill", { Identifier("p"), Identifier("p") }),
		CallNode("input", { Literal(ScriptValue(3)) })
	}));

	test_result.Require("scan completes", scanner.GetInputs().size() == 1);
	test_result.Check("input still returns its default", result.ToString(), "3");
}

static void RoundTripDefaults(TestResult &test_result)
{
	MarketData market = MakeMarket();
	std::vector<ScriptValue> defaults = { ScriptValue(5), ScriptValue(2.5), ScriptValue(false), ScriptValue("BTCUSD") };

	for(auto &default_value : defaults)
	{
		auto script = Script({
			Define("value", CallNode("input", { Literal(default_value) })),
			Identifier("value")
		});

		InputScanResult scanned = ScanScriptInputs(*script, &market);
		test_result.Require("scan succeeds", scanned.success);

		RenderResult rendered = RenderScript(*script, &market, GetDefaultInputValues(scanned.inputs));
		test_result.Require("render succeeds", rendered.success);
		test_result.Require(std::string("reproduce the ") + ScriptValue::GetTypeName(default_value.GetType()) + " default",
			ScriptValue::AreEqual(rendered.returnValue, default_value));
	}
}

//renders a script made of the single input call, with stored holding the value for input1 or title
static ScriptValue RenderSingleInput(MarketData &market, const std::string &title, ScriptValue stored, ScriptNodePtr input_call)
{
	InputValues values;
	values[title] = std::move(stored);

	ScriptRenderer renderer(&market, std::move(values));
	return renderer.Run(*Script({ std::move(input_call) }));
}

static void RenderCoercesStoredValues(TestResult &test_result)
{
	MarketData market = MakeMarket();

	ScriptValue length = RenderSingleInput(market, "input1", ScriptValue(3.7),
		CallNode("input", { Literal(ScriptValue(10)) }));
	test_result.Require("float stored for an integer input is truncated", length.GetType() == SVT_INTEGER && length.GetInteger() == 3);

	ScriptValue flag = RenderSingleInput(market, "input1", ScriptValue("true"),
		CallNode("input", { Literal(ScriptValue(false)) }));
	test_result.Require("string stored for a bool input is parsed", flag.GetType() == SVT_BOOL && flag.GetBool());

	ScriptValue src = RenderSingleInput(market, "input1", ScriptValue("open"),
		CallNode("input", { Identifier("close") }));
	test_result.Require("source input looks up the stored name", src.GetType() == SVT_MARKET_SERIES);
	if(src.GetType() == SVT_MARKET_SERIES)
		test_result.Check("source input series", src.GetMarketSeries()->GetName(), "open");

	ScriptValue ratio = RenderSingleInput(market, "Ratio", ScriptValue(2),
		CallNode("input", { Literal(ScriptValue(1.0)) }, { { "title", Literal(ScriptValue("Ratio")) } }));
	test_result.Require("integer stored for a float input is converted", ratio.GetType() == SVT_FLOAT && ratio.GetFloat() == 2.0);

	ScriptValue text = RenderSingleInput(market, "input1", ScriptValue("ETHUSD"),
		CallNode("input", { Literal(ScriptValue("BTCUSD")), Literal(ScriptValue("")), Identifier("input.symbol") }));
	test_result.Check("symbol input is used as stored", text.ToString(), "ETHUSD");

	bool thrown = false;
	try
	{
		RenderSingleInput(market, "input1", ScriptValue("maybe"), CallNode("input", { Literal(ScriptValue(false)) }));
	}
	catch(ScriptError &e)
	{
		thrown = true;
		test_result.Check("unconvertible stored value", ScriptError::GetTypeName(e.GetType()), "ArgumentShapeError");
	}
	test_result.Require("unconvertible stored value throws", thrown);
}

static void RenderRejectsUnknownInputs(TestResult &test_result)
{
	ScriptRenderer renderer(nullptr, InputValues());
	bool thrown = false;
	try
	{
		renderer.Run(*Script({ CallNode("input", { Literal(ScriptValue(1)) }) }));
	}
	catch(ScriptError &e)
	{
		thrown = true;
		test_result.Check("error type", ScriptError::GetTypeName(e.GetType()), "UnknownInput");
		test_result.Check("error names the input", e.GetName(), "input1");
	}
	test_result.Require("missing stored value throws", thrown);
}

static DrawCommandPtr RenderSinglePlot(MarketData &market, NamedNodes named)
{
	ScriptRenderer renderer(&market, InputValues());
	renderer.Run(*Script({ CallNode("plot", { Identifier("close") }, std::move(named)) }));
	return renderer.GetDrawCommands().front();
}

static void PlotTransparencyAndStyle(TestResult &test_result)
{
	MarketData market = MakeMarket();

	auto transparent = RenderSinglePlot(market, { { "title", Literal(ScriptValue("a")) }, { "transp", Literal(ScriptValue(25)) } });
	test_result.Require("transp 25 gives opacity 0.25", transparent->opacity.has_value() && *transparent->opacity == 0.25);

	auto opaque = RenderSinglePlot(market, { { "title", Literal(ScriptValue("b")) } });
	test_result.Require("omitted transp leaves opacity unset", !opaque->opacity.has_value());

	auto zero_transp = RenderSinglePlot(market, { { "title", Literal(ScriptValue("z")) }, { "transp", Literal(ScriptValue(0)) },
		{ "linewidth", Literal(ScriptValue(0)) } });
	test_result.Require("transp 0 leaves opacity unset", !zero_transp->opacity.has_value());
	test_result.Require("linewidth 0 leaves width unset", !zero_transp->width.has_value());

	auto fully_transparent = RenderSinglePlot(market, { { "title", Literal(ScriptValue("f")) }, { "transp", Literal(ScriptValue(100)) } });
	test_result.Require("transp 100 gives opacity 1", fully_transparent->opacity.has_value() && *fully_transparent->opacity == 1.0);
	test_result.Check("default style is a line", DrawCommand::GetTypeName(opaque->type), "line");
	test_result.Check("title", opaque->title.value_or(""), "b");

	std::vector<std::pair<std::string, std::string>> styles = {
		{ "line", "line" }, { "stepline", "line" }, { "histogram", "bar" }, { "cross", "marker" },
		{ "area", "band" }, { "columns", "bar" }, { "circles", "marker" }
	};
	for(auto &[style, type] : styles)
	{
		auto styled = RenderSinglePlot(market, { { "title", Literal(ScriptValue(style)) }, { "style", Identifier(style) } });
		test_result.Check("style " + style, DrawCommand::GetTypeName(styled->type), type);
	}

	auto cross = RenderSinglePlot(market, { { "title", Literal(ScriptValue("c")) }, { "style", Identifier("plot.style_cross") } });
	test_result.Require("cross mark", cross->mark == '+');
	auto circles = RenderSinglePlot(market, { { "title", Literal(ScriptValue("o")) }, { "style", Identifier("circles") } });
	test_result.Require("circle mark", circles->mark == 'o');

	auto wide = RenderSinglePlot(market, { { "title", Literal(ScriptValue("w")) }, { "linewidth", Literal(ScriptValue(3)) } });
	test_result.Require("width", wide->width.value_or(0) == 3);
}

static void PlotResolvesSeriesColor(TestResult &test_result)
{
	MarketData market = MakeMarket();
	SeriesPtr colors = std::make_shared<ComputedSeries>(std::vector<ScriptValue>{
		ScriptValue(ColorToken("#000000")), ScriptValue(ColorToken("#FFFFFF")) });

	auto colored = RenderSinglePlot(market, { { "title", Literal(ScriptValue("c")) }, { "color", Literal(ScriptValue(colors)) } });
	test_result.Check("series color resolves to its most recent sample", colored->color.ToString(), "#FFFFFF");
}

static void PlotReportsArgumentErrors(TestResult &test_result)
{
	MarketData market = MakeMarket();
	std::vector<ScriptNodePtr> bad_calls = {
		CallNode("plot", { Literal(ScriptValue(5)) }, { { "title", Literal(ScriptValue("x")) } }),
		CallNode("plot", { Identifier("close") }),
		CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("x")) }, { "bogus", Literal(ScriptValue(1)) } }),
		CallNode("fill", { Identifier("close"), Identifier("close") }),
		CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("x")) }, { "transp", Literal(ScriptValue(150)) } }),
		CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("x")) }, { "transp", Literal(ScriptValue(-1)) } })
	};

	for(auto &bad_call : bad_calls)
	{
		RenderResult result = RenderScript(*Script({ bad_call }), &market, InputValues(), nullptr);
		test_result.Require("bad drawing call fails the pass", !result.success);
		test_result.Require("no partial draw commands", result.drawCommands.empty());
		bool names_call = (result.message.size() > 6 && result.message.substr(result.message.size() - 6) == ": plot")
			|| (result.message.size() > 6 && result.message.substr(result.message.size() - 6) == ": fill");
		test_result.Require("error names the call: " + result.message, names_call);
	}

	RenderResult out_of_range_fill = RenderScript(*Script({
		Define("p", CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("p")) } })),
		CallNode("fill", { Identifier("p"), Identifier("p") }, { { "transp", Literal(ScriptValue(101)) } })
	}), &market, InputValues(), nullptr);
	test_result.Check("fill transp out of range", out_of_range_fill.message, "transp must be between 0 and 100: fill");
}

static void FillReferencesBothPlots(TestResult &test_result)
{
	MarketData market = MakeMarket();
	ScriptRenderer renderer(&market, InputValues());
	renderer.Run(*Script({
		Define("p1", CallNode("plot", { Identifier("high") }, { { "title", Literal(ScriptValue("High")) } })),
		Define("p2", CallNode("plot", { Identifier("low") }, { { "title", Literal(ScriptValue("Low")) } })),
		CallNode("fill", { Identifier("p1"), Identifier("p2") }, { { "transp", Literal(ScriptValue(90)) } })
	}));

	auto &commands = renderer.GetDrawCommands();
	test_result.Require("three commands", commands.size() == 3);
	if(!test_result)
		return;

	test_result.Check("fill is appended after both plots", DrawCommand::GetTypeName(commands[2]->type), "fill");
	test_result.Require("fill references the first series", commands[2]->series.GetSeries() == commands[0]->series.GetSeries());
	test_result.Require("fill references the second series", commands[2]->series2.GetSeries() == commands[1]->series.GetSeries());
	test_result.Require("fill opacity", commands[2]->opacity.value_or(0) == 0.9);
}

static void HorizontalLineCommand(TestResult &test_result)
{
	ScriptRenderer renderer(nullptr, InputValues());
	ScriptValue result = renderer.Run(*Script({
		CallNode("hline", { Literal(ScriptValue(100)) }, {
			{ "title", Literal(ScriptValue("Zero")) },
			{ "color", Identifier("color.gray") },
			{ "linewidth", Literal(ScriptValue(2)) }
		})
	}));

	test_result.Require("hline returns its command", result.GetType() == SVT_DRAW_COMMAND);
	auto &commands = renderer.GetDrawCommands();
	test_result.Require("one command", commands.size() == 1);
	if(!test_result)
		return;

	test_result.Check("type", DrawCommand::GetTypeName(commands[0]->type), "horizontal-line");
	test_result.Require("price converted to float", commands[0]->series.GetType() == SVT_FLOAT && commands[0]->series.GetFloat() == 100.0);
	test_result.Check("color", commands[0]->color.ToString(), "#787B86");
	test_result.Require("width", commands[0]->width.value_or(0) == 2);
}

static void HorizontalLineOmitsZeroWidthAndEmptyColor(TestResult &test_result)
{
	ScriptRenderer renderer(nullptr, InputValues());
	renderer.Run(*Script({
		CallNode("hline", { Literal(ScriptValue(0)) }, {
			{ "color", Literal(ScriptValue("")) },
			{ "linewidth", Literal(ScriptValue(0)) }
		})
	}));

	auto &commands = renderer.GetDrawCommands();
	test_result.Require("one command", commands.size() == 1);
	if(!test_result)
		return;

	test_result.Require("empty color is unset", commands[0]->color.IsNA());
	test_result.Require("zero width is unset", !commands[0]->width.has_value());
	test_result.Require("untitled", !commands[0]->title.has_value());
}

static void FacadeReportsFailures(TestResult &test_result)
{
	const std::string log_filename = "execution_mode_tests_errors.log";
	{
		PrintListener print_listener(log_filename);
		InputScanResult scanned = ScanScriptInputs(*Script({ Identifier("undefined_name") }), nullptr, &print_listener);
		test_result.Require("scan fails", !scanned.success);
		test_result.Check("scan message", scanned.message, "variable not found: undefined_name");
		print_listener.FlushLogFile();
	}
	test_result.Check("failure logged", ReadFile(log_filename), "Error: variable not found: undefined_name\n");

	MarketData market = MakeMarket();
	auto script = Script({
		CallNode("study", {}, { { "title", Literal(ScriptValue("Bands")) } }),
		CallNode("plot", { Identifier("close") }, { { "title", Literal(ScriptValue("Close")) } })
	});
	RenderResult rendered = RenderScript(*script, &market, InputValues());
	test_result.Require("render succeeds", rendered.success);
	test_result.Check("title", rendered.title, "Bands");
	test_result.Require("one draw command", rendered.drawCommands.size() == 1);

	InputScanResult partial = ScanScriptInputs(*Script({
		CallNode("input", { Literal(ScriptValue(5)) }),
		Identifier("undefined_name")
	}), &market);
	test_result.Require("scan fails after declaring an input", !partial.success);
	test_result.Require("failed scan returns no inputs", partial.inputs.empty());

	InputScanResult untitled = ScanScriptInputs(*Script({}), &market);
	test_result.Check("default title", untitled.title, "No Title");
}

static void DescriptorsAndCommandsToJson(TestResult &test_result)
{
	InputScanner scanner;
	scanner.Run(*Script({ CallNode("input", { Literal(ScriptValue(5)) }) }));

	auto [descriptors_json, descriptors_converted] = ScriptValueJSONTranslation::InputDescriptorsToJson(scanner.GetInputs());
	test_result.Require("descriptors convert", descriptors_converted);
	test_result.Check("descriptors json", descriptors_json,
		"[{\"defval\":5,\"title\":\"input1\",\"type\":\"integer\",\"minval\":null,\"maxval\":null,\"options\":null}]");

	auto [sorted_json, sorted_converted] = ScriptValueJSONTranslation::InputDescriptorsToJson(scanner.GetInputs(), true);
	test_result.Check("sorted descriptors json", sorted_json,
		"[{\"defval\":5,\"maxval\":null,\"minval\":null,\"options\":null,\"title\":\"input1\",\"type\":\"integer\"}]");

	MarketData market = MakeMarket();
	ScriptRenderer renderer(&market, InputValues());
	renderer.Run(*Script({
		CallNode("plot", { Identifier("bar_index") }, { { "title", Literal(ScriptValue("Index")) }, { "transp", Literal(ScriptValue(25)) } })
	}));

	auto [commands_json, commands_converted] = ScriptValueJSONTranslation::DrawCommandsToJson(renderer.GetDrawCommands());
	test_result.Require("commands convert", commands_converted);
	test_result.Check("commands json", commands_json,
		"[{\"type\":\"line\",\"title\":\"Index\",\"series\":[0,1,2,3,4],\"opacity\":0.25}]");
}

static void InputValuesFromJson(TestResult &test_result)
{
	auto [values, success] = ScriptValueJSONTranslation::JsonToInputValues(
		"{\"input1\": 5, \"Factor\": 1.5, \"Show\": true, \"Source\": \"close\", \"Levels\": [1, 2], \"Unset\": null}");
	test_result.Require("json parses", success);
	if(!test_result)
		return;

	test_result.Require("integer stays integer", values["input1"].GetType() == SVT_INTEGER && values["input1"].GetInteger() == 5);
	test_result.Require("float", values["Factor"].GetType() == SVT_FLOAT && values["Factor"].GetFloat() == 1.5);
	test_result.Require("bool", values["Show"].GetType() == SVT_BOOL && values["Show"].GetBool());
	test_result.Check("string", values["Source"].ToString(), "close");
	test_result.Check("list", values["Levels"].ToString(), "[1, 2]");
	test_result.Require("null is na", values["Unset"].IsNA());

	auto [bad_values, bad_success] = ScriptValueJSONTranslation::JsonToInputValues("[1, 2]");
	test_result.Require("top level array is rejected", !bad_success);

	auto [nested_values, nested_success] = ScriptValueJSONTranslation::JsonToInputValues("{\"a\": {\"b\": 1}}");
	test_result.Require("nested object is rejected", !nested_success);
}

static void InputValuesFromYaml(TestResult &test_result)
{
	std::string yaml = "input1: 5\nFactor: 1.5\nShow: true\nSource: close\nQuoted: \"7\"\nLevels:\n  - 1\n  - 2\n";
	auto [values, success] = ScriptValueYAMLTranslation::YamlToInputValues(yaml);
	test_result.Require("yaml parses", success);
	if(!test_result)
		return;

	test_result.Require("integer", values["input1"].GetType() == SVT_INTEGER && values["input1"].GetInteger() == 5);
	test_result.Require("float", values["Factor"].GetType() == SVT_FLOAT && values["Factor"].GetFloat() == 1.5);
	test_result.Require("bool", values["Show"].GetType() == SVT_BOOL && values["Show"].GetBool());
	test_result.Check("string", values["Source"].ToString(), "close");
	test_result.Require("quoted number stays a string", values["Quoted"].GetType() == SVT_STRING);
	test_result.Check("sequence", values["Levels"].ToString(), "[1, 2]");
}

static void InputValuesFiles(TestResult &test_result)
{
	InputValues values;
	values["input1"] = ScriptValue(5);
	values["Factor"] = ScriptValue(1.5);
	values["Source"] = ScriptValue("close");

	for(std::string filename : { "execution_mode_tests_inputs.json", "execution_mode_tests_inputs.yaml" })
	{
		test_result.Require("store " + filename, StoreInputValues(values, filename, true));

		auto [loaded, loaded_success] = LoadInputValues(filename);
		test_result.Require("load " + filename, loaded_success);
		if(!loaded_success)
			continue;

		test_result.Require("same number of values from " + filename, loaded.size() == values.size());
		for(auto &[title, value] : values)
			test_result.Require("reload " + title + " from " + filename, ScriptValue::AreEqual(loaded[title], value));
	}

	test_result.Require("unsupported file type", !StoreInputValues(values, "execution_mode_tests_inputs.txt"));
	test_result.Require("json into a missing directory", !StoreInputValues(values, "no_such_directory/inputs.json"));
	test_result.Require("yaml into a missing directory", !StoreInputValues(values, "no_such_directory/inputs.yaml"));
	test_result.Require("descriptors into a missing directory",
		!ScriptValueJSONTranslation::StoreInputDescriptors(std::vector<InputDescriptor>(), "no_such_directory/descriptors.json", false));
	auto [missing, missing_success] = LoadInputValues("does_not_exist.json");
	test_result.Require("missing file", !missing_success);

	InputScanner scanner;
	scanner.Run(*Script({ CallNode("input", { Literal(ScriptValue(5)) }) }));
	const std::string descriptors_filename = "execution_mode_tests_descriptors.json";
	test_result.Require("store descriptors",
		ScriptValueJSONTranslation::StoreInputDescriptors(scanner.GetInputs(), descriptors_filename, false));
	test_result.Check("stored descriptors", ReadFile(descriptors_filename),
		"[{\"defval\":5,\"title\":\"input1\",\"type\":\"integer\",\"minval\":null,\"maxval\":null,\"options\":null}]");
}

int main(int argc, char *argv[])
{
	return RunTestSuite(argc, argv, [](SuiteResult &suite)
		{
			suite.Run("ScanAssignsSequentialTitles", ScanAssignsSequentialTitles);
			suite.Run("ScanRecordsSourceByName", ScanRecordsSourceByName);
			suite.Run("ScanRecordsExplicitArguments", ScanRecordsExplicitArguments);
			suite.Run("ScanTreatsDrawingAsNoOps", ScanTreatsDrawingAsNoOps);
			suite.Run("RoundTripDefaults", RoundTripDefaults);
			suite.Run("RenderCoercesStoredValues", RenderCoercesStoredValues);
			suite.Run("RenderRejectsUnknownInputs", RenderRejectsUnknownInputs);
			suite.Run("PlotTransparencyAndStyle", PlotTransparencyAndStyle);
			suite.Run("PlotResolvesSeriesColor", PlotResolvesSeriesColor);
			suite.Run("PlotReportsArgumentErrors", PlotReportsArgumentErrors);
			suite.Run("FillReferencesBothPlots", FillReferencesBothPlots);
			suite.Run("HorizontalLineCommand", HorizontalLineCommand);
			suite.Run("HorizontalLineOmitsZeroWidthAndEmptyColor", HorizontalLineOmitsZeroWidthAndEmptyColor);
			suite.Run("FacadeReportsFailures", FacadeReportsFailures);
			suite.Run("DescriptorsAndCommandsToJson", DescriptorsAndCommandsToJson);
			suite.Run("InputValuesFromJson", InputValuesFromJson);
			suite.Run("InputValuesFromYaml", InputValuesFromYaml);
			suite.Run("InputValuesFiles", InputValuesFiles);
		});
}
