#pragma once

//
// Minimal test harness shared by the test drivers
//

//system headers:
#include <functional>
#include <iostream>
#include <string>

class TestResult
{
	std::string test;
	bool successful;

public:
	TestResult(const std::string &test) : test(test), successful(true)
	{}

	operator bool() const
	{
		return successful;
	}

	void Check(const std::string &action, const std::string &actual, const std::string &expected)
	{
		if(actual != expected)
		{
			std::cerr << test << ": " << action << " produced " << actual << " but expected " << expected << std::endl;
			successful = false;
		}
	}

	void Require(const std::string &action, bool actual)
	{
		if(!actual)
		{
			std::cerr << test << ": Failed to " << action << std::endl;
			successful = false;
		}
	}
};

class SuiteResult
{
	bool verbose;
	bool successful;

public:
	SuiteResult(bool verbose) : verbose(verbose), successful(true)
	{}

	operator bool() const
	{
		return successful;
	}

	void Run(const std::string &test, std::function<void(TestResult &)> f)
	{
		TestResult test_result(test);
		if(verbose)
			std::cout << test << std::endl;
		f(test_result);
		successful = successful && test_result;
	}
};

//parses the command line and runs the tests added by add_tests
//returns the process exit code
inline int RunTestSuite(int argc, char *argv[], std::function<void(SuiteResult &)> add_tests)
{
	bool verbose = false;

	for(int i = 1; i < argc; i++)
	{
		if(std::string("--help") == argv[i] || std::string("-h") == argv[i])
		{
			std::cout << "Usage: " << argv[0] << " [-h] [-v]" << std::endl
				<< std::endl
				<< "Options:" << std::endl
				<< "  --help, -h     Print this help message" << std::endl
				<< "  --verbose, -v  Print each test name as it executes" << std::endl;
			return 0;
		}
		else if(std::string("--verbose") == argv[i] || std::string("-v") == argv[i])
		{
			verbose = true;
		}
		else
		{
			std::cerr << argv[0] << ": unrecognized option " << argv[i] << std::endl;
			return 1;
		}
	}

	SuiteResult suite(verbose);
	add_tests(suite);

	return suite ? 0 : 1;
}
