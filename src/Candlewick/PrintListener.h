#pragma once

//system headers:
#include <fstream>
#include <string>

//receives everything a script prints and every pass failure
class PrintListener
{
public:
	//stores all prints to filename if it is not empty
	//if mirror_to_stdio is true, prints also go to stdout and errors to stderr
	PrintListener(const std::string &filename = std::string(), bool mirror_to_stdio = false);

	~PrintListener();

	//logs output produced by a script
	void LogPrint(const std::string &print_string);

	//logs a failure that aborted an evaluation pass
	void LogError(const std::string &error_string);

	void FlushLogFile();

protected:
	std::ofstream logFile;
	bool mirrorToStdio = false;
};
