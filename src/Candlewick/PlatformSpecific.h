#pragma once

//system headers:
#include <cstdlib>
#include <fstream>
#include <string>
#include <utility>

//attempts to open filename
//if successful, returns a string of data from the file and true
//if failure, returns an error message and false
inline std::pair<std::string, bool> Platform_OpenFileAsString(const std::string &filename)
{
	std::ifstream inf(filename, std::ios::in | std::ios::binary);
	std::string data;

	if(!inf.good())
	{
		data = "Error loading file " + filename;
		return std::make_pair(data, false);
	}

	inf.seekg(0, std::ios::end);
	auto file_size = inf.tellg();
	if(file_size > 0)
	{
		data.resize(static_cast<size_t>(file_size));
		inf.seekg(0, std::ios::beg);
		inf.read(&data[0], data.size());
	}
	inf.close();

	return std::make_pair(data, true);
}

//converts the string to a double, and returns true if it was successful, false if not
// strtod is used because std::from_chars for doubles is not available on all supported compilers
inline std::pair<double, bool> Platform_StringToNumber(const std::string &s)
{
	const char *start_pointer = s.c_str();
	char *end_pointer = nullptr;
	double value = strtod(start_pointer, &end_pointer);
	//if didn't reach the end or grabbed nothing, then it's not a number
	if(*end_pointer != '\0' || end_pointer == start_pointer)
		return std::make_pair(0.0, false);
	return std::make_pair(value, true);
}

//Takes a string containing a combined path/filename.extension, and breaks it into each of: path, base_filename, and extension
void Platform_SeparatePathFileExtension(const std::string &combined, std::string &path, std::string &base_filename, std::string &extension);

//returns true if resource is readable given whether must_exist is set.  Returns false if not, and sets error string to the reason
bool Platform_IsResourcePathAccessible(const std::string &resource_path, bool must_exist, std::string &error);
