//project headers:
#include "InputValuesFile.h"

#include "FileSupportJSON.h"
#include "FileSupportYAML.h"
#include "PlatformSpecific.h"
#include "StringManipulation.h"

//system headers:
#include <iostream>

//returns the lower case extension of resource_path
static std::string GetFileType(const std::string &resource_path)
{
	std::string path, file_base, extension;
	Platform_SeparatePathFileExtension(resource_path, path, file_base, extension);
	return StringManipulation::ToLowerAscii(extension);
}

std::pair<InputValues, bool> LoadInputValues(const std::string &resource_path)
{
	std::string file_type = GetFileType(resource_path);

	if(file_type == FILE_EXTENSION_JSON)
		return ScriptValueJSONTranslation::Load(resource_path);

	if(file_type == FILE_EXTENSION_YAML || file_type == FILE_EXTENSION_YML)
		return ScriptValueYAMLTranslation::Load(resource_path);

	std::cerr << "Error loading input values: unsupported file type " << file_type << std::endl;
	return std::make_pair(InputValues(), false);
}

bool StoreInputValues(const InputValues &values, const std::string &resource_path, bool sort_keys)
{
	std::string file_type = GetFileType(resource_path);

	if(file_type == FILE_EXTENSION_JSON)
		return ScriptValueJSONTranslation::Store(values, resource_path, sort_keys);

	if(file_type == FILE_EXTENSION_YAML || file_type == FILE_EXTENSION_YML)
		return ScriptValueYAMLTranslation::Store(values, resource_path, sort_keys);

	std::cerr << "Error storing input values: unsupported file type " << file_type << std::endl;
	return false;
}
