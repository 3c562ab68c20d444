#pragma once

//project headers:
#include "InputDescriptor.h"

//system headers:
#include <string>
#include <utility>

//file types for stored input values
constexpr const char *FILE_EXTENSION_JSON = "json";
constexpr const char *FILE_EXTENSION_YAML = "yaml";
constexpr const char *FILE_EXTENSION_YML = "yml";

//loads stored input values from resource_path, choosing the format from the file extension
//returns the values and true on success, empty values and false on failure
std::pair<InputValues, bool> LoadInputValues(const std::string &resource_path);

//stores input values to resource_path, choosing the format from the file extension
bool StoreInputValues(const InputValues &values, const std::string &resource_path, bool sort_keys = false);
