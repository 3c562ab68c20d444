//project headers:
#include "PlatformSpecific.h"

//system headers:
#include <algorithm>
#include <cerrno>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>

void Platform_SeparatePathFileExtension(const std::string &combined, std::string &path, std::string &base_filename, std::string &extension)
{
	if(combined.size() == 0)
		return;

	//get path
	path = combined;
	size_t first_forward_slash = path.rfind('/');
	size_t first_backslash = path.rfind('\\');
	size_t first_slash;

	if(first_forward_slash == std::string::npos && first_backslash == std::string::npos)
		first_slash = 0;
	else if(first_forward_slash != std::string::npos && first_backslash == std::string::npos)
		first_slash = first_forward_slash;
	else if(first_forward_slash == std::string::npos && first_backslash != std::string::npos)
		first_slash = first_backslash;
	else //grab whichever one is closer to the end of the string
		first_slash = std::max(first_forward_slash, first_backslash);

	if(first_slash == 0)
		path = std::string("./");
	else
	{
		first_slash++;  //keep the slash in the path
		path = combined.substr(0, first_slash);
	}

	//get extension
	std::string filename = combined.substr(first_slash, combined.size() - first_slash);
	size_t extension_position = filename.rfind('.');
	if(extension_position != std::string::npos)
	{
		base_filename = filename.substr(0, extension_position);
		extension = filename.substr(extension_position + 1); //get rid of .
	}
	else
	{
		base_filename = filename;
		extension = "";
	}
}

bool Platform_IsResourcePathAccessible(const std::string &resource_path, bool must_exist, std::string &error)
{
	struct stat file_status;
	errno = 0;
	if(stat(resource_path.c_str(), &file_status) == -1) // == 0 ok; == -1 error
	{
		//a file that will be created is fine as long as the rest of the path is
		if(!must_exist && errno == ENOENT)
			return true;

		if(must_exist && errno == ENOENT)
			error = "Resource path does not exist, or path is an empty string.";
		else if(errno == ENOTDIR)
			error = "A component of the path is not a directory.";
		else if(errno == ELOOP)
			error = "Too many symbolic links encountered while traversing the path.";
		else if(errno == EACCES)
			error = "Permission denied.";
		else if(errno == ENAMETOOLONG)
			error = "File cannot be read.";
		else if(errno == EBADF)
			error = "Bad filename.";
		else
			error = "Could not access file.";

		return false;
	}

	return true;
}
