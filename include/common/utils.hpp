#pragma once

#include <string>
#include <vector>

namespace utils {

// Resolves a command the way execvp would: names containing '/' are checked
// directly, bare names are searched on PATH. Returns an empty string when no
// executable regular file is found.
std::string findExecutable(const std::string& name);

// Expands a leading "~" and any "$HOME" / "${HOME}" occurrence.
std::string expandHome(const std::string& value);

// Returns the path with exactly one trailing '/'.
std::string withTrailingSlash(const std::string& path);

// Joins argv for display, quoting arguments that contain whitespace.
std::string joinCommandLine(const std::vector<std::string>& argv);

// Directory of the executable as invoked through argv[0]. Symlinks are not
// followed, so a link in ~/bin finds its configuration beside the link.
// Bare names are searched on PATH; /proc/self/exe is the last resort.
std::string executableDirectory(const char* argv0);

} // namespace utils
