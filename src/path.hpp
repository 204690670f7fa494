#pragma once
#include <string>

namespace largefile {

// Expand a leading ~, make absolute against the current directory and
// resolve symlinks in the part of the path that exists. The target does not
// need to exist; a missing tail is normalized lexically.
std::string resolve_path(const std::string& path);

} // namespace largefile
