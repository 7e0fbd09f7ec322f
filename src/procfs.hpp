// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "result.hpp"

namespace hostscope {

// Resolve an absolute /proc or /sys path through HOSTSCOPE_PROC_ROOT /
// HOSTSCOPE_SYS_ROOT. Paths outside those trees are returned unchanged.
std::string proc_path(const std::string& abs);
std::string sys_path(const std::string& abs);

// Dispatch on the leading component: /proc goes through proc_path, /sys
// through sys_path, everything else is left alone.
std::string host_path(const std::string& abs);

// Callers pass logical (unmapped) paths to everything below.
Result<std::string> read_file(const std::string& abs);
Result<std::vector<std::string>> read_lines(const std::string& abs);
Result<std::vector<std::string>> list_directory(const std::string& abs);
Result<std::string> read_link(const std::string& abs);

// Numeric entries of /proc (or of /proc/<pid>/task), ascending.
Result<std::vector<int>> list_pids(const std::string& dir = "/proc");

bool path_exists(const std::string& abs);
bool is_directory(const std::string& abs);

// Join a directory and entry name with a single separator.
std::string join_path(const std::string& dir, const std::string& name);

} // namespace hostscope
