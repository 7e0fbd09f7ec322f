// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "result.hpp"

namespace hostscope {

struct CommandOutput {
    int exit_code = 0;
    std::string stdout_text;
};

/**
 * Locate an executable.
 *
 * A name containing '/' is checked directly; otherwise each PATH entry is
 * searched. Returns ToolNotAvailable when nothing executable is found.
 */
Result<std::string> find_executable(const std::string& name);

/**
 * Run an external tool and capture its stdout.
 *
 * Arguments are shell-quoted; stderr is discarded. A non-zero exit status is
 * reported through CommandOutput::exit_code, not as an Error. Errors are
 * reserved for failing to launch the tool at all.
 */
Result<CommandOutput> run_command(const std::string& executable, const std::vector<std::string>& args);

bool running_as_root();

} // namespace hostscope
