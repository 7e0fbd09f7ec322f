// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>

#include "result.hpp"
#include "types.hpp"

namespace hostscope {

/**
 * Parse the command line into CliOptions.
 *
 * Accepts both "--flag value" and "--flag=value". Returns InvalidArguments
 * for unknown flags, missing values and malformed numbers. Schedule values
 * are only checked for being numbers; range checks happen in the poll loop.
 */
Result<CliOptions> parse_cli(int argc, char* argv[]);

std::string usage_text(const std::string& program);

// Apply --log-* settings on top of any HOSTSCOPE_LOG_* environment values.
void apply_log_settings(const LogSettings& settings);

} // namespace hostscope
