// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

/**
 * Locate the tracefs mount.
 *
 * Order: HOSTSCOPE_TRACING_DIR, /sys/kernel/tracing, /sys/kernel/debug/tracing.
 * The returned path is logical; procfs helpers apply any sysfs remapping.
 * Fails with IoFailure when none of them is a directory.
 */
Result<std::string> find_tracing_dir();

// Non-empty lines of a tracefs control file, '#' comment lines excluded.
// An unreadable file yields an empty list.
std::vector<std::string> read_tracefs_list(const std::string& path);

// Last `max_lines` entries of `lines`.
std::vector<std::string> tail_lines(const std::vector<std::string>& lines, size_t max_lines);

Envelope snapshot_ftrace_status(const FtraceOptions& options);

} // namespace hostscope
