// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "envelope.hpp"
#include "result.hpp"

namespace hostscope {

/// Fields pulled out of one /proc/<pid>/stat (or task/<tid>/stat) line.
struct ProcStat {
    int pid = 0;
    std::string name;
    std::string state;
    int ppid = 0;
    uint64_t cpu_ticks = 0;          // utime + stime
    std::optional<uint64_t> rss_pages;
};

/**
 * Parse a stat line.
 *
 * The command name is taken between the first '(' and the last ')', so names
 * containing spaces or parentheses survive intact.
 */
Result<ProcStat> parse_proc_stat(const std::string& line);

Envelope snapshot_processes();
Envelope snapshot_threads();

} // namespace hostscope
