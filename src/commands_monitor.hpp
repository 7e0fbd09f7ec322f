// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "scheduler.hpp"
#include "types.hpp"

namespace hostscope {

/// A monitor family: the run-directory prefix plus the kinds written per tick.
struct MonitorFamily {
    std::string name;
    std::vector<SnapshotKind> kinds;
};

// Families selected by the CLI, in a fixed order.
std::vector<MonitorFamily> enabled_families(const CliOptions& options);

// Run one family's poll loop. Returns 0 on success.
int run_family(const MonitorFamily& family, const ScheduleOptions& schedule);

// Run every enabled family concurrently and join them. Returns 0 when all succeeded.
int cmd_monitor(const CliOptions& options);

} // namespace hostscope
