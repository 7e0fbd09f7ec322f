// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

/// One named snapshot produced on every tick of a family's loop.
struct SnapshotKind {
    std::string name;    // file name prefix, e.g. "tcp_sockets"
    std::string subtype; // reported if the snapshot throws
    std::function<Envelope()> snapshot;
};

struct PollLoopConfig {
    std::string family; // run directory prefix, e.g. "net" -> net_monitor_<ts>
    ScheduleOptions schedule;
};

struct RunSummary {
    std::string run_dir;
    size_t iterations_completed = 0;
    size_t files_written = 0;
    size_t write_failures = 0;
};

// ceil(duration / frequency); callers must validate the schedule first.
size_t planned_iterations(const ScheduleOptions& schedule);

// Rejects non-positive or non-finite duration and frequency, and iteration
// counts that do not fit in size_t.
Result<void> validate_schedule(const ScheduleOptions& schedule);

// Print one envelope as a JSON line on stdout; safe across family threads.
void print_envelope(const Envelope& envelope);

// Subtype used for envelopes the loop itself emits, e.g. "NET_MONITOR_WRITE".
std::string loop_subtype(const std::string& family, const char* suffix);

/**
 * Poll-and-persist loop shared by every monitor family.
 *
 * Creates <output_dir>/<family>_monitor_<ts>/ and writes one
 * <kind>_<ts>_<iteration>.json per kind per tick. A kind that throws is
 * recorded as an EXECUTION_FAILURE envelope; a file that cannot be written is
 * logged and echoed to stdout as an IO_FAILURE envelope. Neither stops the run.
 */
Result<RunSummary> run_poll_loop(const PollLoopConfig& config, const std::vector<SnapshotKind>& kinds);

} // namespace hostscope
