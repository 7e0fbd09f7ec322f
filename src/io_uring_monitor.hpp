// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

// Kernel functions worth adding to set_ftrace_filter when watching io_uring.
const std::vector<std::string>& io_uring_trace_functions();

/**
 * Pick the candidates that the kernel can trace and that are not filtered yet.
 *
 * `available` is the content of available_filter_functions (entries may carry
 * a trailing " [module]"), `current` that of set_ftrace_filter. Running the
 * selection again after applying its result yields nothing.
 */
std::vector<std::string> select_missing_filters(const std::vector<std::string>& available,
                                                const std::vector<std::string>& current,
                                                const std::vector<std::string>& candidates);

bool is_io_uring_fd_target(const std::string& link_target);

// Write a tracefs control file. `append` adds to the file instead of replacing it.
Result<void> write_tracefs(const std::string& path, const std::string& value, bool append = false);

/**
 * Sets a tracefs control file for the lifetime of the object and restores
 * the previous value afterwards. Restore failures are logged.
 */
class ScopedTracefsSetting {
  public:
    ScopedTracefsSetting() = default;
    ~ScopedTracefsSetting();

    ScopedTracefsSetting(const ScopedTracefsSetting&) = delete;
    ScopedTracefsSetting& operator=(const ScopedTracefsSetting&) = delete;

    // No-op when the file already holds `value`.
    Result<void> apply(const std::string& path, const std::string& value);

  private:
    std::string path_;
    std::string previous_;
    bool active_ = false;
};

struct TraceCollection {
    std::vector<std::string> events;
    std::string stopped_by; // "max_events" or "timeout"
};

/**
 * Read io_uring lines from a trace pipe.
 *
 * A line counts when it mentions io_uring or one of io_uring_trace_functions().
 * Stops once `max_events` lines were collected or no new data arrived for
 * `timeout_seconds`.
 */
Result<TraceCollection> collect_trace_events(const std::string& pipe_path, const IoUringOptions& options);

Envelope snapshot_io_uring_instances();
Envelope snapshot_io_uring_trace(const IoUringOptions& options);

} // namespace hostscope
