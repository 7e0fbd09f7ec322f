// cppcheck-suppress-file missingIncludeSystem
#include "scheduler.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <mutex>
#include <thread>

#include "logging.hpp"
#include "scheduler_test_hooks.hpp"
#include "scoped_fd.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

double steady_now_seconds()
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

void sleep_seconds(double seconds)
{
    if (seconds > 0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

SchedulerDeps make_default_deps()
{
    SchedulerDeps d;
    d.now = steady_now_seconds;
    d.sleep = sleep_seconds;
    return d;
}

SchedulerDeps g_deps = make_default_deps();

// Families run on separate threads; keep their stdout envelopes whole.
std::mutex g_stdout_mu;

Result<void> write_snapshot_file(const std::string& path, const std::string& payload)
{
    ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd) {
        return Error::system(errno, "Failed to open snapshot file", path);
    }
    const std::string content = payload + "\n";
    size_t off = 0;
    while (off < content.size()) {
        ssize_t wrote = ::write(fd.get(), content.data() + off, content.size() - off);
        if (wrote < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::system(errno, "Failed to write snapshot file", path);
        }
        off += static_cast<size_t>(wrote);
    }
    return {};
}

Envelope run_kind(const SnapshotKind& kind)
{
    if (!kind.snapshot) {
        return make_failure(kind.subtype, ErrorCode::ExecutionFailure, "No snapshot function for " + kind.name);
    }
    return guarded_snapshot(kind.subtype, kind.snapshot);
}

} // namespace

void print_envelope(const Envelope& envelope)
{
    std::lock_guard<std::mutex> lock(g_stdout_mu);
    std::cout << to_json(envelope) << std::endl;
}

size_t planned_iterations(const ScheduleOptions& schedule)
{
    return static_cast<size_t>(std::ceil(schedule.duration / schedule.frequency));
}

Result<void> validate_schedule(const ScheduleOptions& schedule)
{
    if (!std::isfinite(schedule.frequency) || schedule.frequency <= 0) {
        return Error(ErrorCode::InvalidArguments, "Invalid frequency (must be > 0)", std::to_string(schedule.frequency));
    }
    if (!std::isfinite(schedule.duration) || schedule.duration <= 0) {
        return Error(ErrorCode::InvalidArguments, "Invalid duration (must be > 0)", std::to_string(schedule.duration));
    }
    const double ticks = std::ceil(schedule.duration / schedule.frequency);
    if (!std::isfinite(ticks) || ticks >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return Error(ErrorCode::InvalidArguments, "Too many iterations (duration / frequency overflows)",
                     std::to_string(schedule.duration) + "/" + std::to_string(schedule.frequency));
    }
    return {};
}

std::string loop_subtype(const std::string& family, const char* suffix)
{
    std::string out;
    for (char c : family) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out + "_MONITOR_" + suffix;
}

Result<RunSummary> run_poll_loop(const PollLoopConfig& config, const std::vector<SnapshotKind>& kinds)
{
    TRY(validate_schedule(config.schedule));
    if (kinds.empty()) {
        return Error(ErrorCode::InvalidArguments, "No snapshot kinds configured", config.family);
    }

    const std::string root_ts = run_timestamp();
    const std::filesystem::path run_dir =
        std::filesystem::path(config.schedule.output_dir) / (config.family + "_monitor_" + root_ts);
    std::error_code ec;
    std::filesystem::create_directories(run_dir, ec);
    if (ec) {
        return Error(ErrorCode::IoFailure, "Failed to create run directory", run_dir.string() + ": " + ec.message());
    }

    RunSummary summary;
    summary.run_dir = run_dir.string();
    const size_t iterations = planned_iterations(config.schedule);
    const double duration = config.schedule.duration;
    const double frequency = config.schedule.frequency;

    logger().log(SLOG_INFO("Monitor run started")
                     .field("family", config.family)
                     .field("run_dir", summary.run_dir)
                     .field("iterations", static_cast<uint64_t>(iterations))
                     .field("kinds", static_cast<uint64_t>(kinds.size())));

    const double start = g_deps.now();
    for (size_t i = 0; i < iterations; ++i) {
        if (g_deps.now() - start > duration) {
            logger().log(SLOG_WARN("Run exceeded its duration, stopping early")
                             .field("family", config.family)
                             .field("iteration", static_cast<uint64_t>(i)));
            break;
        }

        for (const auto& kind : kinds) {
            const Envelope envelope = run_kind(kind);
            const std::string file = kind.name + "_" + root_ts + "_" + std::to_string(i) + ".json";
            const std::string path = (run_dir / file).string();
            auto written = write_snapshot_file(path, to_json(envelope));
            if (written) {
                ++summary.files_written;
                continue;
            }
            ++summary.write_failures;
            logger().log(SLOG_ERROR("Failed to write snapshot")
                             .field("family", config.family)
                             .field("path", path)
                             .field("error", written.error().to_string()));
            print_envelope(make_failure(loop_subtype(config.family, "WRITE"), ErrorCode::IoFailure,
                                        "Failed to write " + path + ": " + written.error().to_string()));
        }
        ++summary.iterations_completed;

        if (i + 1 == iterations) {
            break;
        }
        const double elapsed = g_deps.now() - start;
        const double to_next = frequency - std::fmod(elapsed, frequency);
        g_deps.sleep(std::min(to_next, std::max(0.0, duration - elapsed)));
    }

    logger().log(SLOG_INFO("Monitor run finished")
                     .field("family", config.family)
                     .field("iterations_completed", static_cast<uint64_t>(summary.iterations_completed))
                     .field("files_written", static_cast<uint64_t>(summary.files_written))
                     .field("write_failures", static_cast<uint64_t>(summary.write_failures)));
    return summary;
}

// --- SchedulerDeps struct-based API ---

SchedulerDeps& scheduler_deps()
{
    return g_deps;
}

void set_scheduler_deps_for_test(const SchedulerDeps& deps)
{
    auto defaults = make_default_deps();
    g_deps.now = deps.now ? deps.now : defaults.now;
    g_deps.sleep = deps.sleep ? deps.sleep : defaults.sleep;
}

void reset_scheduler_deps_for_test()
{
    g_deps = make_default_deps();
}

} // namespace hostscope
