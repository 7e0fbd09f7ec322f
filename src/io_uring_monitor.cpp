// cppcheck-suppress-file missingIncludeSystem
#include "io_uring_monitor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <sstream>
#include <thread>
#include <unordered_set>

#include "ftrace_monitor.hpp"
#include "logging.hpp"
#include "procfs.hpp"
#include "scoped_fd.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

constexpr const char* kIoUringFdTarget = "anon_inode:[io_uring]";
constexpr int kIdleBackoffMs = 50;

std::string first_token(const std::string& line)
{
    const auto end = line.find_first_of(" \t");
    return end == std::string::npos ? line : line.substr(0, end);
}

bool contains(const std::vector<std::string>& values, const std::string& needle)
{
    return std::find(values.begin(), values.end(), needle) != values.end();
}

} // namespace

const std::vector<std::string>& io_uring_trace_functions()
{
    static const std::vector<std::string> functions = {
        "io_uring_setup",           "io_uring_enter",           "io_uring_register",
        "__x64_sys_io_uring_setup", "__x64_sys_io_uring_enter", "__x64_sys_io_uring_register",
        "io_submit_sqes",           "io_issue_sqe",
    };
    return functions;
}

namespace {

// io_uring trace events, plus function-tracer hits for the filtered
// functions whose names lack the prefix (io_issue_sqe, io_submit_sqes).
bool is_io_uring_line(const std::string& line)
{
    if (line.find("io_uring") != std::string::npos) {
        return true;
    }
    for (const auto& fn : io_uring_trace_functions()) {
        if (line.find(fn) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> select_missing_filters(const std::vector<std::string>& available,
                                                const std::vector<std::string>& current,
                                                const std::vector<std::string>& candidates)
{
    std::unordered_set<std::string> traceable;
    for (const auto& line : available) {
        traceable.insert(first_token(line));
    }
    std::unordered_set<std::string> filtered;
    for (const auto& line : current) {
        filtered.insert(first_token(line));
    }

    std::vector<std::string> missing;
    for (const auto& fn : candidates) {
        if (traceable.count(fn) != 0 && filtered.count(fn) == 0 && !contains(missing, fn)) {
            missing.push_back(fn);
        }
    }
    return missing;
}

bool is_io_uring_fd_target(const std::string& link_target)
{
    return link_target == kIoUringFdTarget;
}

Result<void> write_tracefs(const std::string& path, const std::string& value, bool append)
{
    const std::string real = host_path(path);
    const int flags = O_WRONLY | O_CLOEXEC | (append ? O_APPEND : O_TRUNC);
    ScopedFd fd(::open(real.c_str(), flags));
    if (!fd) {
        return Error::system(errno, "Failed to open tracefs file for writing", real);
    }
    const std::string line = value + "\n";
    const ssize_t n = ::write(fd.get(), line.data(), line.size());
    if (n < 0) {
        return Error::system(errno, "Failed to write tracefs file", real);
    }
    if (static_cast<size_t>(n) != line.size()) {
        return Error(ErrorCode::IoFailure, "Short write to tracefs file", real);
    }
    return {};
}

ScopedTracefsSetting::~ScopedTracefsSetting()
{
    if (!active_) {
        return;
    }
    auto restored = write_tracefs(path_, previous_);
    if (!restored) {
        logger().log(SLOG_WARN("Failed to restore tracefs setting")
                         .field("path", path_)
                         .field("value", previous_)
                         .field("error", restored.error().to_string()));
    }
}

Result<void> ScopedTracefsSetting::apply(const std::string& path, const std::string& value)
{
    auto current = read_file(path);
    if (!current) {
        return current.error();
    }
    const std::string previous = trim(*current);
    if (previous == value) {
        return {};
    }
    TRY(write_tracefs(path, value));
    path_ = path;
    previous_ = previous;
    active_ = true;
    return {};
}

Result<TraceCollection> collect_trace_events(const std::string& pipe_path, const IoUringOptions& options)
{
    const std::string real = host_path(pipe_path);
    ScopedFd fd(::open(real.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
    if (!fd) {
        return Error::system(errno, "Failed to open trace pipe", real);
    }

    using Clock = std::chrono::steady_clock;
    const auto timeout = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(std::max(0.0, options.timeout_seconds)));
    auto last_activity = Clock::now();

    TraceCollection out;
    std::string pending;
    char buf[4096];
    while (out.events.size() < options.max_events) {
        const auto idle = Clock::now() - last_activity;
        if (idle >= timeout) {
            break;
        }
        const auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout - idle).count();

        struct pollfd pfd {};
        pfd.fd = fd.get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(std::max<int64_t>(1, remaining_ms)));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::system(errno, "poll on trace pipe failed", real);
        }
        if (rc == 0) {
            break;
        }

        const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            return Error::system(errno, "Failed to read trace pipe", real);
        }
        if (n == 0) {
            // Regular files report readable at EOF; back off instead of spinning.
            std::this_thread::sleep_for(std::chrono::milliseconds(kIdleBackoffMs));
            continue;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t pos = 0;
        size_t nl = 0;
        while ((nl = pending.find('\n', pos)) != std::string::npos) {
            const std::string line = trim(pending.substr(pos, nl - pos));
            pos = nl + 1;
            if (!is_io_uring_line(line)) {
                continue;
            }
            last_activity = Clock::now();
            out.events.push_back(line);
            if (out.events.size() >= options.max_events) {
                break;
            }
        }
        pending.erase(0, pos);
    }

    out.stopped_by = out.events.size() >= options.max_events ? "max_events" : "timeout";
    return out;
}

Envelope snapshot_io_uring_instances()
{
    const std::string subtype = "IO_URING_INSTANCES";
    return guarded_snapshot(subtype, [&]() {
        auto pids = list_pids();
        if (!pids) {
            return make_failure(subtype, pids.error());
        }

        std::ostringstream instances;
        size_t total = 0;
        for (int pid : *pids) {
            const std::string base = "/proc/" + std::to_string(pid);
            auto fds = list_pids(base + "/fd");
            if (!fds) {
                continue;
            }
            std::string name;
            for (int fd : *fds) {
                auto target = read_link(base + "/fd/" + std::to_string(fd));
                if (!target || !is_io_uring_fd_target(*target)) {
                    continue;
                }
                if (name.empty()) {
                    auto comm = read_file(base + "/comm");
                    name = comm ? trim(*comm) : std::string();
                }
                instances << (total > 0 ? "," : "") << "{\"pid\":" << pid << ",\"name\":" << json_quote(name)
                          << ",\"fd\":" << fd << "}";
                ++total;
            }
        }

        uint64_t disabled = 0;
        auto disabled_raw = read_file(kIoUringDisabledPath);
        const bool has_disabled = disabled_raw && parse_uint64(trim(*disabled_raw), disabled);

        std::ostringstream data;
        data << "{\"io_uring_disabled\":" << (has_disabled ? std::to_string(disabled) : "null")
             << ",\"total_instances\":" << total << ",\"instances\":[" << instances.str() << "]}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_io_uring_trace(const IoUringOptions& options)
{
    const std::string subtype = "IO_URING_TRACE";
    return guarded_snapshot(subtype, [&]() {
        auto dir = find_tracing_dir();
        if (!dir) {
            return make_failure(subtype, ErrorCode::IoFailure,
                                "io_uring tracing unavailable: tracefs is not mounted or requires elevated "
                                "privileges (" + dir.error().context() + ")");
        }
        const std::string& base = *dir;
        auto at = [&](const char* name) { return join_path(base, name); };

        const auto available = read_tracefs_list(at("available_filter_functions"));
        const auto current = read_tracefs_list(at("set_ftrace_filter"));
        const auto added = select_missing_filters(available, current, io_uring_trace_functions());
        for (const auto& fn : added) {
            auto written = write_tracefs(at("set_ftrace_filter"), fn, true);
            if (!written) {
                return make_failure(subtype, written.error());
            }
        }

        ScopedTracefsSetting events_enable;
        if (path_exists(at("events/io_uring/enable"))) {
            auto enabled = events_enable.apply(at("events/io_uring/enable"), "1");
            if (!enabled) {
                return make_failure(subtype, enabled.error());
            }
        }

        // Only switch tracers when a filter keeps the function tracer narrow.
        ScopedTracefsSetting tracer;
        const auto tracers = split_whitespace(read_file(at("available_tracers")).value_or(""));
        const bool filtered = !added.empty() || !current.empty();
        if (filtered && contains(tracers, "function")) {
            auto switched = tracer.apply(at("current_tracer"), "function");
            if (!switched) {
                return make_failure(subtype, switched.error());
            }
        }

        ScopedTracefsSetting tracing_on;
        if (path_exists(at("tracing_on"))) {
            auto on = tracing_on.apply(at("tracing_on"), "1");
            if (!on) {
                return make_failure(subtype, on.error());
            }
        }

        auto collected = collect_trace_events(at("trace_pipe"), options);
        if (!collected) {
            return make_failure(subtype, collected.error());
        }

        logger().log(SLOG_INFO("io_uring trace collected")
                         .field("events", static_cast<uint64_t>(collected->events.size()))
                         .field("filters_added", static_cast<uint64_t>(added.size()))
                         .field("stopped_by", collected->stopped_by));

        std::ostringstream data;
        data << "{\"tracing_dir\":" << json_quote(base) << ",\"filters_added\":" << json_string_array(added)
             << ",\"total_events\":" << collected->events.size()
             << ",\"events\":" << json_string_array(collected->events)
             << ",\"stopped_by\":" << json_quote(collected->stopped_by) << "}";
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
