// cppcheck-suppress-file missingIncludeSystem
#include "process_monitor.hpp"

#include <unistd.h>

#include <sstream>
#include <vector>

#include "logging.hpp"
#include "procfs.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

// Token offsets after the closing ')' of the command name.
constexpr size_t kStatState = 0;
constexpr size_t kStatPpid = 1;
constexpr size_t kStatUtime = 11;
constexpr size_t kStatStime = 12;
constexpr size_t kStatRss = 21;

uint64_t page_size()
{
    const long sz = ::sysconf(_SC_PAGESIZE);
    return sz > 0 ? static_cast<uint64_t>(sz) : 4096;
}

void append_stat_json(std::ostringstream& out, const ProcStat& st, const char* id_key, int owner_pid)
{
    out << "{\"" << id_key << "\":" << st.pid;
    if (owner_pid > 0) {
        out << ",\"pid\":" << owner_pid;
    }
    out << ",\"name\":" << json_quote(st.name) << ",\"state\":" << json_quote(st.state) << ",\"ppid\":" << st.ppid
        << ",\"cpu_ticks\":" << st.cpu_ticks << ",\"rss_bytes\":";
    if (st.rss_pages) {
        out << (*st.rss_pages * page_size());
    } else {
        out << "null";
    }
    out << "}";
}

} // namespace

Result<ProcStat> parse_proc_stat(const std::string& line)
{
    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return Error(ErrorCode::ExecutionFailure, "Malformed stat line", line);
    }

    ProcStat st;
    int64_t pid = 0;
    if (!parse_int64(trim(line.substr(0, open)), pid)) {
        return Error(ErrorCode::ExecutionFailure, "Malformed pid in stat line", line);
    }
    st.pid = static_cast<int>(pid);
    st.name = line.substr(open + 1, close - open - 1);

    const auto rest = split_whitespace(line.substr(close + 1));
    if (rest.size() <= kStatStime) {
        return Error(ErrorCode::ExecutionFailure, "Truncated stat line", line);
    }
    st.state = rest[kStatState];

    int64_t ppid = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    if (!parse_int64(rest[kStatPpid], ppid) || !parse_uint64(rest[kStatUtime], utime) ||
        !parse_uint64(rest[kStatStime], stime)) {
        return Error(ErrorCode::ExecutionFailure, "Malformed numeric field in stat line", line);
    }
    st.ppid = static_cast<int>(ppid);
    st.cpu_ticks = utime + stime;

    uint64_t rss = 0;
    if (rest.size() > kStatRss && parse_uint64(rest[kStatRss], rss)) {
        st.rss_pages = rss;
    }
    return st;
}

Envelope snapshot_processes()
{
    const std::string subtype = "PROCESSES";
    return guarded_snapshot(subtype, [&]() {
        auto pids = list_pids();
        if (!pids) {
            return make_failure(subtype, pids.error());
        }

        std::ostringstream data;
        size_t total = 0;
        size_t skipped = 0;
        data << "{\"processes\":[";
        for (int pid : *pids) {
            auto content = read_file("/proc/" + std::to_string(pid) + "/stat");
            if (!content) {
                ++skipped; // exited or not ours to read
                continue;
            }
            auto st = parse_proc_stat(trim(*content));
            if (!st) {
                ++skipped;
                continue;
            }
            if (total > 0) {
                data << ",";
            }
            append_stat_json(data, *st, "pid", 0);
            ++total;
        }
        data << "],\"total_processes\":" << total << "}";

        logger().log(SLOG_DEBUG("Process snapshot collected")
                         .field("processes", static_cast<uint64_t>(total))
                         .field("skipped", static_cast<uint64_t>(skipped)));
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_threads()
{
    const std::string subtype = "THREADS";
    return guarded_snapshot(subtype, [&]() {
        auto pids = list_pids();
        if (!pids) {
            return make_failure(subtype, pids.error());
        }

        std::ostringstream data;
        size_t total = 0;
        data << "{\"threads\":[";
        for (int pid : *pids) {
            const std::string task_dir = "/proc/" + std::to_string(pid) + "/task";
            auto tids = list_pids(task_dir);
            if (!tids) {
                continue;
            }
            for (int tid : *tids) {
                auto content = read_file(task_dir + "/" + std::to_string(tid) + "/stat");
                if (!content) {
                    continue;
                }
                auto st = parse_proc_stat(trim(*content));
                if (!st) {
                    continue;
                }
                if (total > 0) {
                    data << ",";
                }
                append_stat_json(data, *st, "tid", pid);
                ++total;
            }
        }
        data << "],\"total_threads\":" << total << "}";
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
