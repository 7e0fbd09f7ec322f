// cppcheck-suppress-file missingIncludeSystem
#include "ftrace_monitor.hpp"

#include <cstddef>
#include <sstream>

#include "logging.hpp"
#include "procfs.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

std::string read_tracefs_value(const std::string& path)
{
    auto content = read_file(path);
    return content ? trim(*content) : std::string();
}

} // namespace

Result<std::string> find_tracing_dir()
{
    std::vector<std::string> candidates;
    const std::string configured = env_or_default("HOSTSCOPE_TRACING_DIR", "");
    if (!configured.empty()) {
        candidates.push_back(configured);
    }
    candidates.emplace_back(kTracingDir);
    candidates.emplace_back(kDebugTracingDir);

    for (const auto& dir : candidates) {
        if (is_directory(dir)) {
            return dir;
        }
    }
    return Error(ErrorCode::IoFailure, "tracefs is not mounted or not accessible",
                 "requires root privileges and a mounted tracefs (" + std::string(kTracingDir) + ")");
}

std::vector<std::string> read_tracefs_list(const std::string& path)
{
    std::vector<std::string> out;
    auto lines = read_lines(path);
    if (!lines) {
        return out;
    }
    for (auto& line : *lines) {
        if (line[0] != '#') {
            out.push_back(std::move(line));
        }
    }
    return out;
}

std::vector<std::string> tail_lines(const std::vector<std::string>& lines, size_t max_lines)
{
    if (lines.size() <= max_lines) {
        return lines;
    }
    return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(max_lines), lines.end());
}

Envelope snapshot_ftrace_status(const FtraceOptions& options)
{
    const std::string subtype = "FTRACE_STATUS";
    return guarded_snapshot(subtype, [&]() {
        auto dir = find_tracing_dir();
        if (!dir) {
            return make_failure(subtype, dir.error());
        }
        const std::string& base = *dir;
        auto at = [&](const char* name) { return join_path(base, name); };

        const auto trace = read_tracefs_list(at("trace"));
        const auto tracers = split_whitespace(read_tracefs_value(at("available_tracers")));
        const auto options_list = read_tracefs_list(at("trace_options"));

        std::ostringstream data;
        data << "{\"ftrace_available\":true,\"tracing_dir\":" << json_quote(base)
             << ",\"tracing_on\":" << (read_tracefs_value(at("tracing_on")) == "1" ? "true" : "false")
             << ",\"current_tracer\":" << json_quote(read_tracefs_value(at("current_tracer")))
             << ",\"available_tracers\":" << json_string_array(tracers)
             << ",\"enabled_events\":" << json_string_array(read_tracefs_list(at("set_event")))
             << ",\"set_ftrace_filter\":" << json_string_array(read_tracefs_list(at("set_ftrace_filter")))
             << ",\"set_ftrace_notrace\":" << json_string_array(read_tracefs_list(at("set_ftrace_notrace")))
             << ",\"trace_options\":" << json_string_array(options_list)
             << ",\"enabled_functions\":" << json_string_array(read_tracefs_list(at("enabled_functions")))
             << ",\"trace_entries\":" << json_string_array(tail_lines(trace, options.max_trace_lines)) << "}";

        logger().log(SLOG_DEBUG("ftrace status collected").field("tracing_dir", base));
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
