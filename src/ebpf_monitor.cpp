// cppcheck-suppress-file missingIncludeSystem
#include "ebpf_monitor.hpp"

#include <bpf/bpf.h>
#include <bpf/libbpf.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <map>
#include <sstream>

#include "command_runner.hpp"
#include "ftrace_monitor.hpp"
#include "logging.hpp"
#include "procfs.hpp"
#include "scoped_fd.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

std::string strip_probe_offset(const std::string& symbol)
{
    const auto plus = symbol.find('+');
    return plus == std::string::npos ? symbol : symbol.substr(0, plus);
}

std::string tag_hex(const unsigned char* tag, size_t len)
{
    std::string out;
    char buf[3];
    for (size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", tag[i]);
        out += buf;
    }
    return out;
}

bool bpf_unavailable(int err)
{
    return err == EPERM || err == EACCES || err == ENOSYS || err == EOPNOTSUPP;
}

} // namespace

Result<std::vector<BpfProgram>> parse_bpftool_programs(const std::string& json)
{
    std::vector<std::string> objects;
    if (!split_json_array_objects(trim(json), objects)) {
        return Error(ErrorCode::ExecutionFailure, "Malformed bpftool output", "expected a JSON array of objects");
    }

    std::vector<BpfProgram> programs;
    programs.reserve(objects.size());
    for (const auto& obj : objects) {
        BpfProgram prog;
        uint64_t id = 0;
        if (extract_json_uint64(obj, "id", id)) {
            prog.id = id;
        }
        if (!extract_json_string(obj, "type", prog.type)) {
            prog.type = "unknown";
        }
        if (!extract_json_string(obj, "name", prog.name)) {
            prog.name = "unknown";
        }
        extract_json_string(obj, "tag", prog.tag);
        extract_json_string(obj, "attach_type", prog.attach_type);
        programs.push_back(std::move(prog));
    }
    return programs;
}

std::vector<std::string> parse_kprobe_list(const std::string& content)
{
    // <address> <k|r|...> <symbol+offset> [flags]
    std::vector<std::string> names;
    for (const auto& line : split_lines(content)) {
        const auto cols = split_whitespace(line);
        if (cols.size() >= 3) {
            names.push_back(strip_probe_offset(cols[2]));
        }
    }
    return names;
}

std::vector<std::string> parse_kprobe_events(const std::string& content)
{
    // p[:[group/]event] <symbol[+offset]> [fetchargs]
    std::vector<std::string> names;
    for (const auto& line : split_lines(content)) {
        if (line[0] == '#') {
            continue;
        }
        const auto cols = split_whitespace(line);
        if (cols.size() >= 2 && (cols[0][0] == 'p' || cols[0][0] == 'r')) {
            names.push_back(strip_probe_offset(cols[1]));
        }
    }
    return names;
}

Result<EbpfInventory> enumerate_via_bpftool()
{
    auto tool = find_executable(env_or_default("HOSTSCOPE_BPFTOOL", "bpftool"));
    if (!tool) {
        return tool.error();
    }
    auto output = run_command(*tool, {"-j", "prog", "show"});
    if (!output) {
        return output.error();
    }
    if (output->exit_code != 0) {
        return Error(ErrorCode::ExecutionFailure, "bpftool prog show failed",
                     "exit status " + std::to_string(output->exit_code));
    }
    auto programs = parse_bpftool_programs(output->stdout_text);
    if (!programs) {
        return programs.error();
    }
    return EbpfInventory{"bpftool", std::move(*programs)};
}

Result<EbpfInventory> enumerate_via_libbpf()
{
    EbpfInventory inventory;
    inventory.source = "libbpf";

    __u32 id = 0;
    while (true) {
        __u32 next_id = 0;
        if (bpf_prog_get_next_id(id, &next_id) != 0) {
            const int err = errno;
            if (err == ENOENT) {
                break;
            }
            if (bpf_unavailable(err)) {
                return Error(ErrorCode::ToolNotAvailable, "bpf(2) program enumeration not permitted",
                             std::strerror(err));
            }
            return Error::system(err, "bpf_prog_get_next_id failed");
        }
        id = next_id;

        ScopedFd fd(bpf_prog_get_fd_by_id(id));
        if (!fd) {
            const int err = errno;
            if (err == ENOENT) {
                continue; // unloaded between the two calls
            }
            if (bpf_unavailable(err)) {
                return Error(ErrorCode::ToolNotAvailable, "bpf(2) program access not permitted", std::strerror(err));
            }
            return Error::system(err, "bpf_prog_get_fd_by_id failed", std::to_string(id));
        }

        struct bpf_prog_info info {};
        __u32 info_len = sizeof(info);
        if (bpf_obj_get_info_by_fd(fd.get(), &info, &info_len) != 0) {
            return Error::system(errno, "bpf_obj_get_info_by_fd failed", std::to_string(id));
        }

        BpfProgram prog;
        prog.id = info.id;
        const char* type = libbpf_bpf_prog_type_str(static_cast<enum bpf_prog_type>(info.type));
        prog.type = type != nullptr ? type : "unknown";
        prog.name = info.name[0] != '\0' ? std::string(info.name) : "unknown";
        prog.tag = tag_hex(info.tag, BPF_TAG_SIZE);
        inventory.programs.push_back(std::move(prog));
    }
    return inventory;
}

Result<EbpfInventory> enumerate_via_kprobes()
{
    EbpfInventory inventory;
    inventory.source = "kprobes";

    std::vector<std::string> names;
    auto list = read_file(kDebugKprobesList);
    if (list) {
        names = parse_kprobe_list(*list);
    } else {
        auto dir = find_tracing_dir();
        if (!dir) {
            return Error(ErrorCode::ToolNotAvailable, "No kprobe registry available",
                         "debugfs kprobes/list and tracefs kprobe_events are unreadable");
        }
        auto events = read_file(join_path(*dir, "kprobe_events"));
        if (!events) {
            return Error(ErrorCode::ToolNotAvailable, "No kprobe registry available", events.error().to_string());
        }
        names = parse_kprobe_events(*events);
    }

    for (auto& name : names) {
        BpfProgram prog;
        prog.type = "kprobe";
        prog.attach_type = "kprobe";
        prog.name = std::move(name);
        inventory.programs.push_back(std::move(prog));
    }
    return inventory;
}

std::string inventory_json(const EbpfInventory& inventory)
{
    std::map<std::string, std::vector<std::string>> attachment_points;
    std::ostringstream programs;
    for (size_t i = 0; i < inventory.programs.size(); ++i) {
        const auto& p = inventory.programs[i];
        const std::string id = p.id ? std::to_string(*p.id) : "null";
        programs << (i > 0 ? "," : "") << "{\"id\":" << id << ",\"type\":" << json_quote(p.type)
                 << ",\"name\":" << json_quote(p.name) << ",\"tag\":" << (p.tag.empty() ? "null" : json_quote(p.tag))
                 << ",\"attach_type\":" << json_quote(p.attach_type) << "}";
        attachment_points[p.attach_type].push_back(p.id ? id : json_quote(p.name));
    }

    std::ostringstream out;
    out << "{\"source\":" << json_quote(inventory.source) << ",\"total_programs\":" << inventory.programs.size()
        << ",\"loaded_programs\":[" << programs.str() << "],\"attachment_points\":{";
    bool first = true;
    for (const auto& [attach, refs] : attachment_points) {
        out << (first ? "" : ",") << json_quote(attach) << ":[";
        for (size_t i = 0; i < refs.size(); ++i) {
            out << (i > 0 ? "," : "") << refs[i];
        }
        out << "]";
        first = false;
    }
    out << "}}";
    return out.str();
}

Envelope snapshot_loaded_ebpf(const EbpfOptions& options)
{
    const std::string subtype = "LOADED_EBPF";
    return guarded_snapshot(subtype, [&]() {
        using Source = Result<EbpfInventory> (*)();
        std::vector<Source> sources;
        if (!options.bcc_enabled) {
            sources.push_back(enumerate_via_bpftool);
            sources.push_back(enumerate_via_libbpf);
        }
        sources.push_back(enumerate_via_kprobes);

        std::string last_reason;
        for (Source source : sources) {
            auto inventory = source();
            if (inventory) {
                logger().log(SLOG_DEBUG("eBPF programs enumerated")
                                 .field("source", inventory->source)
                                 .field("programs", static_cast<uint64_t>(inventory->programs.size())));
                return make_success(subtype, inventory_json(*inventory));
            }
            if (inventory.error().code() != ErrorCode::ToolNotAvailable) {
                return make_failure(subtype, inventory.error());
            }
            last_reason = inventory.error().to_string();
            logger().log(SLOG_DEBUG("eBPF source unavailable, falling back").field("reason", last_reason));
        }
        return make_failure(subtype, ErrorCode::ToolNotAvailable,
                            "No eBPF enumeration source available (bpftool, bpf syscall, kprobes): " + last_reason);
    });
}

} // namespace hostscope
