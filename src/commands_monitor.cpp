// cppcheck-suppress-file missingIncludeSystem
/*
 * hostscope - monitor family wiring and concurrent dispatch
 */

#include "commands_monitor.hpp"

#include <atomic>
#include <thread>

#include "ebpf_monitor.hpp"
#include "filesystem_monitor.hpp"
#include "ftrace_monitor.hpp"
#include "io_uring_monitor.hpp"
#include "kallsyms_monitor.hpp"
#include "logging.hpp"
#include "modules_monitor.hpp"
#include "network_monitor.hpp"
#include "process_monitor.hpp"

namespace hostscope {

std::vector<MonitorFamily> enabled_families(const CliOptions& options)
{
    // Options are copied into each closure; family threads share nothing mutable.
    std::vector<MonitorFamily> families;
    const auto& f = options.families;

    if (f.ebpf) {
        const EbpfOptions ebpf = options.ebpf;
        families.push_back({"ebpf", {{"loaded_ebpf", "LOADED_EBPF", [ebpf]() { return snapshot_loaded_ebpf(ebpf); }}}});
    }
    if (f.ftrace) {
        const FtraceOptions ftrace = options.ftrace;
        families.push_back(
            {"ftrace", {{"ftrace_status", "FTRACE_STATUS", [ftrace]() { return snapshot_ftrace_status(ftrace); }}}});
    }
    if (f.io_uring) {
        const IoUringOptions io_uring = options.io_uring;
        families.push_back({"io_uring",
                            {
                                {"io_uring_instances", "IO_URING_INSTANCES", snapshot_io_uring_instances},
                                {"io_uring_trace", "IO_URING_TRACE",
                                 [io_uring]() { return snapshot_io_uring_trace(io_uring); }},
                            }});
    }
    if (f.kallsyms) {
        const KallsymsOptions kallsyms = options.kallsyms;
        families.push_back(
            {"kallsyms", {{"kallsyms", "KALLSYMS", [kallsyms]() { return snapshot_kallsyms(kallsyms); }}}});
    }
    if (f.modules) {
        families.push_back({"modules",
                            {
                                {"loaded_modules", "LOADED_MODULES", snapshot_loaded_modules},
                                {"module_tree", "MODULE_TREE", snapshot_module_tree},
                            }});
    }
    if (f.networking) {
        families.push_back({"net",
                            {
                                {"tcp_sockets", "TCP_SOCKETS_V4", snapshot_tcp_sockets},
                                {"udp_sockets", "UDP_SOCKETS_V4", snapshot_udp_sockets},
                                {"tcp6_sockets", "TCP_SOCKETS_V6", snapshot_tcp6_sockets},
                                {"udp6_sockets", "UDP_SOCKETS_V6", snapshot_udp6_sockets},
                                {"network_interfaces", "NETWORK_INTERFACES", snapshot_network_interfaces},
                                {"iptables_filter", "IPTABLES_FILTER", snapshot_iptables_filter},
                                {"unix_sockets", "UNIX_SOCKETS", snapshot_unix_sockets},
                                {"arp_table", "ARP_TABLE", snapshot_arp_table},
                            }});
    }
    if (f.process) {
        families.push_back({"process",
                            {
                                {"processes", "PROCESSES", snapshot_processes},
                                {"threads", "THREADS", snapshot_threads},
                            }});
    }
    if (f.file_system) {
        const FileSystemOptions fs = options.file_system;
        families.push_back({"file_system",
                            {
                                {"file_descriptors", "FILE_DESCRIPTORS", snapshot_file_descriptors},
                                {"known_directories", "KNOWN_DIRECTORIES",
                                 [fs]() { return snapshot_known_directories(fs); }},
                                {"file_systems", "FILE_SYSTEMS", snapshot_file_systems},
                            }});
    }
    return families;
}

int run_family(const MonitorFamily& family, const ScheduleOptions& schedule)
{
    auto summary = run_poll_loop(PollLoopConfig{family.name, schedule}, family.kinds);
    if (summary) {
        return 0;
    }

    const Error& err = summary.error();
    logger().log(SLOG_ERROR("Monitor family failed")
                     .field("family", family.name)
                     .field("error_code", error_code_name(err.code()))
                     .field("error", err.to_string()));
    if (err.code() == ErrorCode::InvalidArguments) {
        print_envelope(make_failure(loop_subtype(family.name, "CALL"), err));
    }
    return 1;
}

int cmd_monitor(const CliOptions& options)
{
    const auto families = enabled_families(options);
    if (families.empty()) {
        logger().log(SLOG_ERROR("No monitor family enabled; pass at least one family flag or --all"));
        return 1;
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    workers.reserve(families.size());
    for (const auto& family : families) {
        workers.emplace_back([&family, &options, &failures]() {
            if (run_family(family, options.schedule) != 0) {
                failures.fetch_add(1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    logger().log(SLOG_INFO("All monitor families finished")
                     .field("families", static_cast<uint64_t>(families.size()))
                     .field("failed", static_cast<int64_t>(failures.load())));
    return failures.load() == 0 ? 0 : 1;
}

} // namespace hostscope
