// cppcheck-suppress-file missingIncludeSystem
/*
 * hostscope - command line parsing
 */

#include "cli.hpp"

#include <getopt.h>

#include <cstdint>
#include <sstream>

#include "logging.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

// Long-only options use values outside the char range.
enum OptionId : int {
    kOptDuration = 256,
    kOptFrequency,
    kOptOutputDir,
    kOptEbpf,
    kOptFtrace,
    kOptIoUring,
    kOptKallsyms,
    kOptModules,
    kOptNetworking,
    kOptProcess,
    kOptFileSystem,
    kOptAll,
    kOptBccEnabled,
    kOptMaxTraceLines,
    kOptMaxEvents,
    kOptTimeout,
    kOptKnownDirectories,
    kOptSymbolFilter,
    kOptModuleFilter,
    kOptMaxSymbols,
    kOptLogLevel,
    kOptLogFormat,
    kOptLogSink,
};

const struct option kLongOpts[] = {
    {"duration", required_argument, nullptr, kOptDuration},
    {"frequency", required_argument, nullptr, kOptFrequency},
    {"output-dir", required_argument, nullptr, kOptOutputDir},
    {"ebpf", no_argument, nullptr, kOptEbpf},
    {"ftrace", no_argument, nullptr, kOptFtrace},
    {"io-uring", no_argument, nullptr, kOptIoUring},
    {"kallsyms", no_argument, nullptr, kOptKallsyms},
    {"modules", no_argument, nullptr, kOptModules},
    {"networking", no_argument, nullptr, kOptNetworking},
    {"process", no_argument, nullptr, kOptProcess},
    {"file-system", no_argument, nullptr, kOptFileSystem},
    {"all", no_argument, nullptr, kOptAll},
    {"bcc-enabled", no_argument, nullptr, kOptBccEnabled},
    {"max-trace-lines", required_argument, nullptr, kOptMaxTraceLines},
    {"max-events", required_argument, nullptr, kOptMaxEvents},
    {"timeout", required_argument, nullptr, kOptTimeout},
    {"known-directories", required_argument, nullptr, kOptKnownDirectories},
    {"symbol-filter", required_argument, nullptr, kOptSymbolFilter},
    {"module-filter", required_argument, nullptr, kOptModuleFilter},
    {"max-symbols", required_argument, nullptr, kOptMaxSymbols},
    {"log-level", required_argument, nullptr, kOptLogLevel},
    {"log-format", required_argument, nullptr, kOptLogFormat},
    {"log-sink", required_argument, nullptr, kOptLogSink},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

Error invalid(const std::string& flag, const std::string& value, const char* expected)
{
    return Error(ErrorCode::InvalidArguments, "Invalid value for --" + flag, "'" + value + "' (" + expected + ")");
}

Result<size_t> parse_count(const char* flag, const char* value, bool allow_zero)
{
    uint64_t n = 0;
    if (!parse_uint64(value, n) || (!allow_zero && n == 0)) {
        return invalid(flag, value, allow_zero ? "expected a non-negative integer" : "expected a positive integer");
    }
    return static_cast<size_t>(n);
}

Result<double> parse_number(const char* flag, const char* value)
{
    double d = 0;
    if (!parse_seconds(value, d)) {
        return invalid(flag, value, "expected a number of seconds");
    }
    return d;
}

} // namespace

Result<CliOptions> parse_cli(int argc, char* argv[])
{
    CliOptions opts;

    optind = 0; // full getopt re-initialisation, parse_cli may run more than once
    opterr = 0;
    while (true) {
        int opt_index = 0;
        const int c = getopt_long(argc, argv, ":h", kLongOpts, &opt_index);
        if (c < 0) {
            break;
        }
        switch (c) {
            case kOptDuration: {
                auto v = parse_number("duration", optarg);
                if (!v) {
                    return v.error();
                }
                opts.schedule.duration = *v;
                break;
            }
            case kOptFrequency: {
                auto v = parse_number("frequency", optarg);
                if (!v) {
                    return v.error();
                }
                opts.schedule.frequency = *v;
                break;
            }
            case kOptOutputDir:
                if (*optarg == '\0') {
                    return invalid("output-dir", optarg, "expected a path");
                }
                opts.schedule.output_dir = optarg;
                break;
            case kOptEbpf:
                opts.families.ebpf = true;
                break;
            case kOptFtrace:
                opts.families.ftrace = true;
                break;
            case kOptIoUring:
                opts.families.io_uring = true;
                break;
            case kOptKallsyms:
                opts.families.kallsyms = true;
                break;
            case kOptModules:
                opts.families.modules = true;
                break;
            case kOptNetworking:
                opts.families.networking = true;
                break;
            case kOptProcess:
                opts.families.process = true;
                break;
            case kOptFileSystem:
                opts.families.file_system = true;
                break;
            case kOptAll:
                opts.families = EnabledFamilies{true, true, true, true, true, true, true, true};
                break;
            case kOptBccEnabled:
                opts.ebpf.bcc_enabled = true;
                break;
            case kOptMaxTraceLines: {
                auto v = parse_count("max-trace-lines", optarg, true);
                if (!v) {
                    return v.error();
                }
                opts.ftrace.max_trace_lines = *v;
                break;
            }
            case kOptMaxEvents: {
                auto v = parse_count("max-events", optarg, false);
                if (!v) {
                    return v.error();
                }
                opts.io_uring.max_events = *v;
                break;
            }
            case kOptTimeout: {
                auto v = parse_number("timeout", optarg);
                if (!v) {
                    return v.error();
                }
                if (*v <= 0) {
                    return invalid("timeout", optarg, "must be > 0");
                }
                opts.io_uring.timeout_seconds = *v;
                break;
            }
            case kOptKnownDirectories:
                opts.file_system.known_directories_file = optarg;
                break;
            case kOptSymbolFilter:
                opts.kallsyms.name_regex = optarg;
                break;
            case kOptModuleFilter:
                opts.kallsyms.module_regex = optarg;
                break;
            case kOptMaxSymbols: {
                auto v = parse_count("max-symbols", optarg, true);
                if (!v) {
                    return v.error();
                }
                opts.kallsyms.max_symbols = *v;
                break;
            }
            case kOptLogLevel:
                if (!parse_log_level(optarg, opts.log.level)) {
                    return invalid("log-level", optarg, "expected debug|info|warn|error");
                }
                opts.log.level_set = true;
                break;
            case kOptLogFormat: {
                const std::string format = to_lower(optarg);
                if (format != "text" && format != "json") {
                    return invalid("log-format", optarg, "expected text|json");
                }
                opts.log.json = format == "json";
                opts.log.format_set = true;
                break;
            }
            case kOptLogSink:
                if (!parse_log_sink(optarg, opts.log.sink)) {
                    return invalid("log-sink", optarg, "expected stderr|journald|both");
                }
                break;
            case 'h':
                opts.show_help = true;
                break;
            case ':':
                return Error(ErrorCode::InvalidArguments, "Missing value for option",
                             optind > 0 && optind <= argc ? argv[optind - 1] : "");
            default:
                return Error(ErrorCode::InvalidArguments, "Unknown option",
                             optind > 0 && optind <= argc ? argv[optind - 1] : "");
        }
    }

    if (optind < argc) {
        return Error(ErrorCode::InvalidArguments, "Unexpected positional argument", argv[optind]);
    }
    return opts;
}

std::string usage_text(const std::string& program)
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Scheduling:\n"
        << "  --duration <s>             Total run time in seconds (default 10)\n"
        << "  --frequency <s>            Seconds between snapshots (default 1)\n"
        << "  --output-dir <path>        Base directory for run output (default " << kDefaultOutputDir << ")\n"
        << "\n"
        << "Monitor families:\n"
        << "  --ebpf                     Loaded eBPF programs\n"
        << "  --ftrace                   ftrace configuration and recent trace lines\n"
        << "  --io-uring                 io_uring instances and trace activity\n"
        << "  --kallsyms                 Kernel symbol table\n"
        << "  --modules                  Loaded and built-in kernel modules\n"
        << "  --networking               Sockets, interfaces, ARP and iptables filter table\n"
        << "  --process                  Processes and threads\n"
        << "  --file-system              Open descriptors, known directories, filesystems\n"
        << "  --all                      Every family above\n"
        << "\n"
        << "Family options:\n"
        << "  --bcc-enabled              eBPF: use kprobe introspection only\n"
        << "  --max-trace-lines <n>      ftrace: trailing trace lines to keep (default 10)\n"
        << "  --max-events <n>           io_uring: events to collect per snapshot (default 100)\n"
        << "  --timeout <s>              io_uring: inactivity timeout (default 5)\n"
        << "  --known-directories <path> file_system: file listing directories to inspect\n"
        << "  --symbol-filter <regex>    kallsyms: keep symbols whose name matches\n"
        << "  --module-filter <regex>    kallsyms: keep symbols whose module matches\n"
        << "  --max-symbols <n>          kallsyms: cap on returned symbols, 0 = unlimited (default 5000)\n"
        << "\n"
        << "Logging:\n"
        << "  --log-level <level>        debug|info|warn|error (env HOSTSCOPE_LOG_LEVEL)\n"
        << "  --log-format <fmt>         text|json (env HOSTSCOPE_LOG_FORMAT)\n"
        << "  --log-sink <sink>          stderr|journald|both\n"
        << "  -h, --help                 Show this help\n";
    return oss.str();
}

void apply_log_settings(const LogSettings& settings)
{
    logger().configure_from_env();
    if (settings.level_set) {
        logger().set_level(settings.level);
    }
    if (settings.format_set) {
        logger().set_json_format(settings.json);
    }
    logger().set_sink(settings.sink);
}

} // namespace hostscope
