// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "logging.hpp"

namespace hostscope {

inline constexpr const char* kProcRoot = "/proc";
inline constexpr const char* kKallsymsPath = "/proc/kallsyms";
inline constexpr const char* kKptrRestrictPath = "/proc/sys/kernel/kptr_restrict";
inline constexpr const char* kIoUringDisabledPath = "/proc/sys/kernel/io_uring_disabled";
inline constexpr const char* kProcModulesPath = "/proc/modules";
inline constexpr const char* kSysModuleDir = "/sys/module";
inline constexpr const char* kSysClassNetDir = "/sys/class/net";
inline constexpr const char* kTracingDir = "/sys/kernel/tracing";
inline constexpr const char* kDebugTracingDir = "/sys/kernel/debug/tracing";
inline constexpr const char* kDebugKprobesList = "/sys/kernel/debug/kprobes/list";
inline constexpr const char* kProcFilesystemsPath = "/proc/filesystems";
inline constexpr const char* kProcMountsPath = "/proc/self/mounts";
inline constexpr const char* kFstabPath = "/etc/fstab";
inline constexpr const char* kDefaultOutputDir = "data/output";

enum class TaskType { State, Event, Interrupt };

enum class SnapshotStatus { Success, Failure };

/// Parameters shared by every poll loop in one invocation.
struct ScheduleOptions {
    double duration = 10.0;
    double frequency = 1.0;
    std::string output_dir = kDefaultOutputDir;
};

struct EbpfOptions {
    bool bcc_enabled = false; // go straight to kprobe-based introspection
};

struct FtraceOptions {
    size_t max_trace_lines = 10;
};

struct IoUringOptions {
    size_t max_events = 100;
    double timeout_seconds = 5.0; // inactivity timeout
};

struct KallsymsOptions {
    std::string name_regex;
    std::string module_regex;
    size_t max_symbols = 5000; // 0 = unlimited
};

struct FileSystemOptions {
    std::string known_directories_file; // empty = built-in default set
};

struct EnabledFamilies {
    bool ebpf = false;
    bool ftrace = false;
    bool io_uring = false;
    bool kallsyms = false;
    bool modules = false;
    bool networking = false;
    bool process = false;
    bool file_system = false;

    [[nodiscard]] bool any() const
    {
        return ebpf || ftrace || io_uring || kallsyms || modules || networking || process || file_system;
    }
};

struct LogSettings {
    LogLevel level = LogLevel::Info;
    bool json = false;
    LogSink sink = LogSink::Stderr;
    bool level_set = false;
    bool format_set = false;
};

struct CliOptions {
    ScheduleOptions schedule;
    EnabledFamilies families;
    EbpfOptions ebpf;
    FtraceOptions ftrace;
    IoUringOptions io_uring;
    KallsymsOptions kallsyms;
    FileSystemOptions file_system;
    LogSettings log;
    bool show_help = false;
};

} // namespace hostscope
