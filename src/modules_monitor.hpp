// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "envelope.hpp"

namespace hostscope {

struct LoadedModule {
    std::string name;
    uint64_t size = 0;
    uint64_t use_count = 0;
    std::vector<std::string> used_by;
    std::string state;
    std::string offset; // empty when the kernel omits it
};

struct SysfsModule {
    std::string name;
    std::string path;
    bool loaded = false; // false: built into the kernel image
};

// Parse /proc/modules. Lines with fewer than four columns are skipped.
std::vector<LoadedModule> parse_proc_modules(const std::string& content);

// Classify one /sys/module/<name> directory.
SysfsModule classify_sysfs_module(const std::string& module_dir, const std::string& name);

Envelope snapshot_loaded_modules();
Envelope snapshot_module_tree();

} // namespace hostscope
