// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

struct MountEntry {
    std::string device;
    std::string mount_point;
    std::string type;
    std::string options;
};

// Directories listed when no --known-directories file is given.
const std::vector<std::string>& default_known_directories();

// One directory per line; blank lines are ignored.
Result<std::vector<std::string>> load_known_directories(const std::string& path);

// Filesystem types from /proc/filesystems that are backed by a device.
std::vector<std::string> parse_proc_filesystems(const std::string& content);

// fstab and /proc/self/mounts share a layout; comment lines are dropped.
std::vector<MountEntry> parse_mount_table(const std::string& content);

Envelope snapshot_file_descriptors();
Envelope snapshot_known_directories(const FileSystemOptions& options);
Envelope snapshot_file_systems();

} // namespace hostscope
