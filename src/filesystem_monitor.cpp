// cppcheck-suppress-file missingIncludeSystem
#include "filesystem_monitor.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <sstream>

#include "logging.hpp"
#include "procfs.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

constexpr const char* kMissingDirectoryNote = "Directory does not exist or is not a directory.";

const char* fd_type(const std::string& fd_link)
{
    struct stat st {};
    if (::stat(host_path(fd_link).c_str(), &st) != 0) {
        return "OTHER";
    }
    if (S_ISREG(st.st_mode)) {
        return "REG";
    }
    if (S_ISDIR(st.st_mode)) {
        return "DIR";
    }
    return "OTHER";
}

std::string nullable(const std::string* value)
{
    return value == nullptr ? "null" : json_quote(*value);
}

} // namespace

const std::vector<std::string>& default_known_directories()
{
    static const std::vector<std::string> dirs = {"/dev", "/tmp", "/sys"};
    return dirs;
}

Result<std::vector<std::string>> load_known_directories(const std::string& path)
{
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return Error(ErrorCode::InvalidArguments, "Known directories file must be an existing regular file", path);
    }
    auto lines = read_lines(path);
    if (!lines) {
        return Error(ErrorCode::IoFailure, "Failed to read known directories file", lines.error().context());
    }
    return *lines;
}

std::vector<std::string> parse_proc_filesystems(const std::string& content)
{
    std::vector<std::string> types;
    for (const auto& line : split_lines(content)) {
        if (line.rfind("nodev", 0) == 0) {
            continue;
        }
        types.push_back(line);
    }
    return types;
}

std::vector<MountEntry> parse_mount_table(const std::string& content)
{
    std::vector<MountEntry> entries;
    for (const auto& line : split_lines(content)) {
        if (line[0] == '#') {
            continue;
        }
        const auto f = split_whitespace(line);
        if (f.size() < 4) {
            continue;
        }
        entries.push_back(MountEntry{f[0], f[1], f[2], f[3]});
    }
    return entries;
}

Envelope snapshot_file_descriptors()
{
    const std::string subtype = "FILE_DESCRIPTORS";
    return guarded_snapshot(subtype, [&]() {
        auto pids = list_pids();
        if (!pids) {
            return make_failure(subtype, pids.error());
        }

        std::ostringstream data;
        size_t total = 0;
        data << "{\"processes\":[";
        for (int pid : *pids) {
            const std::string fd_dir = "/proc/" + std::to_string(pid) + "/fd";
            auto fds = list_pids(fd_dir);
            if (!fds) {
                continue; // exited or permission denied
            }

            std::ostringstream entries;
            for (size_t i = 0; i < fds->size(); ++i) {
                const int fd = (*fds)[i];
                const std::string link = fd_dir + "/" + std::to_string(fd);
                entries << (i > 0 ? "," : "") << "{\"fd\":" << fd;
                auto target = read_link(link);
                if (!target) {
                    entries << ",\"type\":\"OTHER\",\"path\":"
                            << json_quote("<unreadable: " + target.error().context() + ">") << "}";
                    continue;
                }
                entries << ",\"type\":\"" << fd_type(link) << "\",\"path\":" << json_quote(*target) << "}";
            }

            data << (total > 0 ? "," : "") << "{\"pid\":" << pid << ",\"fd_count\":" << fds->size() << ",\"fds\":["
                 << entries.str() << "]}";
            ++total;
        }
        data << "],\"total_processes\":" << total << "}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_known_directories(const FileSystemOptions& options)
{
    const std::string subtype = "KNOWN_DIRECTORIES";
    return guarded_snapshot(subtype, [&]() {
        std::vector<std::string> directories = default_known_directories();
        if (!options.known_directories_file.empty()) {
            auto loaded = load_known_directories(options.known_directories_file);
            if (!loaded) {
                return make_failure(subtype, loaded.error());
            }
            directories = *loaded;
        }

        std::ostringstream data;
        data << "{\"directories\":[";
        for (size_t i = 0; i < directories.size(); ++i) {
            const std::string& dir = directories[i];
            std::vector<std::string> contents;
            if (!is_directory(dir)) {
                contents.emplace_back(kMissingDirectoryNote);
            } else {
                auto listing = list_directory(dir);
                if (listing) {
                    contents = *listing;
                    std::sort(contents.begin(), contents.end());
                } else {
                    contents.push_back("Error reading directory: " + listing.error().context());
                }
            }
            data << (i > 0 ? "," : "") << "{\"path\":" << json_quote(dir)
                 << ",\"contents\":" << json_string_array(contents) << "}";
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_file_systems()
{
    const std::string subtype = "FILE_SYSTEMS";
    return guarded_snapshot(subtype, [&]() {
        auto supported = read_file(kProcFilesystemsPath);
        if (!supported) {
            return make_failure(subtype, supported.error());
        }

        // fstab is often absent in containers; treat that as no entries.
        std::vector<MountEntry> fstab;
        const std::string fstab_path = env_or_default("HOSTSCOPE_FSTAB_PATH", kFstabPath);
        auto fstab_content = read_file(fstab_path);
        if (fstab_content) {
            fstab = parse_mount_table(*fstab_content);
        } else {
            logger().log(SLOG_DEBUG("fstab unavailable").field("path", fstab_path));
        }

        const auto types = parse_proc_filesystems(*supported);
        std::ostringstream data;
        data << "{\"filesystems\":[";
        for (size_t i = 0; i < types.size(); ++i) {
            const auto it = std::find_if(fstab.begin(), fstab.end(),
                                         [&](const MountEntry& e) { return e.type == types[i]; });
            const bool found = it != fstab.end();
            data << (i > 0 ? "," : "") << "{\"type\":" << json_quote(types[i])
                 << ",\"mount_point\":" << nullable(found ? &it->mount_point : nullptr)
                 << ",\"options\":" << nullable(found ? &it->options : nullptr) << "}";
        }
        data << "],\"total_filesystems\":" << types.size() << ",\"mounts\":[";

        auto mounts_content = read_file(kProcMountsPath);
        if (mounts_content) {
            const auto mounts = parse_mount_table(*mounts_content);
            for (size_t i = 0; i < mounts.size(); ++i) {
                const auto& m = mounts[i];
                data << (i > 0 ? "," : "") << "{\"device\":" << json_quote(m.device)
                     << ",\"mount_point\":" << json_quote(m.mount_point) << ",\"type\":" << json_quote(m.type)
                     << ",\"options\":" << json_quote(m.options) << "}";
            }
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
