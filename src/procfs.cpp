// cppcheck-suppress-file missingIncludeSystem
#include "procfs.hpp"

#include <dirent.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils.hpp"

namespace hostscope {

namespace {

std::string remap(const std::string& abs, const char* prefix, const char* env_name)
{
    const std::string pfx(prefix);
    if (abs.compare(0, pfx.size(), pfx) != 0) {
        return abs;
    }
    if (abs.size() > pfx.size() && abs[pfx.size()] != '/') {
        return abs;
    }
    const std::string root = env_or_default(env_name, "");
    if (root.empty()) {
        return abs;
    }
    std::filesystem::path p(root);
    p /= abs.substr(1);
    return p.string();
}

} // namespace

std::string proc_path(const std::string& abs)
{
    return remap(abs, "/proc", "HOSTSCOPE_PROC_ROOT");
}

std::string sys_path(const std::string& abs)
{
    return remap(abs, "/sys", "HOSTSCOPE_SYS_ROOT");
}

std::string host_path(const std::string& abs)
{
    if (abs.rfind("/proc", 0) == 0) {
        return proc_path(abs);
    }
    if (abs.rfind("/sys", 0) == 0) {
        return sys_path(abs);
    }
    return abs;
}

Result<std::string> read_file(const std::string& abs)
{
    const std::string path = host_path(abs);
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error::system(errno, "Failed to open file", path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return Error::system(errno != 0 ? errno : EIO, "Failed to read file", path);
    }
    return oss.str();
}

Result<std::vector<std::string>> read_lines(const std::string& abs)
{
    auto content = read_file(abs);
    if (!content) {
        return content.error();
    }
    return split_lines(*content);
}

Result<std::vector<std::string>> list_directory(const std::string& abs)
{
    const std::string path = host_path(abs);
    DIR* dir = ::opendir(path.c_str());
    if (dir == nullptr) {
        return Error::system(errno, "Failed to open directory", path);
    }
    std::vector<std::string> entries;
    while (struct dirent* ent = ::readdir(dir)) {
        if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) {
            continue;
        }
        entries.emplace_back(ent->d_name);
    }
    ::closedir(dir);
    return entries;
}

Result<std::string> read_link(const std::string& abs)
{
    const std::string path = host_path(abs);
    char buf[PATH_MAX] = {};
    ssize_t len = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len < 0) {
        return Error::system(errno, "Failed to read link", path);
    }
    return std::string(buf, static_cast<size_t>(len));
}

Result<std::vector<int>> list_pids(const std::string& dir)
{
    auto entries = list_directory(dir);
    if (!entries) {
        return entries.error();
    }
    std::vector<int> pids;
    for (const auto& name : *entries) {
        uint64_t pid = 0;
        if (!is_all_digits(name) || !parse_uint64(name, pid) || pid > INT_MAX) {
            continue;
        }
        pids.push_back(static_cast<int>(pid));
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

bool path_exists(const std::string& abs)
{
    struct stat st {};
    return ::stat(host_path(abs).c_str(), &st) == 0;
}

bool is_directory(const std::string& abs)
{
    struct stat st {};
    return ::stat(host_path(abs).c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string join_path(const std::string& dir, const std::string& name)
{
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

} // namespace hostscope
