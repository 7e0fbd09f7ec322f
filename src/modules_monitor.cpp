// cppcheck-suppress-file missingIncludeSystem
#include "modules_monitor.hpp"

#include <algorithm>
#include <sstream>

#include "procfs.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace hostscope {

std::vector<LoadedModule> parse_proc_modules(const std::string& content)
{
    std::vector<LoadedModule> modules;
    for (const auto& line : split_lines(content)) {
        const auto cols = split_whitespace(line);
        if (cols.size() < 4) {
            continue;
        }
        LoadedModule mod;
        mod.name = cols[0];
        if (!parse_uint64(cols[1], mod.size) || !parse_uint64(cols[2], mod.use_count)) {
            continue;
        }
        if (cols[3] != "-") {
            for (const auto& dep : split(cols[3], ',')) {
                const std::string name = trim(dep);
                if (!name.empty()) {
                    mod.used_by.push_back(name);
                }
            }
        }
        if (cols.size() > 4) {
            mod.state = cols[4];
        }
        if (cols.size() > 5) {
            mod.offset = cols[5];
        }
        modules.push_back(std::move(mod));
    }
    return modules;
}

SysfsModule classify_sysfs_module(const std::string& module_dir, const std::string& name)
{
    SysfsModule mod;
    mod.name = name;
    mod.path = module_dir;
    // Built-in modules only expose parameters; loadable ones carry refcount and init state.
    mod.loaded = path_exists(module_dir + "/refcnt") || path_exists(module_dir + "/initstate") ||
                 path_exists(module_dir + "/holders");
    return mod;
}

Envelope snapshot_loaded_modules()
{
    const std::string subtype = "LOADED_MODULES";
    return guarded_snapshot(subtype, [&]() {
        auto content = read_file(kProcModulesPath);
        if (!content) {
            return make_failure(subtype, content.error());
        }
        const auto modules = parse_proc_modules(*content);

        std::ostringstream data;
        data << "{\"total_modules\":" << modules.size() << ",\"modules\":[";
        for (size_t i = 0; i < modules.size(); ++i) {
            const auto& m = modules[i];
            data << (i > 0 ? "," : "") << "{\"name\":" << json_quote(m.name) << ",\"size\":" << m.size
                 << ",\"used_by_count\":" << m.use_count << ",\"used_by\":" << json_string_array(m.used_by)
                 << ",\"state\":" << json_quote(m.state)
                 << ",\"offset\":" << (m.offset.empty() ? "null" : json_quote(m.offset)) << "}";
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_module_tree()
{
    const std::string subtype = "MODULE_TREE";
    return guarded_snapshot(subtype, [&]() {
        auto entries = list_directory(kSysModuleDir);
        if (!entries) {
            return make_failure(subtype, entries.error());
        }
        std::vector<std::string> names = *entries;
        std::sort(names.begin(), names.end());

        std::ostringstream data;
        size_t total = 0;
        size_t builtin = 0;
        data << "{\"modules\":[";
        for (const auto& name : names) {
            const std::string dir = join_path(kSysModuleDir, name);
            if (!is_directory(dir)) {
                continue;
            }
            const auto mod = classify_sysfs_module(dir, name);
            if (!mod.loaded) {
                ++builtin;
            }
            data << (total > 0 ? "," : "") << "{\"name\":" << json_quote(mod.name)
                 << ",\"path\":" << json_quote(mod.path) << ",\"state\":\"" << (mod.loaded ? "loaded" : "builtin")
                 << "\"}";
            ++total;
        }
        data << "],\"total_modules\":" << total << ",\"builtin_modules\":" << builtin << "}";
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
