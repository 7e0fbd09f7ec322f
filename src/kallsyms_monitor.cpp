// cppcheck-suppress-file missingIncludeSystem
#include "kallsyms_monitor.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include "logging.hpp"
#include "procfs.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

Result<std::regex> compile_regex(const std::string& pattern, const char* which)
{
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return Error(ErrorCode::InvalidArguments, std::string("Invalid ") + which + " regex",
                     pattern + ": " + e.what());
    }
}

bool all_addresses_zero(const std::vector<KernelSymbol>& symbols)
{
    for (const auto& sym : symbols) {
        if (sym.address.find_first_not_of('0') != std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<SymbolQuery> compile_symbol_query(const KallsymsOptions& options)
{
    SymbolQuery query;
    query.max_symbols = options.max_symbols;
    if (!options.name_regex.empty()) {
        auto re = compile_regex(options.name_regex, "symbol filter");
        if (!re) {
            return re.error();
        }
        query.name_re = std::move(*re);
    }
    if (!options.module_regex.empty()) {
        auto re = compile_regex(options.module_regex, "module filter");
        if (!re) {
            return re.error();
        }
        query.module_re = std::move(*re);
    }
    return query;
}

std::optional<KernelSymbol> parse_kallsyms_line(const std::string& line)
{
    const auto parts = split_whitespace(line);
    if (parts.size() < 3) {
        return std::nullopt;
    }
    KernelSymbol sym;
    sym.address = parts[0];
    sym.type = parts[1];

    size_t name_end = parts.size();
    const std::string& last = parts.back();
    if (parts.size() > 3 && last.size() >= 2 && last.front() == '[' && last.back() == ']') {
        sym.module = last.substr(1, last.size() - 2);
        --name_end;
    }
    sym.name = parts[2];
    for (size_t i = 3; i < name_end; ++i) {
        sym.name += " " + parts[i];
    }
    return sym;
}

SymbolScan scan_kallsyms(std::istream& in, const SymbolQuery& query)
{
    SymbolScan scan;
    std::string line;
    while (std::getline(in, line)) {
        auto sym = parse_kallsyms_line(line);
        if (!sym) {
            continue;
        }
        if (query.name_re && !std::regex_search(sym->name, *query.name_re)) {
            continue;
        }
        if (query.module_re && !std::regex_search(sym->module.value_or(""), *query.module_re)) {
            continue;
        }
        ++scan.total_symbols;
        if (query.max_symbols == 0 || scan.symbols.size() < query.max_symbols) {
            scan.symbols.push_back(std::move(*sym));
        }
    }
    return scan;
}

Envelope snapshot_kallsyms(const KallsymsOptions& options)
{
    const std::string subtype = "KALLSYMS";
    return guarded_snapshot(subtype, [&]() {
        auto query = compile_symbol_query(options);
        if (!query) {
            return make_failure(subtype, query.error());
        }

        const std::string path = proc_path(kKallsymsPath);
        std::ifstream in(path);
        if (!in.is_open()) {
            return make_failure(subtype, Error::system(errno, "Failed to open kallsyms", path));
        }
        const auto scan = scan_kallsyms(in, *query);

        uint64_t kptr = 0;
        auto kptr_raw = read_file(kKptrRestrictPath);
        const bool has_kptr = kptr_raw && parse_uint64(trim(*kptr_raw), kptr);

        std::ostringstream data;
        data << "{\"total_symbols\":" << scan.total_symbols << ",\"returned_symbols\":" << scan.symbols.size()
             << ",\"kptr_restrict\":" << (has_kptr ? std::to_string(kptr) : "null")
             << ",\"addresses_redacted\":"
             << (!scan.symbols.empty() && all_addresses_zero(scan.symbols) ? "true" : "false") << ",\"symbols\":[";
        for (size_t i = 0; i < scan.symbols.size(); ++i) {
            const auto& s = scan.symbols[i];
            data << (i > 0 ? "," : "") << "{\"addr\":" << json_quote(s.address) << ",\"type\":" << json_quote(s.type)
                 << ",\"name\":" << json_quote(s.name)
                 << ",\"module\":" << (s.module ? json_quote(*s.module) : "null") << "}";
        }
        data << "]}";

        logger().log(SLOG_DEBUG("kallsyms snapshot collected")
                         .field("total_symbols", static_cast<uint64_t>(scan.total_symbols))
                         .field("returned_symbols", static_cast<uint64_t>(scan.symbols.size())));
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
