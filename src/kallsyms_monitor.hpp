// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

struct KernelSymbol {
    std::string address;
    std::string type;
    std::string name;
    std::optional<std::string> module; // nullopt for core kernel symbols
};

/// Compiled form of KallsymsOptions.
struct SymbolQuery {
    std::optional<std::regex> name_re;
    std::optional<std::regex> module_re;
    size_t max_symbols = 0; // 0 = unlimited
};

struct SymbolScan {
    size_t total_symbols = 0; // every symbol passing the filters
    std::vector<KernelSymbol> symbols; // at most max_symbols of them
};

// Fails with InvalidArguments when either regex does not compile.
Result<SymbolQuery> compile_symbol_query(const KallsymsOptions& options);

std::optional<KernelSymbol> parse_kallsyms_line(const std::string& line);

SymbolScan scan_kallsyms(std::istream& in, const SymbolQuery& query);

Envelope snapshot_kallsyms(const KallsymsOptions& options);

} // namespace hostscope
