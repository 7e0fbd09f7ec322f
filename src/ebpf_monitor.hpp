// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hostscope {

struct BpfProgram {
    std::optional<uint64_t> id; // unset for kprobe-only entries
    std::string type;
    std::string name;
    std::string tag;
    std::string attach_type = "unknown";
};

/**
 * Programs found by one enumeration source.
 *
 * Sources in decreasing fidelity: "bpftool", "libbpf", "kprobes".
 */
struct EbpfInventory {
    std::string source;
    std::vector<BpfProgram> programs;
};

// Parse the output of `bpftool -j prog show`. Fails on malformed JSON.
Result<std::vector<BpfProgram>> parse_bpftool_programs(const std::string& json);

// Probed symbol names from debugfs kprobes/list and tracefs kprobe_events.
std::vector<std::string> parse_kprobe_list(const std::string& content);
std::vector<std::string> parse_kprobe_events(const std::string& content);

// Each source returns ToolNotAvailable when it cannot be used on this host.
Result<EbpfInventory> enumerate_via_bpftool();
Result<EbpfInventory> enumerate_via_libbpf();
Result<EbpfInventory> enumerate_via_kprobes();

std::string inventory_json(const EbpfInventory& inventory);

Envelope snapshot_loaded_ebpf(const EbpfOptions& options);

} // namespace hostscope
