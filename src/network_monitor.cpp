// cppcheck-suppress-file missingIncludeSystem
#include "network_monitor.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>

#include "command_runner.hpp"
#include "procfs.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

constexpr size_t kMinSocketColumns = 10;
constexpr size_t kMinArpColumns = 6;

bool parse_hex_byte(const std::string& hex, size_t offset, uint8_t& out)
{
    uint64_t v = 0;
    if (offset + 2 > hex.size() || !parse_hex_uint64(hex.substr(offset, 2), v)) {
        return false;
    }
    out = static_cast<uint8_t>(v);
    return true;
}

bool split_addr_port(const std::string& field, std::string& addr, uint32_t& port)
{
    const auto colon = field.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    uint64_t p = 0;
    if (!parse_hex_uint64(field.substr(colon + 1), p) || p > 0xffff) {
        return false;
    }
    addr = field.substr(0, colon);
    port = static_cast<uint32_t>(p);
    return true;
}

std::string socket_json(const SocketEntry& s)
{
    std::ostringstream out;
    out << "{\"local_ip\":" << json_quote(s.local_ip) << ",\"local_port\":" << s.local_port
        << ",\"remote_ip\":" << json_quote(s.remote_ip) << ",\"remote_port\":" << s.remote_port
        << ",\"state\":" << json_quote(s.state) << ",\"state_name\":" << json_quote(s.state_name)
        << ",\"uid\":" << json_quote(s.uid) << ",\"inode\":" << json_quote(s.inode) << "}";
    return out.str();
}

std::string nullable(const std::string& value)
{
    return value.empty() ? "null" : json_quote(value);
}

Envelope snapshot_socket_table(const std::string& path, bool ipv6, const std::string& protocol,
                               const std::string& subtype)
{
    return guarded_snapshot(subtype, [&]() {
        auto content = read_file(path);
        if (!content) {
            return make_failure(subtype, content.error());
        }
        const auto sockets = parse_socket_table(*content, ipv6);

        std::ostringstream data;
        data << "{\"protocol\":" << json_quote(protocol) << ",\"total\":" << sockets.size() << ",\"sockets\":[";
        for (size_t i = 0; i < sockets.size(); ++i) {
            data << (i > 0 ? "," : "") << socket_json(sockets[i]);
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

bool read_u64_file(const std::string& path, uint64_t& out)
{
    auto content = read_file(path);
    return content && parse_uint64(trim(*content), out);
}

} // namespace

Result<std::string> decode_ipv4_hex(const std::string& hex)
{
    if (hex.size() != 8) {
        return Error(ErrorCode::InvalidArguments, "IPv4 hex address must be 8 characters", hex);
    }
    std::array<uint8_t, 4> bytes{};
    for (size_t i = 0; i < 4; ++i) {
        if (!parse_hex_byte(hex, i * 2, bytes[i])) {
            return Error(ErrorCode::InvalidArguments, "Invalid IPv4 hex address", hex);
        }
    }
    // Kernel stores the address as a little-endian 32-bit word.
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", bytes[3], bytes[2], bytes[1], bytes[0]);
    return std::string(buf);
}

Result<std::string> decode_ipv6_hex(const std::string& hex)
{
    if (hex.size() != 32) {
        return Error(ErrorCode::InvalidArguments, "IPv6 hex address must be 32 characters", hex);
    }
    std::array<uint8_t, 16> bytes{};
    for (size_t chunk = 0; chunk < 4; ++chunk) {
        for (size_t b = 0; b < 4; ++b) {
            uint8_t v = 0;
            if (!parse_hex_byte(hex, chunk * 8 + b * 2, v)) {
                return Error(ErrorCode::InvalidArguments, "Invalid IPv6 hex address", hex);
            }
            bytes[chunk * 4 + (3 - b)] = v;
        }
    }

    std::array<uint16_t, 8> groups{};
    for (size_t g = 0; g < 8; ++g) {
        groups[g] = static_cast<uint16_t>((bytes[g * 2] << 8) | bytes[g * 2 + 1]);
    }

    // Longest run of zero groups; strict comparison keeps the leftmost on ties.
    int best_start = -1;
    int best_len = 0;
    for (int i = 0; i < 8;) {
        if (groups[static_cast<size_t>(i)] != 0) {
            ++i;
            continue;
        }
        int j = i;
        while (j < 8 && groups[static_cast<size_t>(j)] == 0) {
            ++j;
        }
        if (j - i > best_len) {
            best_start = i;
            best_len = j - i;
        }
        i = j;
    }

    auto join = [&](int from, int to) {
        std::string out;
        char buf[8];
        for (int i = from; i < to; ++i) {
            std::snprintf(buf, sizeof(buf), "%x", static_cast<unsigned int>(groups[static_cast<size_t>(i)]));
            if (i > from) {
                out += ":";
            }
            out += buf;
        }
        return out;
    };

    if (best_start < 0) {
        return join(0, 8);
    }
    return join(0, best_start) + "::" + join(best_start + best_len, 8);
}

const char* tcp_state_name(const std::string& hex_state)
{
    uint64_t st = 0;
    if (!parse_hex_uint64(hex_state, st)) {
        return "UNKNOWN";
    }
    switch (st) {
        case 0x01:
            return "ESTABLISHED";
        case 0x02:
            return "SYN_SENT";
        case 0x03:
            return "SYN_RECV";
        case 0x04:
            return "FIN_WAIT1";
        case 0x05:
            return "FIN_WAIT2";
        case 0x06:
            return "TIME_WAIT";
        case 0x07:
            return "CLOSE";
        case 0x08:
            return "CLOSE_WAIT";
        case 0x09:
            return "LAST_ACK";
        case 0x0A:
            return "LISTEN";
        case 0x0B:
            return "CLOSING";
        case 0x0C:
            return "NEW_SYN_RECV";
        default:
            return "UNKNOWN";
    }
}

std::vector<SocketEntry> parse_socket_table(const std::string& content, bool ipv6)
{
    std::vector<SocketEntry> sockets;
    std::istringstream in(content);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        const auto cols = split_whitespace(line);
        if (cols.size() < kMinSocketColumns) {
            continue;
        }

        std::string local_hex;
        std::string remote_hex;
        SocketEntry entry;
        if (!split_addr_port(cols[1], local_hex, entry.local_port) ||
            !split_addr_port(cols[2], remote_hex, entry.remote_port)) {
            continue;
        }
        auto local = ipv6 ? decode_ipv6_hex(local_hex) : decode_ipv4_hex(local_hex);
        auto remote = ipv6 ? decode_ipv6_hex(remote_hex) : decode_ipv4_hex(remote_hex);
        if (!local || !remote) {
            continue;
        }
        entry.local_ip = *local;
        entry.remote_ip = *remote;
        entry.state = cols[3];
        entry.state_name = tcp_state_name(cols[3]);
        entry.uid = cols[7];
        entry.inode = cols[9];
        sockets.push_back(std::move(entry));
    }
    return sockets;
}

std::vector<ArpEntry> parse_arp_table(const std::string& content)
{
    std::vector<ArpEntry> entries;
    std::istringstream in(content);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        const auto f = split_whitespace(line);
        if (f.size() < kMinArpColumns) {
            continue;
        }
        entries.push_back(ArpEntry{f[0], f[1], f[2], f[3], f[4], f[5]});
    }
    return entries;
}

std::vector<UnixSocketEntry> parse_unix_sockets(const std::string& content)
{
    std::vector<UnixSocketEntry> sockets;
    std::istringstream in(content);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        auto f = split_whitespace(line);
        if (f.empty()) {
            continue;
        }
        // Paths may contain spaces; fold everything after the inode into one column.
        if (f.size() > 8) {
            std::string path = f[7];
            for (size_t i = 8; i < f.size(); ++i) {
                path += " " + f[i];
            }
            f.resize(7);
            f.push_back(path);
        }
        sockets.push_back(UnixSocketEntry{std::move(f)});
    }
    return sockets;
}

std::vector<IptablesChain> parse_iptables_save(const std::string& content)
{
    std::vector<IptablesChain> chains;
    auto find_chain = [&](const std::string& name) -> IptablesChain* {
        for (auto& c : chains) {
            if (c.name == name) {
                return &c;
            }
        }
        return nullptr;
    };

    for (const auto& line : split_lines(content)) {
        if (line[0] == ':') {
            const auto f = split_whitespace(line.substr(1));
            if (f.empty()) {
                continue;
            }
            IptablesChain chain;
            chain.name = f[0];
            if (f.size() > 1 && f[1] != "-") {
                chain.policy = f[1];
            }
            chains.push_back(std::move(chain));
            continue;
        }
        if (line.rfind("-A ", 0) != 0) {
            continue;
        }

        const auto tokens = split_whitespace(line);
        if (tokens.size() < 2) {
            continue;
        }
        IptablesChain* chain = find_chain(tokens[1]);
        if (chain == nullptr) {
            chains.push_back(IptablesChain{tokens[1], "", {}});
            chain = &chains.back();
        }

        IptablesRule rule;
        bool negate = false;
        for (size_t i = 2; i < tokens.size(); ++i) {
            const std::string& tok = tokens[i];
            if (tok == "!") {
                negate = true;
                continue;
            }
            const bool has_value = i + 1 < tokens.size();
            auto take = [&]() {
                std::string v = tokens[++i];
                if (negate) {
                    v = "!" + v;
                }
                negate = false;
                return v;
            };
            if (!has_value) {
                negate = false;
                continue;
            }
            if (tok == "-s" || tok == "--source") {
                rule.src = take();
            } else if (tok == "-d" || tok == "--destination") {
                rule.dst = take();
            } else if (tok == "-p" || tok == "--protocol") {
                rule.protocol = take();
            } else if (tok == "-i" || tok == "--in-interface") {
                rule.in_interface = take();
            } else if (tok == "-o" || tok == "--out-interface") {
                rule.out_interface = take();
            } else if (tok == "-j" || tok == "--jump" || tok == "-g" || tok == "--goto") {
                rule.target = take();
            } else if (tok == "-m" || tok == "--match") {
                rule.matches.push_back(take());
            } else {
                negate = false;
            }
        }
        chain->rules.push_back(std::move(rule));
    }
    return chains;
}

Envelope snapshot_tcp_sockets()
{
    return snapshot_socket_table("/proc/net/tcp", false, "tcp", "TCP_SOCKETS_V4");
}

Envelope snapshot_udp_sockets()
{
    return snapshot_socket_table("/proc/net/udp", false, "udp", "UDP_SOCKETS_V4");
}

Envelope snapshot_tcp6_sockets()
{
    return snapshot_socket_table("/proc/net/tcp6", true, "tcp6", "TCP_SOCKETS_V6");
}

Envelope snapshot_udp6_sockets()
{
    return snapshot_socket_table("/proc/net/udp6", true, "udp6", "UDP_SOCKETS_V6");
}

Envelope snapshot_network_interfaces()
{
    const std::string subtype = "NETWORK_INTERFACES";
    return guarded_snapshot(subtype, [&]() {
        auto entries = list_directory(kSysClassNetDir);
        if (!entries) {
            return make_failure(subtype, entries.error());
        }
        std::vector<std::string> names = *entries;
        std::sort(names.begin(), names.end());

        std::ostringstream data;
        size_t total = 0;
        data << "{\"interfaces\":[";
        for (const auto& name : names) {
            const std::string dir = join_path(kSysClassNetDir, name);
            if (!is_directory(dir)) {
                continue;
            }
            uint64_t rx = 0;
            uint64_t tx = 0;
            uint64_t mtu = 0;
            const bool has_rx = read_u64_file(dir + "/statistics/rx_bytes", rx);
            const bool has_tx = read_u64_file(dir + "/statistics/tx_bytes", tx);
            const bool has_mtu = read_u64_file(dir + "/mtu", mtu);
            auto operstate = read_file(dir + "/operstate");
            auto address = read_file(dir + "/address");

            data << (total > 0 ? "," : "") << "{\"name\":" << json_quote(name)
                 << ",\"rx_bytes\":" << (has_rx ? std::to_string(rx) : "null")
                 << ",\"tx_bytes\":" << (has_tx ? std::to_string(tx) : "null")
                 << ",\"mtu\":" << (has_mtu ? std::to_string(mtu) : "null")
                 << ",\"operstate\":" << (operstate ? nullable(trim(*operstate)) : "null")
                 << ",\"address\":" << (address ? nullable(trim(*address)) : "null") << "}";
            ++total;
        }
        data << "],\"total_interfaces\":" << total << "}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_iptables_filter()
{
    const std::string subtype = "IPTABLES_FILTER";
    return guarded_snapshot(subtype, [&]() {
        if (!running_as_root()) {
            return make_failure(subtype, ErrorCode::IoFailure,
                                "Permission denied: reading the iptables filter table requires root privileges");
        }
        auto tool = find_executable(env_or_default("HOSTSCOPE_IPTABLES_SAVE", "iptables-save"));
        if (!tool) {
            return make_failure(subtype, tool.error());
        }
        auto output = run_command(*tool, {"-t", "filter"});
        if (!output) {
            return make_failure(subtype, output.error());
        }
        if (output->exit_code != 0) {
            return make_failure(subtype, ErrorCode::ExecutionFailure,
                                "iptables-save exited with status " + std::to_string(output->exit_code));
        }

        const auto chains = parse_iptables_save(output->stdout_text);
        std::ostringstream data;
        data << "{\"table\":\"filter\",\"chains\":[";
        for (size_t c = 0; c < chains.size(); ++c) {
            const auto& chain = chains[c];
            data << (c > 0 ? "," : "") << "{\"name\":" << json_quote(chain.name)
                 << ",\"policy\":" << nullable(chain.policy) << ",\"rules\":[";
            for (size_t r = 0; r < chain.rules.size(); ++r) {
                const auto& rule = chain.rules[r];
                data << (r > 0 ? "," : "") << "{\"src\":" << json_quote(rule.src) << ",\"dst\":" << json_quote(rule.dst)
                     << ",\"protocol\":" << json_quote(rule.protocol)
                     << ",\"in_interface\":" << nullable(rule.in_interface)
                     << ",\"out_interface\":" << nullable(rule.out_interface)
                     << ",\"target\":" << nullable(rule.target) << ",\"matches\":" << json_string_array(rule.matches)
                     << "}";
            }
            data << "]}";
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_unix_sockets()
{
    const std::string subtype = "UNIX_SOCKETS";
    return guarded_snapshot(subtype, [&]() {
        auto content = read_file("/proc/net/unix");
        if (!content) {
            return make_failure(subtype, content.error());
        }
        static const std::array<const char*, 8> kColumns = {"num",  "ref_count", "protocol", "flags",
                                                            "type", "state",     "inode",    "path"};
        const auto sockets = parse_unix_sockets(*content);

        std::ostringstream data;
        data << "{\"total\":" << sockets.size() << ",\"sockets\":[";
        for (size_t i = 0; i < sockets.size(); ++i) {
            data << (i > 0 ? "," : "") << "{";
            for (size_t c = 0; c < kColumns.size(); ++c) {
                data << (c > 0 ? "," : "") << "\"" << kColumns[c] << "\":";
                if (c < sockets[i].columns.size()) {
                    data << json_quote(sockets[i].columns[c]);
                } else {
                    data << "null";
                }
            }
            data << "}";
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

Envelope snapshot_arp_table()
{
    const std::string subtype = "ARP_TABLE";
    return guarded_snapshot(subtype, [&]() {
        auto content = read_file("/proc/net/arp");
        if (!content) {
            return make_failure(subtype, content.error());
        }
        const auto entries = parse_arp_table(*content);

        std::ostringstream data;
        data << "{\"total\":" << entries.size() << ",\"arp_entries\":[";
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& e = entries[i];
            data << (i > 0 ? "," : "") << "{\"ip_address\":" << json_quote(e.ip_address)
                 << ",\"hw_type\":" << json_quote(e.hw_type) << ",\"flags\":" << json_quote(e.flags)
                 << ",\"mac_address\":" << json_quote(e.mac_address) << ",\"mask\":" << json_quote(e.mask)
                 << ",\"device\":" << json_quote(e.device) << "}";
        }
        data << "]}";
        return make_success(subtype, data.str());
    });
}

} // namespace hostscope
