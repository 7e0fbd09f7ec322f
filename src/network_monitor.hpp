// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "envelope.hpp"
#include "result.hpp"

namespace hostscope {

struct SocketEntry {
    std::string local_ip;
    uint32_t local_port = 0;
    std::string remote_ip;
    uint32_t remote_port = 0;
    std::string state;      // raw hex from the kernel table
    std::string state_name; // symbolic TCP state
    std::string uid;
    std::string inode;
};

struct ArpEntry {
    std::string ip_address;
    std::string hw_type;
    std::string flags;
    std::string mac_address;
    std::string mask;
    std::string device;
};

// Missing trailing columns are represented by an absent element.
struct UnixSocketEntry {
    std::vector<std::string> columns;
};

struct IptablesRule {
    std::string src = "0.0.0.0/0";
    std::string dst = "0.0.0.0/0";
    std::string protocol = "all";
    std::string in_interface;
    std::string out_interface;
    std::string target;
    std::vector<std::string> matches;
};

struct IptablesChain {
    std::string name;
    std::string policy; // empty for user-defined chains
    std::vector<IptablesRule> rules;
};

// Hex decoding of /proc/net/{tcp,udp}{,6} addresses.
Result<std::string> decode_ipv4_hex(const std::string& hex);
Result<std::string> decode_ipv6_hex(const std::string& hex);
const char* tcp_state_name(const std::string& hex_state);

// Parsers operate on the full file content including the header line.
std::vector<SocketEntry> parse_socket_table(const std::string& content, bool ipv6);
std::vector<ArpEntry> parse_arp_table(const std::string& content);
std::vector<UnixSocketEntry> parse_unix_sockets(const std::string& content);
std::vector<IptablesChain> parse_iptables_save(const std::string& content);

Envelope snapshot_tcp_sockets();
Envelope snapshot_udp_sockets();
Envelope snapshot_tcp6_sockets();
Envelope snapshot_udp6_sockets();
Envelope snapshot_network_interfaces();
Envelope snapshot_iptables_filter();
Envelope snapshot_unix_sockets();
Envelope snapshot_arp_table();

} // namespace hostscope
